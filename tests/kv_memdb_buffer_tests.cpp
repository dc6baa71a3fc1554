#include "rowpool/kv/kv_errors.hpp"
#include "rowpool/kv/kv_types.hpp"
#include "rowpool/kv/memdb_buffer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <vector>

using rowpool::kv::Handle;
using rowpool::kv::KeyFlag;
using rowpool::kv::KvErrc;
using rowpool::kv::MemDbBuffer;

namespace {

std::vector<std::byte> value_of(std::size_t size, unsigned char fill)
{
    return std::vector<std::byte>(size, static_cast<std::byte>(fill));
}

}  // namespace

TEST_CASE("MemDbBuffer stores a copy of the value")
{
    MemDbBuffer buffer;
    const auto key = rowpool::kv::make_key("t_r_1");
    auto value = value_of(4U, 0xAB);

    REQUIRE_FALSE(buffer.set(key, value));
    value[0] = std::byte{0x00};

    const auto* entry = buffer.get(key);
    REQUIRE(entry != nullptr);
    CHECK(entry->value == value_of(4U, 0xAB));
    CHECK(entry->flags == KeyFlag::None);
    CHECK(buffer.len() == 1U);
    CHECK(buffer.size() == key.size() + 4U);
    CHECK(buffer.get(rowpool::kv::make_key("t_r_2")) == nullptr);
}

TEST_CASE("MemDbBuffer overwrites and accumulates flags")
{
    MemDbBuffer buffer;
    const auto key = rowpool::kv::make_key("k");
    const std::array first_flags{KeyFlag::PresumeKeyNotExists};
    const std::array second_flags{KeyFlag::NeedLocked, KeyFlag::AssertNotExist};

    REQUIRE_FALSE(buffer.set_with_flags(key, value_of(8U, 1U), first_flags));
    REQUIRE_FALSE(buffer.set_with_flags(key, value_of(2U, 2U), second_flags));
    REQUIRE_FALSE(buffer.set(key, value_of(3U, 3U)));

    const auto flags = buffer.flags(key);
    CHECK(rowpool::kv::has_flag(flags, KeyFlag::PresumeKeyNotExists));
    CHECK(rowpool::kv::has_flag(flags, KeyFlag::NeedLocked));
    CHECK(rowpool::kv::has_flag(flags, KeyFlag::AssertNotExist));
    CHECK_FALSE(rowpool::kv::has_flag(flags, KeyFlag::AssertExist));

    CHECK(buffer.get(key)->value == value_of(3U, 3U));
    CHECK(buffer.len() == 1U);
    CHECK(buffer.size() == key.size() + 3U);

    buffer.reset();
    CHECK(buffer.len() == 0U);
    CHECK(buffer.size() == 0U);
}

TEST_CASE("MemDbBuffer rejects empty keys and oversized writes")
{
    MemDbBuffer buffer{MemDbBuffer::Config{.entry_size_limit = 16U, .total_size_limit = 24U}};
    const auto key = rowpool::kv::make_key("key");

    CHECK(buffer.set({}, value_of(1U, 0U)) == KvErrc::EmptyKey);
    CHECK(buffer.set(key, value_of(14U, 0U)) == KvErrc::EntryTooLarge);
    REQUIRE_FALSE(buffer.set(key, value_of(13U, 0U)));
    CHECK(buffer.set(rowpool::kv::make_key("other"), value_of(8U, 0U)) == KvErrc::TxnTooLarge);
    CHECK(buffer.len() == 1U);

    // Replacing an entry only counts the new size against the total.
    CHECK_FALSE(buffer.set(key, value_of(12U, 0U)));
    CHECK(buffer.size() == 15U);
}

TEST_CASE("Integer handles preserve numeric order in their encoding")
{
    const auto negative = Handle::int_handle(-1);
    const auto zero = Handle::int_handle(0);
    const auto positive = Handle::int_handle(42);

    CHECK(negative.is_int());
    CHECK(positive.int_value() == 42);
    REQUIRE(zero.encoded().size() == 8U);
    CHECK(std::to_integer<unsigned>(zero.encoded()[0]) == 0x80U);

    const auto less = [](const Handle& lhs, const Handle& rhs) {
        const auto a = lhs.encoded();
        const auto b = rhs.encoded();
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
    };
    CHECK(less(negative, zero));
    CHECK(less(zero, positive));

    const auto common = Handle::common_handle(value_of(3U, 7U));
    CHECK_FALSE(common.is_int());
    CHECK(common.encoded().size() == 3U);
    CHECK(common == Handle::common_handle(value_of(3U, 7U)));
}
