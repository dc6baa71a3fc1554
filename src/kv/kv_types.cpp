#include "rowpool/kv/kv_types.hpp"

#include <utility>

namespace rowpool::kv {

namespace {

constexpr std::uint64_t kSignMask = 0x8000000000000000ULL;

std::vector<std::byte> encode_comparable_int(std::int64_t value)
{
    const auto bits = static_cast<std::uint64_t>(value) ^ kSignMask;
    std::vector<std::byte> encoded(sizeof(bits));
    for (std::size_t index = 0; index < sizeof(bits); ++index) {
        const auto shift = 8U * (sizeof(bits) - 1U - index);
        encoded[index] = static_cast<std::byte>((bits >> shift) & 0xFFU);
    }
    return encoded;
}

}  // namespace

Key make_key(std::string_view text)
{
    Key key(text.size());
    for (std::size_t index = 0; index < text.size(); ++index) {
        key[index] = static_cast<std::byte>(text[index]);
    }
    return key;
}

Handle::Handle(bool is_int, std::int64_t int_value, std::vector<std::byte> encoded)
    : is_int_{is_int}
    , int_value_{int_value}
    , encoded_{std::move(encoded)}
{}

Handle Handle::int_handle(std::int64_t value)
{
    return Handle{true, value, encode_comparable_int(value)};
}

Handle Handle::common_handle(std::vector<std::byte> encoded)
{
    return Handle{false, 0, std::move(encoded)};
}

bool Handle::is_int() const noexcept
{
    return is_int_;
}

std::int64_t Handle::int_value() const noexcept
{
    return int_value_;
}

std::span<const std::byte> Handle::encoded() const noexcept
{
    return encoded_;
}

}  // namespace rowpool::kv
