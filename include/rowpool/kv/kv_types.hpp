#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace rowpool::kv {

using Key = std::vector<std::byte>;

[[nodiscard]] Key make_key(std::string_view text);

enum class KeyFlag : std::uint16_t {
    None = 0,
    PresumeKeyNotExists = 1U << 0,
    NeedConstraintCheckInPrewrite = 1U << 1,
    AssertExist = 1U << 2,
    AssertNotExist = 1U << 3,
    NeedLocked = 1U << 4
};

constexpr KeyFlag operator|(KeyFlag lhs, KeyFlag rhs)
{
    return static_cast<KeyFlag>(static_cast<std::uint16_t>(lhs) | static_cast<std::uint16_t>(rhs));
}

constexpr KeyFlag operator&(KeyFlag lhs, KeyFlag rhs)
{
    return static_cast<KeyFlag>(static_cast<std::uint16_t>(lhs) & static_cast<std::uint16_t>(rhs));
}

constexpr bool any(KeyFlag flags)
{
    return static_cast<std::uint16_t>(flags) != 0U;
}

constexpr bool has_flag(KeyFlag flags, KeyFlag flag)
{
    return any(flags & flag);
}

// Identity of a row within its table. Integer handles encode as 8 big-endian bytes with the
// sign bit flipped so that the byte order matches the numeric order; common handles carry
// their already encoded clustered-key bytes.
class Handle final {
public:
    static Handle int_handle(std::int64_t value);
    static Handle common_handle(std::vector<std::byte> encoded);

    [[nodiscard]] bool is_int() const noexcept;
    [[nodiscard]] std::int64_t int_value() const noexcept;
    [[nodiscard]] std::span<const std::byte> encoded() const noexcept;

    friend bool operator==(const Handle&, const Handle&) = default;

private:
    Handle(bool is_int, std::int64_t int_value, std::vector<std::byte> encoded);

    bool is_int_ = true;
    std::int64_t int_value_ = 0;
    std::vector<std::byte> encoded_{};
};

}  // namespace rowpool::kv
