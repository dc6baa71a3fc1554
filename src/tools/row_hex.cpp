#include "rowpool/tools/row_hex.hpp"

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rowpool::tools {
namespace {

std::uint8_t hex_value(char ch)
{
    if (ch >= '0' && ch <= '9') {
        return static_cast<std::uint8_t>(ch - '0');
    }
    return static_cast<std::uint8_t>(std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10);
}

}  // namespace

std::vector<std::byte> parse_hex(std::string_view text)
{
    std::string digits;
    digits.reserve(text.size());
    for (const char ch : text) {
        if (std::isxdigit(static_cast<unsigned char>(ch)) != 0) {
            digits.push_back(ch);
        } else if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            throw std::invalid_argument{"hex input contains a non-hex character"};
        }
    }
    if (digits.size() % 2U != 0U) {
        throw std::invalid_argument{"hex input has an odd number of digits"};
    }

    std::vector<std::byte> bytes(digits.size() / 2U);
    for (std::size_t index = 0; index < bytes.size(); ++index) {
        const auto high = hex_value(digits[index * 2U]);
        const auto low = hex_value(digits[index * 2U + 1U]);
        bytes[index] = static_cast<std::byte>((high << 4U) | low);
    }
    return bytes;
}

}  // namespace rowpool::tools
