#include "rowpool/codec/datum.hpp"
#include "rowpool/codec/row_codec.hpp"
#include "rowpool/tools/row_hex.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <stdexcept>
#include <vector>

using rowpool::tools::parse_hex;

TEST_CASE("Hex input parses in either case")
{
    const std::vector<std::byte> expected{std::byte{0x80}, std::byte{0x00}, std::byte{0xAB}, std::byte{0xcd}};
    CHECK(parse_hex("8000abcd") == expected);
    CHECK(parse_hex("8000ABCD") == expected);
    CHECK(parse_hex("").empty());
}

TEST_CASE("Whitespace between hex digits is ignored")
{
    const std::vector<std::byte> expected{std::byte{0x01}, std::byte{0x02}, std::byte{0xFF}};
    CHECK(parse_hex("01 02 ff") == expected);
    CHECK(parse_hex(" 0102\n\tff \n") == expected);
    CHECK(parse_hex("0 1 0 2 f f") == expected);
}

TEST_CASE("Odd digit counts are rejected")
{
    CHECK_THROWS_AS(parse_hex("abc"), std::invalid_argument);
    CHECK_THROWS_AS(parse_hex("01 0"), std::invalid_argument);
}

TEST_CASE("Non-hex characters are rejected")
{
    CHECK_THROWS_AS(parse_hex("0x01"), std::invalid_argument);
    CHECK_THROWS_AS(parse_hex("01,02"), std::invalid_argument);
    CHECK_THROWS_AS(parse_hex("zz"), std::invalid_argument);
}

TEST_CASE("Parsed hex decodes as a legacy row")
{
    // Nil-flag encoding of an empty legacy row.
    const auto bytes = parse_hex("00");
    std::vector<rowpool::codec::ColumnValue> decoded;
    REQUIRE_FALSE(rowpool::codec::decode_legacy_row(bytes, decoded));
    CHECK(decoded.empty());
}
