#include "rowpool/codec/datum.hpp"
#include "rowpool/table/check_row_buffer.hpp"
#include "rowpool/table/row_view.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

using rowpool::codec::Datum;
using rowpool::table::CheckRowBuffer;
using rowpool::table::RowView;

TEST_CASE("CheckRowBuffer exposes staged values in insertion order")
{
    CheckRowBuffer buffer;
    buffer.reset(2U);
    buffer.add_col_val(Datum::from_int64(1));
    buffer.add_col_val(Datum::from_string("two"));

    const auto row = buffer.row_to_check();
    REQUIRE(row.column_count() == 2U);
    CHECK(row.column(0U) == Datum::from_int64(1));
    CHECK(row.column(1U) == Datum::from_string("two"));
    CHECK(std::vector<Datum>(row.begin(), row.end())
          == std::vector<Datum>{Datum::from_int64(1), Datum::from_string("two")});
}

TEST_CASE("RowView values borrow the staged row without copying")
{
    CheckRowBuffer buffer;
    buffer.reset(2U);
    buffer.add_col_val(Datum::from_int64(1));
    buffer.add_col_val(Datum::null());

    const auto row = buffer.row_to_check();
    const auto values = row.values();
    REQUIRE(values.size() == 2U);
    CHECK(values[1].is_null());
    CHECK(&values[0] == &row.column(0U));

    // A later row reuses the same slots.
    buffer.reset(1U);
    buffer.add_col_val(Datum::from_string("again"));
    CHECK(buffer.row_to_check().values().data() == values.data());
    CHECK(buffer.row_to_check().values()[0] == Datum::from_string("again"));
}

TEST_CASE("CheckRowBuffer reset drops the previous row")
{
    CheckRowBuffer buffer;
    buffer.reset(4U);
    buffer.add_col_val(Datum::from_int64(1));
    buffer.add_col_val(Datum::from_int64(2));
    buffer.add_col_val(Datum::from_int64(3));

    buffer.reset(4U);
    CHECK(buffer.row_to_check().empty());
    buffer.add_col_val(Datum::from_int64(9));

    const auto row = buffer.row_to_check();
    REQUIRE(row.column_count() == 1U);
    CHECK(row.column(0U) == Datum::from_int64(9));
}

TEST_CASE("CheckRowBuffer keeps its capacity across smaller rows")
{
    CheckRowBuffer buffer;
    CHECK(buffer.reset(16U));
    const auto capacity = buffer.capacity();
    CHECK(capacity >= 16U);

    CHECK_FALSE(buffer.reset(2U));
    CHECK(buffer.capacity() == capacity);
    CHECK(buffer.size() == 0U);

    CHECK(buffer.reset(64U));
    CHECK(buffer.capacity() >= 64U);
}

TEST_CASE("RowView rejects out of range columns")
{
    CheckRowBuffer buffer;
    buffer.reset(1U);
    buffer.add_col_val(Datum::null());

    const auto row = buffer.row_to_check();
    CHECK(row.is_null(0U));
    CHECK_THROWS_AS(row.column(1U), std::out_of_range);
    CHECK_THROWS_AS(row.is_null(1U), std::out_of_range);

    const RowView empty{};
    CHECK(empty.empty());
    CHECK(empty.column_count() == 0U);
}
