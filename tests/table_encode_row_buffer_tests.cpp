#include "rowpool/codec/codec_errors.hpp"
#include "rowpool/codec/datum.hpp"
#include "rowpool/codec/row_checksum.hpp"
#include "rowpool/codec/row_codec.hpp"
#include "rowpool/errctx/error_context.hpp"
#include "rowpool/kv/kv_errors.hpp"
#include "rowpool/kv/kv_types.hpp"
#include "rowpool/kv/mem_buffer.hpp"
#include "rowpool/session/write_stmt_buffers.hpp"
#include "rowpool/table/encode_row_buffer.hpp"
#include "rowpool/table/mutation_buffer_telemetry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>
#include <vector>

using rowpool::codec::CodecErrc;
using rowpool::codec::ColumnValue;
using rowpool::codec::Datum;
using rowpool::codec::TimeZone;
using rowpool::errctx::ErrorContext;
using rowpool::errctx::ErrorGroup;
using rowpool::errctx::ErrorLevel;
using rowpool::errctx::LevelMap;
using rowpool::errctx::WarningCollector;
using rowpool::kv::Handle;
using rowpool::kv::KeyFlag;
using rowpool::session::WriteStmtBuffers;
using rowpool::table::EncodeRowBuffer;
using rowpool::table::MutationBufferTelemetry;
using rowpool::table::RowEncodingConfig;

namespace {

class RecordingMemBuffer final : public rowpool::kv::MemBuffer {
public:
    struct Call final {
        std::string method{};
        rowpool::kv::Key key{};
        std::vector<std::byte> value{};
        std::vector<KeyFlag> flags{};
    };

    std::error_code set(std::span<const std::byte> key, std::span<const std::byte> value) override
    {
        calls.push_back(Call{"set", {key.begin(), key.end()}, {value.begin(), value.end()}, {}});
        return result;
    }

    std::error_code set_with_flags(std::span<const std::byte> key,
                                   std::span<const std::byte> value,
                                   std::span<const KeyFlag> flags) override
    {
        calls.push_back(Call{"set_with_flags", {key.begin(), key.end()}, {value.begin(), value.end()}, {flags.begin(), flags.end()}});
        return result;
    }

    std::vector<Call> calls{};
    std::error_code result{};
};

std::vector<std::byte> expected_encoding(const std::vector<ColumnValue>& row,
                                         const RowEncodingConfig& config = RowEncodingConfig{})
{
    std::vector<std::byte> buffer;
    std::vector<Datum> scratch(row.size() * 2U);
    const auto ec = rowpool::codec::encode_row(TimeZone::utc(), row, buffer, scratch, nullptr, config.encoder);
    REQUIRE_FALSE(ec);
    return buffer;
}

}  // namespace

TEST_CASE("EncodeRowBuffer writes the encoded row with a plain set when no flags are given")
{
    WriteStmtBuffers stmt_buffers;
    EncodeRowBuffer buffer;
    RecordingMemBuffer store;

    buffer.reset(3U);
    buffer.add_col_val(1, Datum::from_string("a"));
    buffer.add_col_val(2, Datum::from_string("b"));

    const auto key = rowpool::kv::make_key("t_r_1");
    const auto ec = buffer.write_mem_buffer_encoded(
        stmt_buffers, RowEncodingConfig{}, TimeZone::utc(), ErrorContext{}, store, key, Handle::int_handle(1));

    REQUIRE_FALSE(ec);
    REQUIRE(store.calls.size() == 1U);
    CHECK(store.calls[0].method == "set");
    CHECK(store.calls[0].key == key);
    CHECK(store.calls[0].value == expected_encoding({{1, Datum::from_string("a")}, {2, Datum::from_string("b")}}));
    CHECK(stmt_buffers.row_value_buffer == store.calls[0].value);
}

TEST_CASE("EncodeRowBuffer forwards flags through set_with_flags")
{
    WriteStmtBuffers stmt_buffers;
    EncodeRowBuffer buffer;
    RecordingMemBuffer store;

    buffer.reset(1U);
    buffer.add_col_val(5, Datum::from_int64(10));

    const std::array flags{KeyFlag::PresumeKeyNotExists};
    const auto key = rowpool::kv::make_key("t_r_5");
    REQUIRE_FALSE(buffer.write_mem_buffer_encoded(
        stmt_buffers, RowEncodingConfig{}, TimeZone::utc(), ErrorContext{}, store, key, Handle::int_handle(5), flags));

    REQUIRE(store.calls.size() == 1U);
    CHECK(store.calls[0].method == "set_with_flags");
    CHECK(store.calls[0].flags == std::vector<KeyFlag>{KeyFlag::PresumeKeyNotExists});
    CHECK(store.calls[0].value == expected_encoding({{5, Datum::from_int64(10)}}));
}

TEST_CASE("EncodeRowBuffer keeps ids and values positionally paired")
{
    WriteStmtBuffers stmt_buffers;
    EncodeRowBuffer buffer;
    RecordingMemBuffer store;

    buffer.reset(4U);
    buffer.add_col_val(9, Datum::from_int64(90));
    buffer.add_col_val(3, Datum::from_string("three"));
    buffer.add_col_val(7, Datum::from_uint64(70U));

    const std::vector<ColumnValue> expected{{9, Datum::from_int64(90)},
                                            {3, Datum::from_string("three")},
                                            {7, Datum::from_uint64(70U)}};
    CHECK(std::vector<ColumnValue>(buffer.columns().begin(), buffer.columns().end()) == expected);

    REQUIRE_FALSE(buffer.write_mem_buffer_encoded(stmt_buffers,
                                                  RowEncodingConfig{},
                                                  TimeZone::utc(),
                                                  ErrorContext{},
                                                  store,
                                                  rowpool::kv::make_key("k"),
                                                  Handle::int_handle(1)));

    std::vector<ColumnValue> decoded;
    REQUIRE_FALSE(rowpool::codec::decode_row(store.calls.at(0).value, decoded));
    CHECK(decoded == expected);
}

TEST_CASE("EncodeRowBuffer accepts duplicate column ids")
{
    WriteStmtBuffers stmt_buffers;
    EncodeRowBuffer buffer;
    RecordingMemBuffer store;

    buffer.reset(2U);
    buffer.add_col_val(1, Datum::from_string("a"));
    buffer.add_col_val(1, Datum::from_string("b"));
    CHECK(buffer.size() == 2U);

    CHECK_FALSE(buffer.write_mem_buffer_encoded(stmt_buffers,
                                                RowEncodingConfig{},
                                                TimeZone::utc(),
                                                ErrorContext{},
                                                store,
                                                rowpool::kv::make_key("k"),
                                                Handle::int_handle(1)));
    CHECK(store.calls.size() == 1U);
}

TEST_CASE("EncodeRowBuffer sizes the legacy staging area to twice the row length")
{
    WriteStmtBuffers stmt_buffers;
    EncodeRowBuffer buffer;
    RecordingMemBuffer store;
    RowEncodingConfig config{};
    config.encoder.enabled = false;

    const auto key = rowpool::kv::make_key("k");

    buffer.reset(3U);
    buffer.add_col_val(1, Datum::from_int64(11));
    buffer.add_col_val(2, Datum::from_int64(22));
    buffer.add_col_val(3, Datum::from_int64(33));
    REQUIRE_FALSE(buffer.write_mem_buffer_encoded(
        stmt_buffers, config, TimeZone::utc(), ErrorContext{}, store, key, Handle::int_handle(1)));
    REQUIRE(stmt_buffers.add_row_values.size() == 6U);
    CHECK(stmt_buffers.add_row_values[0] == Datum::from_int64(1));
    CHECK(stmt_buffers.add_row_values[5] == Datum::from_int64(33));

    // A row that skips NULL columns is shorter; the staging area follows it.
    buffer.reset(3U);
    buffer.add_col_val(2, Datum::from_int64(44));
    REQUIRE_FALSE(buffer.write_mem_buffer_encoded(
        stmt_buffers, config, TimeZone::utc(), ErrorContext{}, store, key, Handle::int_handle(2)));
    REQUIRE(stmt_buffers.add_row_values.size() == 2U);
    CHECK(stmt_buffers.add_row_values[0] == Datum::from_int64(2));
    CHECK(stmt_buffers.add_row_values[1] == Datum::from_int64(44));
    CHECK(stmt_buffers.add_row_values.capacity() >= 6U);

    std::vector<ColumnValue> decoded;
    REQUIRE_FALSE(rowpool::codec::decode_legacy_row(store.calls.at(1).value, decoded));
    CHECK(decoded == std::vector<ColumnValue>{{2, Datum::from_int64(44)}});
}

TEST_CASE("EncodeRowBuffer reuses the session row value allocation")
{
    WriteStmtBuffers stmt_buffers;
    stmt_buffers.row_value_buffer.reserve(4096U);
    const auto* storage = stmt_buffers.row_value_buffer.data();

    EncodeRowBuffer buffer;
    RecordingMemBuffer store;
    const auto key = rowpool::kv::make_key("k");

    for (std::int64_t row = 0; row < 3; ++row) {
        buffer.reset(2U);
        buffer.add_col_val(1, Datum::from_int64(row));
        buffer.add_col_val(2, Datum::from_string(std::string(static_cast<std::size_t>(row) * 10U, 'x')));
        REQUIRE_FALSE(buffer.write_mem_buffer_encoded(
            stmt_buffers, RowEncodingConfig{}, TimeZone::utc(), ErrorContext{}, store, key, Handle::int_handle(row)));
        CHECK(stmt_buffers.row_value_buffer.data() == storage);
    }
    CHECK(store.calls.size() == 3U);
}

TEST_CASE("EncodeRowBuffer binds a row checksum to the handle when enabled")
{
    WriteStmtBuffers stmt_buffers;
    EncodeRowBuffer buffer;
    RecordingMemBuffer store;
    RowEncodingConfig config{};
    config.row_level_checksum_enabled = true;

    buffer.reset(1U);
    buffer.add_col_val(1, Datum::from_string("checked"));
    const auto handle = Handle::int_handle(77);
    REQUIRE_FALSE(buffer.write_mem_buffer_encoded(
        stmt_buffers, config, TimeZone::utc(), ErrorContext{}, store, rowpool::kv::make_key("k"), handle));

    const auto& value = store.calls.at(0).value;
    std::vector<ColumnValue> decoded;
    CHECK_FALSE(rowpool::codec::decode_row(value, decoded, &handle));
    const auto other = Handle::int_handle(78);
    CHECK(rowpool::codec::decode_row(value, decoded, &other) == CodecErrc::ChecksumMismatch);
}

TEST_CASE("EncodeRowBuffer returns encoder errors without writing")
{
    WriteStmtBuffers stmt_buffers;
    MutationBufferTelemetry telemetry;
    EncodeRowBuffer buffer{&telemetry};
    RecordingMemBuffer store;
    RowEncodingConfig config{};
    config.encoder.max_value_length = 2U;

    buffer.reset(1U);
    buffer.add_col_val(1, Datum::from_string("abcd"));
    const auto ec = buffer.write_mem_buffer_encoded(
        stmt_buffers, config, TimeZone::utc(), ErrorContext{}, store, rowpool::kv::make_key("k"), Handle::int_handle(1));

    CHECK(ec == CodecErrc::ValueTruncated);
    CHECK(store.calls.empty());
    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.encode_errors == 1U);
    CHECK(snapshot.encode_errors_suppressed == 0U);
    CHECK(snapshot.rows_written == 0U);
}

TEST_CASE("EncodeRowBuffer writes the truncated row when truncation is downgraded to a warning")
{
    WriteStmtBuffers stmt_buffers;
    MutationBufferTelemetry telemetry;
    EncodeRowBuffer buffer{&telemetry};
    RecordingMemBuffer store;
    WarningCollector warnings;
    const ErrorContext context{LevelMap{ErrorLevel::Warn, ErrorLevel::Error}, &warnings};
    RowEncodingConfig config{};
    config.encoder.max_value_length = 2U;

    buffer.reset(1U);
    buffer.add_col_val(1, Datum::from_string("abcd"));
    REQUIRE_FALSE(buffer.write_mem_buffer_encoded(
        stmt_buffers, config, TimeZone::utc(), context, store, rowpool::kv::make_key("k"), Handle::int_handle(1)));

    REQUIRE(warnings.size() == 1U);
    CHECK(warnings.warnings()[0] == ErrorGroup::Truncate);
    REQUIRE(store.calls.size() == 1U);

    std::vector<ColumnValue> decoded;
    REQUIRE_FALSE(rowpool::codec::decode_row(store.calls[0].value, decoded));
    CHECK(decoded == std::vector<ColumnValue>{{1, Datum::from_string("ab")}});

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.encode_errors == 0U);
    CHECK(snapshot.encode_errors_suppressed == 1U);
    CHECK(snapshot.rows_written == 1U);
}

TEST_CASE("EncodeRowBuffer does not let the error context suppress hard errors")
{
    WriteStmtBuffers stmt_buffers;
    EncodeRowBuffer buffer;
    RecordingMemBuffer store;
    const ErrorContext context{LevelMap{ErrorLevel::Ignore, ErrorLevel::Ignore}, nullptr};

    buffer.reset(1U);
    buffer.add_col_val(-4, Datum::from_int64(1));
    const auto ec = buffer.write_mem_buffer_encoded(
        stmt_buffers, RowEncodingConfig{}, TimeZone::utc(), context, store, rowpool::kv::make_key("k"), Handle::int_handle(1));

    CHECK(ec == CodecErrc::ColumnIdOutOfRange);
    CHECK(store.calls.empty());
    CHECK(stmt_buffers.row_value_buffer.empty());
}

TEST_CASE("EncodeRowBuffer passes store errors through unchanged")
{
    WriteStmtBuffers stmt_buffers;
    MutationBufferTelemetry telemetry;
    EncodeRowBuffer buffer{&telemetry};
    RecordingMemBuffer store;
    store.result = rowpool::kv::KvErrc::TxnTooLarge;

    buffer.reset(1U);
    buffer.add_col_val(1, Datum::from_int64(1));
    const auto ec = buffer.write_mem_buffer_encoded(
        stmt_buffers, RowEncodingConfig{}, TimeZone::utc(), ErrorContext{}, store, rowpool::kv::make_key("k"), Handle::int_handle(1));

    CHECK(ec == rowpool::kv::KvErrc::TxnTooLarge);
    CHECK(store.calls.size() == 1U);
    CHECK(telemetry.snapshot().store_failures == 1U);
    CHECK(telemetry.snapshot().rows_written == 0U);
}

TEST_CASE("Replication log rows are independent of pooled storage")
{
    WriteStmtBuffers stmt_buffers;
    MutationBufferTelemetry telemetry;
    EncodeRowBuffer buffer{&telemetry};

    buffer.reset(2U);
    buffer.add_col_val(1, Datum::from_int64(5));
    buffer.add_col_val(2, Datum::from_string("binlog"));

    std::error_code ec;
    auto log_row = buffer.encode_replication_log_row(TimeZone::utc(), ErrorContext{}, ec);
    REQUIRE_FALSE(ec);

    std::vector<std::byte> expected;
    REQUIRE_FALSE(rowpool::codec::encode_legacy_row(TimeZone::utc(), buffer.columns(), expected));
    CHECK(log_row == expected);
    CHECK(telemetry.snapshot().replication_log_rows == 1U);

    // Later rows must not disturb the caller's copy.
    const auto saved = log_row;
    RecordingMemBuffer store;
    REQUIRE_FALSE(buffer.write_mem_buffer_encoded(
        stmt_buffers, RowEncodingConfig{}, TimeZone::utc(), ErrorContext{}, store, rowpool::kv::make_key("k"), Handle::int_handle(1)));
    buffer.reset(1U);
    buffer.add_col_val(3, Datum::from_int64(99));
    REQUIRE_FALSE(buffer.write_mem_buffer_encoded(
        stmt_buffers, RowEncodingConfig{}, TimeZone::utc(), ErrorContext{}, store, rowpool::kv::make_key("k"), Handle::int_handle(2)));
    CHECK(log_row == saved);

    // And mutating the caller's copy must not disturb the staged row.
    log_row.assign(4U, std::byte{0xFF});
    CHECK(std::vector<ColumnValue>(buffer.columns().begin(), buffer.columns().end())
          == std::vector<ColumnValue>{{3, Datum::from_int64(99)}});
}

TEST_CASE("Replication log encoding returns an empty row on error")
{
    MutationBufferTelemetry telemetry;
    EncodeRowBuffer buffer{&telemetry};
    buffer.reset(1U);
    buffer.add_col_val(-1, Datum::from_int64(5));

    std::error_code ec;
    const auto log_row = buffer.encode_replication_log_row(TimeZone::utc(), ErrorContext{}, ec);
    CHECK(ec == CodecErrc::ColumnIdOutOfRange);
    CHECK(log_row.empty());
    CHECK(telemetry.snapshot().encode_errors == 1U);
    CHECK(telemetry.snapshot().replication_log_rows == 0U);
}
