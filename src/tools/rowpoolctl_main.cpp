#include "rowpool/codec/datum.hpp"
#include "rowpool/codec/row_codec.hpp"
#include "rowpool/errctx/error_context.hpp"
#include "rowpool/kv/kv_types.hpp"
#include "rowpool/kv/memdb_buffer.hpp"
#include "rowpool/session/write_stmt_buffers.hpp"
#include "rowpool/table/mutation_buffer_pool.hpp"
#include "rowpool/table/mutation_buffer_telemetry.hpp"
#include "rowpool/tools/row_hex.hpp"
#include "rowpool/tools/telemetry_json_formatter.hpp"

#include <CLI/CLI.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace codec = rowpool::codec;
namespace errctx = rowpool::errctx;
namespace kv = rowpool::kv;
namespace table = rowpool::table;

namespace {

struct BenchOptions final {
    std::size_t rows = 10'000U;
    std::size_t columns = 8U;
    std::size_t null_every = 0U;
    std::size_t payload_bytes = 16U;
    std::size_t max_value_length = codec::RowEncoder{}.max_value_length;
    std::int64_t utc_offset_seconds = 0;
    bool checksum = false;
    bool legacy = false;
    bool flags = false;
    bool replication_log = false;
    bool warn_truncate = false;
    std::string format = "json";
    std::string output_path{};
};

std::string format_bytes(std::uint64_t bytes)
{
    if (bytes == 0U) {
        return "0 B";
    }
    constexpr double kScale = 1024.0;
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    constexpr std::size_t kUnitCount = sizeof(units) / sizeof(units[0]);
    double value = static_cast<double>(bytes);
    std::size_t index = 0U;
    while (value >= kScale && index < kUnitCount - 1U) {
        value /= kScale;
        ++index;
    }
    std::ostringstream stream;
    const int precision = value < 10.0 ? 2 : 1;
    stream << std::fixed << std::setprecision(index == 0U ? 0 : precision) << value << ' ' << units[index];
    return stream.str();
}

codec::Datum make_column_value(std::size_t row, std::size_t column, const BenchOptions& options)
{
    if (options.null_every != 0U && (row + column) % options.null_every == 0U) {
        return codec::Datum::null();
    }
    switch (column % 3U) {
    case 0U:
        return codec::Datum::from_int64(static_cast<std::int64_t>(row * 131U + column));
    case 1U: {
        std::string payload(options.payload_bytes, 'a');
        for (std::size_t index = 0; index < payload.size(); ++index) {
            payload[index] = static_cast<char>('a' + (row + column + index) % 26U);
        }
        return codec::Datum::from_string(std::move(payload));
    }
    default:
        return codec::Datum::from_timestamp(codec::Timestamp{1'700'000'000'000'000LL + static_cast<std::int64_t>(row)});
    }
}

kv::Key make_record_key(std::size_t row)
{
    auto key = kv::make_key("t_r_");
    const auto handle = kv::Handle::int_handle(static_cast<std::int64_t>(row));
    const auto encoded = handle.encoded();
    key.insert(key.end(), encoded.begin(), encoded.end());
    return key;
}

rowpool::tools::MutationRunReport run_bench(const BenchOptions& options)
{
    rowpool::session::WriteStmtBuffers stmt_buffers;
    table::MutationBufferTelemetry telemetry;
    table::MutationBufferPool pool{stmt_buffers, table::MutationBufferPool::Config{&telemetry}};
    kv::MemDbBuffer mem_buffer;

    errctx::WarningCollector warnings;
    auto error_context = errctx::ErrorContext{errctx::LevelMap{errctx::ErrorLevel::Error, errctx::ErrorLevel::Error}, &warnings};
    if (options.warn_truncate) {
        error_context = error_context.with_level(errctx::ErrorGroup::Truncate, errctx::ErrorLevel::Warn);
    }

    table::RowEncodingConfig config{};
    config.row_level_checksum_enabled = options.checksum;
    config.encoder.enabled = !options.legacy;
    config.encoder.max_value_length = options.max_value_length;

    const codec::TimeZone zone{std::chrono::seconds{options.utc_offset_seconds}};
    const std::array<kv::KeyFlag, 1U> presume_flags{kv::KeyFlag::PresumeKeyNotExists};

    rowpool::tools::MutationRunReport report{};
    report.label = "bench";
    report.started_at = std::chrono::system_clock::now();

    for (std::size_t row = 0; row < options.rows; ++row) {
        std::vector<codec::Datum> values;
        values.reserve(options.columns);
        for (std::size_t column = 0; column < options.columns; ++column) {
            values.push_back(make_column_value(row, column, options));
        }

        {
            auto check = pool.get_check_row_buffer(options.columns);
            for (const auto& value : values) {
                check.add_col_val(value);
            }
            const auto view = check.row_to_check();
            if (view.column_count() != options.columns) {
                throw std::logic_error{"check row lost columns"};
            }
        }

        auto encode = pool.get_encode_row_buffer(options.columns);
        for (std::size_t column = 0; column < options.columns; ++column) {
            if (values[column].is_null()) {
                continue;
            }
            encode.add_col_val(static_cast<std::int64_t>(column + 1U), values[column]);
        }

        if (options.replication_log) {
            std::error_code ec;
            const auto log_row = encode.encode_replication_log_row(zone, error_context, ec);
            if (ec) {
                throw std::system_error(ec, "replication log encoding failed");
            }
            report.replication_log_bytes += log_row.size();
        }

        const auto key = make_record_key(row);
        const auto handle = kv::Handle::int_handle(static_cast<std::int64_t>(row));
        std::span<const kv::KeyFlag> flags{};
        if (options.flags) {
            flags = presume_flags;
        }
        ++report.rows_attempted;
        if (auto ec = std::move(encode).write_mem_buffer_encoded(config, zone, error_context, mem_buffer, key, handle, flags); ec) {
            throw std::system_error(ec, "row write failed");
        }
    }

    report.finished_at = std::chrono::system_clock::now();
    report.mem_buffer_keys = mem_buffer.len();
    report.mem_buffer_bytes = mem_buffer.size();
    for (const auto& warning : warnings.warnings()) {
        report.warnings.push_back(warning.message());
    }
    report.telemetry = telemetry.snapshot();
    return report;
}

void print_bench_text(std::ostream& out, const rowpool::tools::MutationRunReport& report)
{
    const auto& t = report.telemetry;
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(report.finished_at - report.started_at);
    out << "rows attempted      : " << report.rows_attempted << '\n'
        << "rows written        : " << t.rows_written << " (" << t.flagged_writes << " flagged)\n"
        << "encoded bytes       : " << format_bytes(t.encoded_bytes) << '\n'
        << "mem buffer          : " << report.mem_buffer_keys << " keys, " << format_bytes(report.mem_buffer_bytes) << '\n'
        << "encode acquisitions : " << t.encode_acquisitions << " (" << t.encode_reallocations << " reallocations)\n"
        << "check acquisitions  : " << t.check_acquisitions << " (" << t.check_reallocations << " reallocations)\n"
        << "scratch reallocs    : " << t.scratch_reallocations << '\n'
        << "replication log rows: " << t.replication_log_rows << " (" << format_bytes(report.replication_log_bytes) << ")\n"
        << "encode errors       : " << t.encode_errors << " returned, " << t.encode_errors_suppressed << " suppressed\n"
        << "store failures      : " << t.store_failures << '\n'
        << "warnings            : " << report.warnings.size() << '\n'
        << "elapsed             : " << elapsed.count() << " us" << '\n';
}

void write_output(const std::string& text, const std::optional<std::filesystem::path>& output_path)
{
    if (!output_path) {
        std::cout << text;
        return;
    }
    std::ofstream stream{*output_path, std::ios::out | std::ios::trunc};
    if (!stream) {
        throw std::runtime_error{"failed to open output file: " + output_path->string()};
    }
    stream << text;
}

void decode_hex_row(const std::string& hex, const std::optional<std::int64_t>& handle_value)
{
    const auto bytes = rowpool::tools::parse_hex(hex);
    std::vector<codec::ColumnValue> columns;
    std::error_code ec;
    const bool compact = codec::is_compact_row(bytes);
    if (compact) {
        std::optional<kv::Handle> handle;
        if (handle_value) {
            handle = kv::Handle::int_handle(*handle_value);
        }
        ec = codec::decode_row(bytes, columns, handle ? &*handle : nullptr);
    } else {
        ec = codec::decode_legacy_row(bytes, columns);
    }
    if (ec) {
        throw std::system_error(ec, "row decode failed");
    }

    std::cout << "format: " << (compact ? "compact" : "legacy") << '\n';
    for (const auto& column : columns) {
        std::cout << "  " << column.column_id << " [" << codec::datum_kind_name(column.value.kind()) << "] "
                  << codec::format_datum(column.value) << '\n';
    }
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Row mutation buffer pool tooling"};
    app.require_subcommand(1);

    BenchOptions bench_options{};
    auto* bench = app.add_subcommand("bench", "Drive a synthetic insert workload through one buffer pool");
    bench->add_option("--rows", bench_options.rows, "Rows to insert")->check(CLI::PositiveNumber);
    bench->add_option("--columns", bench_options.columns, "Columns per row")->check(CLI::Range(1, 65535));
    bench->add_option("--null-every", bench_options.null_every, "Make every Nth value NULL (0 disables)")
        ->check(CLI::NonNegativeNumber);
    bench->add_option("--payload-bytes", bench_options.payload_bytes, "Length of string column values")
        ->check(CLI::NonNegativeNumber);
    bench->add_option("--max-value-length", bench_options.max_value_length, "Encoder value length limit")
        ->check(CLI::PositiveNumber);
    bench->add_option("--utc-offset", bench_options.utc_offset_seconds, "Session time zone offset in seconds");
    bench->add_flag("--checksum", bench_options.checksum, "Enable row-level checksums");
    bench->add_flag("--legacy", bench_options.legacy, "Use the legacy row format");
    bench->add_flag("--flags", bench_options.flags, "Write rows with the PresumeKeyNotExists flag");
    bench->add_flag("--replication-log", bench_options.replication_log, "Also encode every row for the replication log");
    bench->add_flag("--warn-truncate", bench_options.warn_truncate, "Downgrade truncation errors to warnings");
    bench->add_option("-f,--format", bench_options.format, "Output format (json or text)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}));
    bench->add_option("-o,--output", bench_options.output_path, "Write output to a file instead of stdout");
    bench->callback([&]() {
        const auto report = run_bench(bench_options);
        std::optional<std::filesystem::path> output_path;
        if (!bench_options.output_path.empty()) {
            output_path = std::filesystem::path(bench_options.output_path);
        }
        if (bench_options.format == "text") {
            std::ostringstream stream;
            print_bench_text(stream, report);
            write_output(stream.str(), output_path);
        } else {
            write_output(rowpool::tools::format_mutation_run_json(report) + "\n", output_path);
        }
    });

    std::string decode_hex;
    std::optional<std::int64_t> decode_handle;
    auto* decode = app.add_subcommand("decode", "Decode one encoded row value");
    decode->add_option("--hex", decode_hex, "Encoded row as hex digits")->required();
    decode->add_option("--handle", decode_handle, "Integer handle used to verify the row checksum");
    decode->callback([&]() {
        decode_hex_row(decode_hex, decode_handle);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
