#include "rowpool/codec/datum.hpp"
#include "rowpool/errctx/error_context.hpp"
#include "rowpool/kv/kv_types.hpp"
#include "rowpool/kv/memdb_buffer.hpp"
#include "rowpool/session/write_stmt_buffers.hpp"
#include "rowpool/table/mutation_buffer_pool.hpp"
#include "rowpool/table/mutation_buffer_telemetry.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

using rowpool::codec::Datum;
using rowpool::table::MutationBufferPool;
using rowpool::table::MutationBufferTelemetry;
using rowpool::table::RowEncodingConfig;

struct Workload final {
    std::size_t rounds = 5U;
    std::size_t rows = 50'000U;
    std::size_t columns = 8U;
    std::size_t payload_bytes = 32U;
};

// Pooled scenarios share one pool for the whole round; fresh builds a new pool per row.
struct Scenario final {
    const char* name;
    bool pooled;
    bool compact;
    bool checksum;
};

constexpr Scenario kScenarios[] = {
    {"pooled", true, true, false},
    {"pooled_legacy", true, false, false},
    {"pooled_checksum", true, true, true},
    {"fresh", false, true, false},
};

struct RoundResult final {
    double elapsed_ms = 0.0;
    std::uint64_t encode_reallocations = 0U;
    std::uint64_t scratch_reallocations = 0U;
};

void insert_row(MutationBufferPool& pool,
                const RowEncodingConfig& config,
                const Workload& workload,
                const std::string& payload,
                rowpool::kv::MemDbBuffer& store,
                std::int64_t row)
{
    auto lease = pool.get_encode_row_buffer(workload.columns);
    for (std::size_t column = 0; column < workload.columns; ++column) {
        const auto column_id = static_cast<std::int64_t>(column + 1U);
        lease.add_col_val(column_id, (column & 1U) == 0U ? Datum::from_int64(row * 31 + column_id) : Datum::from_string(payload));
    }

    const auto handle = rowpool::kv::Handle::int_handle(row);
    auto key = rowpool::kv::make_key("t_r_");
    const auto encoded = handle.encoded();
    key.insert(key.end(), encoded.begin(), encoded.end());

    if (auto ec = std::move(lease).write_mem_buffer_encoded(
            config, rowpool::codec::TimeZone::utc(), rowpool::errctx::ErrorContext{}, store, key, handle);
        ec) {
        throw std::system_error(ec, "row " + std::to_string(row));
    }
}

RoundResult run_round(const Scenario& scenario, const Workload& workload)
{
    RowEncodingConfig config{};
    config.encoder.enabled = scenario.compact;
    config.row_level_checksum_enabled = scenario.checksum;

    const std::string payload(workload.payload_bytes, 'p');
    rowpool::kv::MemDbBuffer store{rowpool::kv::MemDbBuffer::Config{.total_size_limit = static_cast<std::size_t>(-1)}};
    MutationBufferTelemetry telemetry;
    rowpool::session::WriteStmtBuffers stmt_buffers;
    MutationBufferPool pool{stmt_buffers, MutationBufferPool::Config{&telemetry}};

    const auto start = std::chrono::steady_clock::now();
    for (std::size_t row = 0; row < workload.rows; ++row) {
        if (scenario.pooled) {
            insert_row(pool, config, workload, payload, store, static_cast<std::int64_t>(row));
            continue;
        }
        rowpool::session::WriteStmtBuffers row_buffers;
        MutationBufferPool row_pool{row_buffers, MutationBufferPool::Config{&telemetry}};
        insert_row(row_pool, config, workload, payload, store, static_cast<std::int64_t>(row));
    }
    const auto finish = std::chrono::steady_clock::now();

    const auto snapshot = telemetry.snapshot();
    RoundResult result{};
    result.elapsed_ms = std::chrono::duration<double, std::milli>(finish - start).count();
    result.encode_reallocations = snapshot.encode_reallocations;
    result.scratch_reallocations = snapshot.scratch_reallocations;
    return result;
}

void report(const Scenario& scenario, const Workload& workload, const std::vector<RoundResult>& rounds)
{
    double total_ms = 0.0;
    double best_ms = rounds.front().elapsed_ms;
    for (const auto& round : rounds) {
        total_ms += round.elapsed_ms;
        best_ms = std::min(best_ms, round.elapsed_ms);
    }
    const double mean_ms = total_ms / static_cast<double>(rounds.size());
    const double rows_per_second = mean_ms > 0.0 ? static_cast<double>(workload.rows) * 1000.0 / mean_ms : 0.0;

    std::cout << std::left << std::setw(18) << scenario.name << std::right << std::fixed
              << std::setw(12) << std::setprecision(3) << mean_ms
              << std::setw(12) << best_ms
              << std::setw(14) << std::setprecision(0) << rows_per_second
              << std::setw(18) << rounds.back().encode_reallocations
              << std::setw(18) << rounds.back().scratch_reallocations << '\n'
              << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Insert throughput of pooled versus per-row mutation buffers"};

    Workload workload{};
    std::string only;
    app.add_option("--rounds", workload.rounds, "Measured rounds per scenario")->check(CLI::PositiveNumber);
    app.add_option("--rows", workload.rows, "Rows inserted per round")->check(CLI::PositiveNumber);
    app.add_option("--columns", workload.columns, "Columns per row")->check(CLI::Range(1, 4096));
    app.add_option("--payload-bytes", workload.payload_bytes, "Bytes per string column");
    app.add_option("--scenario", only, "Run a single scenario")
        ->check(CLI::IsMember({"pooled", "pooled_legacy", "pooled_checksum", "fresh"}));
    CLI11_PARSE(app, argc, argv);

    try {
        std::cout << std::left << std::setw(18) << "scenario" << std::right
                  << std::setw(12) << "mean ms"
                  << std::setw(12) << "best ms"
                  << std::setw(14) << "rows/s"
                  << std::setw(18) << "encode reallocs"
                  << std::setw(18) << "scratch reallocs" << '\n';
        for (const auto& scenario : kScenarios) {
            if (!only.empty() && only != scenario.name) {
                continue;
            }
            // One unmeasured round warms the allocator.
            static_cast<void>(run_round(scenario, workload));
            std::vector<RoundResult> rounds;
            rounds.reserve(workload.rounds);
            for (std::size_t round = 0; round < workload.rounds; ++round) {
                rounds.push_back(run_round(scenario, workload));
            }
            report(scenario, workload, rounds);
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Mutation buffer benchmark failed: " << ex.what() << '\n';
        return 1;
    }
}
