#pragma once

#include "rowpool/table/mutation_buffer_telemetry.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rowpool::tools {

struct MutationRunReport final {
    std::string label{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
    std::uint64_t rows_attempted = 0U;
    std::uint64_t mem_buffer_keys = 0U;
    std::uint64_t mem_buffer_bytes = 0U;
    std::uint64_t replication_log_bytes = 0U;
    std::vector<std::string> warnings{};
    table::MutationBufferTelemetrySnapshot telemetry{};
};

// One JSON object per report, suitable for line-oriented logs.
[[nodiscard]] std::string format_mutation_run_json(const MutationRunReport& report);

}  // namespace rowpool::tools
