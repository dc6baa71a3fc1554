#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace rowpool::table {

struct MutationBufferTelemetrySnapshot final {
    std::uint64_t encode_acquisitions = 0U;
    std::uint64_t check_acquisitions = 0U;
    std::uint64_t encode_reallocations = 0U;
    std::uint64_t check_reallocations = 0U;
    std::uint64_t scratch_reallocations = 0U;
    std::uint64_t rows_written = 0U;
    std::uint64_t flagged_writes = 0U;
    std::uint64_t encoded_bytes = 0U;
    std::uint64_t replication_log_rows = 0U;
    std::uint64_t encode_errors = 0U;
    std::uint64_t encode_errors_suppressed = 0U;
    std::uint64_t store_failures = 0U;
};

class MutationBufferTelemetry final {
public:
    void record_encode_acquire(bool reallocated) noexcept;
    void record_check_acquire(bool reallocated) noexcept;
    void record_scratch_reallocation() noexcept;
    void record_row_written(std::size_t encoded_bytes, bool flagged) noexcept;
    void record_replication_log_row() noexcept;
    void record_encode_error(bool suppressed) noexcept;
    void record_store_failure() noexcept;

    [[nodiscard]] MutationBufferTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    std::atomic<std::uint64_t> encode_acquisitions_{0U};
    std::atomic<std::uint64_t> check_acquisitions_{0U};
    std::atomic<std::uint64_t> encode_reallocations_{0U};
    std::atomic<std::uint64_t> check_reallocations_{0U};
    std::atomic<std::uint64_t> scratch_reallocations_{0U};
    std::atomic<std::uint64_t> rows_written_{0U};
    std::atomic<std::uint64_t> flagged_writes_{0U};
    std::atomic<std::uint64_t> encoded_bytes_{0U};
    std::atomic<std::uint64_t> replication_log_rows_{0U};
    std::atomic<std::uint64_t> encode_errors_{0U};
    std::atomic<std::uint64_t> encode_errors_suppressed_{0U};
    std::atomic<std::uint64_t> store_failures_{0U};
};

}  // namespace rowpool::table
