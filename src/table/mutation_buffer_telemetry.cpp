#include "rowpool/table/mutation_buffer_telemetry.hpp"

namespace rowpool::table {

void MutationBufferTelemetry::record_encode_acquire(bool reallocated) noexcept
{
    encode_acquisitions_.fetch_add(1U, std::memory_order_relaxed);
    if (reallocated) {
        encode_reallocations_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void MutationBufferTelemetry::record_check_acquire(bool reallocated) noexcept
{
    check_acquisitions_.fetch_add(1U, std::memory_order_relaxed);
    if (reallocated) {
        check_reallocations_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void MutationBufferTelemetry::record_scratch_reallocation() noexcept
{
    scratch_reallocations_.fetch_add(1U, std::memory_order_relaxed);
}

void MutationBufferTelemetry::record_row_written(std::size_t encoded_bytes, bool flagged) noexcept
{
    rows_written_.fetch_add(1U, std::memory_order_relaxed);
    encoded_bytes_.fetch_add(static_cast<std::uint64_t>(encoded_bytes), std::memory_order_relaxed);
    if (flagged) {
        flagged_writes_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void MutationBufferTelemetry::record_replication_log_row() noexcept
{
    replication_log_rows_.fetch_add(1U, std::memory_order_relaxed);
}

void MutationBufferTelemetry::record_encode_error(bool suppressed) noexcept
{
    if (suppressed) {
        encode_errors_suppressed_.fetch_add(1U, std::memory_order_relaxed);
    } else {
        encode_errors_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void MutationBufferTelemetry::record_store_failure() noexcept
{
    store_failures_.fetch_add(1U, std::memory_order_relaxed);
}

MutationBufferTelemetrySnapshot MutationBufferTelemetry::snapshot() const noexcept
{
    MutationBufferTelemetrySnapshot snapshot{};
    snapshot.encode_acquisitions = encode_acquisitions_.load(std::memory_order_relaxed);
    snapshot.check_acquisitions = check_acquisitions_.load(std::memory_order_relaxed);
    snapshot.encode_reallocations = encode_reallocations_.load(std::memory_order_relaxed);
    snapshot.check_reallocations = check_reallocations_.load(std::memory_order_relaxed);
    snapshot.scratch_reallocations = scratch_reallocations_.load(std::memory_order_relaxed);
    snapshot.rows_written = rows_written_.load(std::memory_order_relaxed);
    snapshot.flagged_writes = flagged_writes_.load(std::memory_order_relaxed);
    snapshot.encoded_bytes = encoded_bytes_.load(std::memory_order_relaxed);
    snapshot.replication_log_rows = replication_log_rows_.load(std::memory_order_relaxed);
    snapshot.encode_errors = encode_errors_.load(std::memory_order_relaxed);
    snapshot.encode_errors_suppressed = encode_errors_suppressed_.load(std::memory_order_relaxed);
    snapshot.store_failures = store_failures_.load(std::memory_order_relaxed);
    return snapshot;
}

void MutationBufferTelemetry::reset() noexcept
{
    encode_acquisitions_.store(0U, std::memory_order_relaxed);
    check_acquisitions_.store(0U, std::memory_order_relaxed);
    encode_reallocations_.store(0U, std::memory_order_relaxed);
    check_reallocations_.store(0U, std::memory_order_relaxed);
    scratch_reallocations_.store(0U, std::memory_order_relaxed);
    rows_written_.store(0U, std::memory_order_relaxed);
    flagged_writes_.store(0U, std::memory_order_relaxed);
    encoded_bytes_.store(0U, std::memory_order_relaxed);
    replication_log_rows_.store(0U, std::memory_order_relaxed);
    encode_errors_.store(0U, std::memory_order_relaxed);
    encode_errors_suppressed_.store(0U, std::memory_order_relaxed);
    store_failures_.store(0U, std::memory_order_relaxed);
}

}  // namespace rowpool::table
