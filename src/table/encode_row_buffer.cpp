#include "rowpool/table/encode_row_buffer.hpp"
#include "rowpool/table/mutation_buffer_telemetry.hpp"
#include "rowpool/table/reusable_slice.hpp"

#include <optional>
#include <utility>

namespace rowpool::table {

EncodeRowBuffer::EncodeRowBuffer(MutationBufferTelemetry* telemetry) noexcept
    : telemetry_{telemetry}
{}

bool EncodeRowBuffer::reset(std::size_t capacity)
{
    return ensure_capacity_and_reset(row_, 0U, capacity);
}

void EncodeRowBuffer::add_col_val(std::int64_t column_id, codec::Datum value)
{
    row_.push_back(codec::ColumnValue{column_id, std::move(value)});
}

std::span<const codec::ColumnValue> EncodeRowBuffer::columns() const noexcept
{
    return row_;
}

std::size_t EncodeRowBuffer::size() const noexcept
{
    return row_.size();
}

std::size_t EncodeRowBuffer::capacity() const noexcept
{
    return row_.capacity();
}

std::error_code EncodeRowBuffer::write_mem_buffer_encoded(session::WriteStmtBuffers& stmt_buffers,
                                                          const RowEncodingConfig& config,
                                                          const codec::TimeZone& zone,
                                                          const errctx::ErrorContext& error_context,
                                                          kv::MemBuffer& mem_buffer,
                                                          std::span<const std::byte> key,
                                                          const kv::Handle& handle,
                                                          std::span<const kv::KeyFlag> flags)
{
    std::optional<codec::RawChecksum> checksum;
    if (config.row_level_checksum_enabled) {
        checksum.emplace(codec::RawChecksum{handle});
    }

    // The legacy format stores `id1, val1, id2, val2, ...`, so the staging area needs exactly
    // twice the row length. Rows that skip NULL columns vary in length, hence the per-row resize.
    if (ensure_capacity_and_reset(stmt_buffers.add_row_values, row_.size() * 2U) && telemetry_ != nullptr) {
        telemetry_->record_scratch_reallocation();
    }

    const auto raw_error = codec::encode_row(zone,
                                             row_,
                                             stmt_buffers.row_value_buffer,
                                             stmt_buffers.add_row_values,
                                             checksum ? &*checksum : nullptr,
                                             config.encoder);
    if (auto ec = error_context.handle_error(raw_error); ec) {
        if (telemetry_ != nullptr) {
            telemetry_->record_encode_error(false);
        }
        return ec;
    }
    if (raw_error && telemetry_ != nullptr) {
        telemetry_->record_encode_error(true);
    }

    const std::span<const std::byte> encoded = stmt_buffers.row_value_buffer;
    const auto ec = flags.empty() ? mem_buffer.set(key, encoded) : mem_buffer.set_with_flags(key, encoded, flags);
    if (telemetry_ != nullptr) {
        if (ec) {
            telemetry_->record_store_failure();
        } else {
            telemetry_->record_row_written(encoded.size(), !flags.empty());
        }
    }
    return ec;
}

std::vector<std::byte> EncodeRowBuffer::encode_replication_log_row(const codec::TimeZone& zone,
                                                                   const errctx::ErrorContext& error_context,
                                                                   std::error_code& out_error) const
{
    std::vector<std::byte> log_row;
    const auto raw_error = codec::encode_legacy_row(zone, row_, log_row);
    out_error = error_context.handle_error(raw_error);
    if (out_error) {
        if (telemetry_ != nullptr) {
            telemetry_->record_encode_error(false);
        }
        return {};
    }
    if (telemetry_ != nullptr) {
        if (raw_error) {
            telemetry_->record_encode_error(true);
        }
        telemetry_->record_replication_log_row();
    }
    return log_row;
}

}  // namespace rowpool::table
