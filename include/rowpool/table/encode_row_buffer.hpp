#pragma once

#include "rowpool/codec/datum.hpp"
#include "rowpool/codec/row_codec.hpp"
#include "rowpool/errctx/error_context.hpp"
#include "rowpool/kv/kv_types.hpp"
#include "rowpool/kv/mem_buffer.hpp"
#include "rowpool/session/write_stmt_buffers.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace rowpool::table {

class MutationBufferTelemetry;

struct RowEncodingConfig final {
    bool row_level_checksum_enabled = false;
    codec::RowEncoder encoder{};
};

// Stages the (column id, value) pairs of one row for encoding. Pairs keep insertion order and
// duplicate ids are accepted; the encoder expects callers to supply distinct ids.
class EncodeRowBuffer final {
public:
    explicit EncodeRowBuffer(MutationBufferTelemetry* telemetry = nullptr) noexcept;

    // Returns true when the staging storage had to be reallocated.
    bool reset(std::size_t capacity);
    void add_col_val(std::int64_t column_id, codec::Datum value);

    [[nodiscard]] std::span<const codec::ColumnValue> columns() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;

    // Encodes the staged row with the session's scratch buffers and writes it to `mem_buffer`
    // under `key`. Uses `set_with_flags` only when `flags` is non-empty. Encoder errors go
    // through `error_context`; store errors are returned unchanged.
    std::error_code write_mem_buffer_encoded(session::WriteStmtBuffers& stmt_buffers,
                                             const RowEncodingConfig& config,
                                             const codec::TimeZone& zone,
                                             const errctx::ErrorContext& error_context,
                                             kv::MemBuffer& mem_buffer,
                                             std::span<const std::byte> key,
                                             const kv::Handle& handle,
                                             std::span<const kv::KeyFlag> flags = {});

    // Legacy-format encoding for the replication log. The row is a fresh allocation that never
    // aliases pooled storage; it is empty when `out_error` is set.
    [[nodiscard]] std::vector<std::byte> encode_replication_log_row(const codec::TimeZone& zone,
                                                                    const errctx::ErrorContext& error_context,
                                                                    std::error_code& out_error) const;

private:
    std::vector<codec::ColumnValue> row_{};
    MutationBufferTelemetry* telemetry_ = nullptr;
};

}  // namespace rowpool::table
