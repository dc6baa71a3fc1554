#pragma once

#include "rowpool/codec/datum.hpp"
#include "rowpool/errctx/error_context.hpp"
#include "rowpool/kv/kv_types.hpp"
#include "rowpool/kv/mem_buffer.hpp"
#include "rowpool/session/write_stmt_buffers.hpp"
#include "rowpool/table/check_row_buffer.hpp"
#include "rowpool/table/encode_row_buffer.hpp"
#include "rowpool/table/mutation_buffer_telemetry.hpp"
#include "rowpool/table/row_view.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace rowpool::table {

class MutationBufferPool;

// Exclusive use of the pool's encode buffer for one row. Usage:
//   1. MutationBufferPool::get_encode_row_buffer
//   2. add_col_val for every column
//   3. std::move(lease).write_mem_buffer_encoded(...), which ends the lease
// A lease that goes out of scope unconsumed hands the buffer back as well.
class EncodeRowLease final {
public:
    EncodeRowLease(const EncodeRowLease&) = delete;
    EncodeRowLease& operator=(const EncodeRowLease&) = delete;
    EncodeRowLease(EncodeRowLease&& other) noexcept;
    EncodeRowLease& operator=(EncodeRowLease&& other) noexcept;
    ~EncodeRowLease();

    [[nodiscard]] bool active() const noexcept;

    void add_col_val(std::int64_t column_id, codec::Datum value);
    [[nodiscard]] std::span<const codec::ColumnValue> columns() const;

    [[nodiscard]] std::vector<std::byte> encode_replication_log_row(const codec::TimeZone& zone,
                                                                    const errctx::ErrorContext& error_context,
                                                                    std::error_code& out_error) const;

    std::error_code write_mem_buffer_encoded(const RowEncodingConfig& config,
                                             const codec::TimeZone& zone,
                                             const errctx::ErrorContext& error_context,
                                             kv::MemBuffer& mem_buffer,
                                             std::span<const std::byte> key,
                                             const kv::Handle& handle,
                                             std::span<const kv::KeyFlag> flags = {}) &&;

    void release() noexcept;

private:
    friend class MutationBufferPool;

    explicit EncodeRowLease(MutationBufferPool& pool) noexcept;

    [[nodiscard]] EncodeRowBuffer& buffer() const;

    MutationBufferPool* pool_ = nullptr;
};

// Exclusive use of the pool's check buffer for one row. The row view it hands out is only valid
// while the lease is alive.
class CheckRowLease final {
public:
    CheckRowLease(const CheckRowLease&) = delete;
    CheckRowLease& operator=(const CheckRowLease&) = delete;
    CheckRowLease(CheckRowLease&& other) noexcept;
    CheckRowLease& operator=(CheckRowLease&& other) noexcept;
    ~CheckRowLease();

    [[nodiscard]] bool active() const noexcept;

    void add_col_val(codec::Datum value);
    [[nodiscard]] RowView row_to_check() const;

    void release() noexcept;

private:
    friend class MutationBufferPool;

    explicit CheckRowLease(MutationBufferPool& pool) noexcept;

    [[nodiscard]] CheckRowBuffer& buffer() const;

    MutationBufferPool* pool_ = nullptr;
};

// Reuses row staging memory across the AddRecord/UpdateRecord/RemoveRecord calls of one session.
// Each buffer can be leased by one caller at a time; asking for a buffer that is still leased
// throws std::logic_error instead of overwriting the in-flight row. Single-threaded, and leases
// must not outlive the pool.
class MutationBufferPool final {
public:
    struct Config final {
        MutationBufferTelemetry* telemetry = nullptr;
    };

    explicit MutationBufferPool(session::WriteStmtBuffers& stmt_buffers);
    MutationBufferPool(session::WriteStmtBuffers& stmt_buffers, Config config);

    MutationBufferPool(const MutationBufferPool&) = delete;
    MutationBufferPool& operator=(const MutationBufferPool&) = delete;

    [[nodiscard]] EncodeRowLease get_encode_row_buffer(std::size_t capacity);
    [[nodiscard]] CheckRowLease get_check_row_buffer(std::size_t capacity);

    [[nodiscard]] session::WriteStmtBuffers& write_stmt_buffers() const noexcept;

    [[nodiscard]] bool encode_buffer_in_use() const noexcept;
    [[nodiscard]] bool check_buffer_in_use() const noexcept;

    [[nodiscard]] const EncodeRowBuffer& encode_row_buffer() const noexcept;
    [[nodiscard]] const CheckRowBuffer& check_row_buffer() const noexcept;

private:
    friend class EncodeRowLease;
    friend class CheckRowLease;

    session::WriteStmtBuffers* stmt_buffers_ = nullptr;
    Config config_{};
    EncodeRowBuffer encode_row_;
    CheckRowBuffer check_row_{};
    bool encode_in_use_ = false;
    bool check_in_use_ = false;
};

}  // namespace rowpool::table
