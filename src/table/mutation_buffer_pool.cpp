#include "rowpool/table/mutation_buffer_pool.hpp"

#include <stdexcept>
#include <utility>

namespace rowpool::table {

EncodeRowLease::EncodeRowLease(MutationBufferPool& pool) noexcept
    : pool_{&pool}
{}

EncodeRowLease::EncodeRowLease(EncodeRowLease&& other) noexcept
    : pool_{std::exchange(other.pool_, nullptr)}
{}

EncodeRowLease& EncodeRowLease::operator=(EncodeRowLease&& other) noexcept
{
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
    }
    return *this;
}

EncodeRowLease::~EncodeRowLease()
{
    release();
}

bool EncodeRowLease::active() const noexcept
{
    return pool_ != nullptr;
}

void EncodeRowLease::add_col_val(std::int64_t column_id, codec::Datum value)
{
    buffer().add_col_val(column_id, std::move(value));
}

std::span<const codec::ColumnValue> EncodeRowLease::columns() const
{
    return buffer().columns();
}

std::vector<std::byte> EncodeRowLease::encode_replication_log_row(const codec::TimeZone& zone,
                                                                  const errctx::ErrorContext& error_context,
                                                                  std::error_code& out_error) const
{
    return buffer().encode_replication_log_row(zone, error_context, out_error);
}

std::error_code EncodeRowLease::write_mem_buffer_encoded(const RowEncodingConfig& config,
                                                         const codec::TimeZone& zone,
                                                         const errctx::ErrorContext& error_context,
                                                         kv::MemBuffer& mem_buffer,
                                                         std::span<const std::byte> key,
                                                         const kv::Handle& handle,
                                                         std::span<const kv::KeyFlag> flags) &&
{
    // Hand the buffer back once the write returns or throws.
    EncodeRowLease consumed{std::move(*this)};
    auto& target = consumed.buffer();
    return target.write_mem_buffer_encoded(
        *consumed.pool_->stmt_buffers_, config, zone, error_context, mem_buffer, key, handle, flags);
}

void EncodeRowLease::release() noexcept
{
    if (pool_ != nullptr) {
        pool_->encode_in_use_ = false;
        pool_ = nullptr;
    }
}

EncodeRowBuffer& EncodeRowLease::buffer() const
{
    if (pool_ == nullptr) {
        throw std::logic_error{"EncodeRowLease used after it was released"};
    }
    return pool_->encode_row_;
}

CheckRowLease::CheckRowLease(MutationBufferPool& pool) noexcept
    : pool_{&pool}
{}

CheckRowLease::CheckRowLease(CheckRowLease&& other) noexcept
    : pool_{std::exchange(other.pool_, nullptr)}
{}

CheckRowLease& CheckRowLease::operator=(CheckRowLease&& other) noexcept
{
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
    }
    return *this;
}

CheckRowLease::~CheckRowLease()
{
    release();
}

bool CheckRowLease::active() const noexcept
{
    return pool_ != nullptr;
}

void CheckRowLease::add_col_val(codec::Datum value)
{
    buffer().add_col_val(std::move(value));
}

RowView CheckRowLease::row_to_check() const
{
    return buffer().row_to_check();
}

void CheckRowLease::release() noexcept
{
    if (pool_ != nullptr) {
        pool_->check_in_use_ = false;
        pool_ = nullptr;
    }
}

CheckRowBuffer& CheckRowLease::buffer() const
{
    if (pool_ == nullptr) {
        throw std::logic_error{"CheckRowLease used after it was released"};
    }
    return pool_->check_row_;
}

MutationBufferPool::MutationBufferPool(session::WriteStmtBuffers& stmt_buffers)
    : MutationBufferPool(stmt_buffers, Config{})
{
}

MutationBufferPool::MutationBufferPool(session::WriteStmtBuffers& stmt_buffers, Config config)
    : stmt_buffers_{&stmt_buffers}
    , config_{config}
    , encode_row_{config.telemetry}
{
}

EncodeRowLease MutationBufferPool::get_encode_row_buffer(std::size_t capacity)
{
    if (encode_in_use_) {
        throw std::logic_error{"MutationBufferPool encode buffer requested while a previous row is still staged"};
    }
    const bool reallocated = encode_row_.reset(capacity);
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_encode_acquire(reallocated);
    }
    encode_in_use_ = true;
    return EncodeRowLease{*this};
}

CheckRowLease MutationBufferPool::get_check_row_buffer(std::size_t capacity)
{
    if (check_in_use_) {
        throw std::logic_error{"MutationBufferPool check buffer requested while a previous row is still staged"};
    }
    const bool reallocated = check_row_.reset(capacity);
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_check_acquire(reallocated);
    }
    check_in_use_ = true;
    return CheckRowLease{*this};
}

session::WriteStmtBuffers& MutationBufferPool::write_stmt_buffers() const noexcept
{
    return *stmt_buffers_;
}

bool MutationBufferPool::encode_buffer_in_use() const noexcept
{
    return encode_in_use_;
}

bool MutationBufferPool::check_buffer_in_use() const noexcept
{
    return check_in_use_;
}

const EncodeRowBuffer& MutationBufferPool::encode_row_buffer() const noexcept
{
    return encode_row_;
}

const CheckRowBuffer& MutationBufferPool::check_row_buffer() const noexcept
{
    return check_row_;
}

}  // namespace rowpool::table
