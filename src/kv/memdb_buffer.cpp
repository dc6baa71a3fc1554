#include "rowpool/kv/memdb_buffer.hpp"
#include "rowpool/kv/kv_errors.hpp"

#include <algorithm>

namespace rowpool::kv {

bool MemDbBuffer::KeyLess::operator()(std::span<const std::byte> lhs, std::span<const std::byte> rhs) const noexcept
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

bool MemDbBuffer::KeyLess::operator()(const Key& lhs, const Key& rhs) const noexcept
{
    return (*this)(std::span<const std::byte>{lhs}, std::span<const std::byte>{rhs});
}

bool MemDbBuffer::KeyLess::operator()(const Key& lhs, std::span<const std::byte> rhs) const noexcept
{
    return (*this)(std::span<const std::byte>{lhs}, rhs);
}

bool MemDbBuffer::KeyLess::operator()(std::span<const std::byte> lhs, const Key& rhs) const noexcept
{
    return (*this)(lhs, std::span<const std::byte>{rhs});
}

MemDbBuffer::MemDbBuffer()
    : MemDbBuffer(Config{})
{
}

MemDbBuffer::MemDbBuffer(Config config)
    : config_{config}
{
}

std::error_code MemDbBuffer::set(std::span<const std::byte> key, std::span<const std::byte> value)
{
    return write(key, value, KeyFlag::None);
}

std::error_code MemDbBuffer::set_with_flags(std::span<const std::byte> key,
                                            std::span<const std::byte> value,
                                            std::span<const KeyFlag> flags)
{
    auto combined = KeyFlag::None;
    for (const auto flag : flags) {
        combined = combined | flag;
    }
    return write(key, value, combined);
}

const MemDbBuffer::Entry* MemDbBuffer::get(std::span<const std::byte> key) const
{
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

KeyFlag MemDbBuffer::flags(std::span<const std::byte> key) const
{
    const auto* entry = get(key);
    return entry != nullptr ? entry->flags : KeyFlag::None;
}

std::size_t MemDbBuffer::len() const noexcept
{
    return entries_.size();
}

std::size_t MemDbBuffer::size() const noexcept
{
    return total_bytes_;
}

void MemDbBuffer::reset() noexcept
{
    entries_.clear();
    total_bytes_ = 0U;
}

std::error_code MemDbBuffer::write(std::span<const std::byte> key, std::span<const std::byte> value, KeyFlag flags)
{
    if (key.empty()) {
        return KvErrc::EmptyKey;
    }
    if (key.size() + value.size() > config_.entry_size_limit) {
        return KvErrc::EntryTooLarge;
    }

    auto it = entries_.find(key);
    const std::size_t previous_bytes = it != entries_.end() ? key.size() + it->second.value.size() : 0U;
    const std::size_t next_total = total_bytes_ - previous_bytes + key.size() + value.size();
    if (next_total > config_.total_size_limit) {
        return KvErrc::TxnTooLarge;
    }

    if (it == entries_.end()) {
        it = entries_.emplace(Key(key.begin(), key.end()), Entry{}).first;
    }
    it->second.value.assign(value.begin(), value.end());
    it->second.flags = it->second.flags | flags;
    total_bytes_ = next_total;
    return {};
}

}  // namespace rowpool::kv
