#pragma once

#include "rowpool/kv/kv_types.hpp"

#include <cstddef>
#include <span>
#include <system_error>

namespace rowpool::kv {

// Write side of a transaction's in-memory mutation buffer.
class MemBuffer {
public:
    virtual ~MemBuffer() = default;

    virtual std::error_code set(std::span<const std::byte> key, std::span<const std::byte> value) = 0;
    virtual std::error_code set_with_flags(std::span<const std::byte> key,
                                           std::span<const std::byte> value,
                                           std::span<const KeyFlag> flags) = 0;
};

}  // namespace rowpool::kv
