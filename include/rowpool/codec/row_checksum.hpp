#pragma once

#include "rowpool/kv/kv_types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace rowpool::codec {

constexpr std::uint32_t kCrc32cInit = 0xFFFFFFFFu;

std::uint32_t crc32c_extend(std::uint32_t state, std::span<const std::byte> data);
constexpr std::uint32_t crc32c_finalize(std::uint32_t state)
{
    return state ^ 0xFFFFFFFFu;
}
inline std::uint32_t crc32c(std::span<const std::byte> data)
{
    return crc32c_finalize(crc32c_extend(kCrc32cInit, data));
}

// Row-level checksum scoped to the row's handle, so that an encoded row copied under another
// key fails verification.
struct RawChecksum final {
    kv::Handle handle = kv::Handle::int_handle(0);

    [[nodiscard]] std::uint32_t compute(std::span<const std::byte> row) const;
};

}  // namespace rowpool::codec
