#pragma once

#include "rowpool/codec/datum.hpp"
#include "rowpool/codec/row_checksum.hpp"
#include "rowpool/kv/kv_types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace rowpool::codec {

constexpr std::uint8_t kCompactRowVersion = 0x80U;
constexpr std::uint8_t kCompactRowFlagChecksum = 0x01U;
constexpr std::size_t kCompactRowHeaderSize = 6U;
constexpr std::size_t kMaxRowColumns = 65535U;

constexpr std::uint8_t kLegacyNilFlag = 0x00U;
constexpr std::uint8_t kLegacyCompactBytesFlag = 0x02U;
constexpr std::uint8_t kLegacyIntFlag = 0x03U;
constexpr std::uint8_t kLegacyUintFlag = 0x04U;
constexpr std::uint8_t kLegacyFloatFlag = 0x05U;

struct RowEncoder final {
    // Selects the compact format; the legacy interleaved format is used otherwise.
    bool enabled = true;
    std::size_t max_value_length = 6U * 1024U * 1024U;
};

// Encodes `row` into `buffer`, which is cleared first and keeps its capacity. The legacy format
// stages `id, value` pairs in `scratch_values` when it holds at least 2 * row.size() datums;
// the encoder overwrites but never resizes it. `checksum` is only honoured by the compact
// format.
//
// A soft error (see is_soft_error) still leaves the complete row in `buffer`; a hard error
// leaves `buffer` empty.
std::error_code encode_row(const TimeZone& zone,
                           std::span<const ColumnValue> row,
                           std::vector<std::byte>& buffer,
                           std::span<Datum> scratch_values,
                           const RawChecksum* checksum,
                           const RowEncoder& encoder);

// Legacy format into `out` with no scratch reuse.
std::error_code encode_legacy_row(const TimeZone& zone,
                                  std::span<const ColumnValue> row,
                                  std::vector<std::byte>& out,
                                  std::size_t max_value_length = RowEncoder{}.max_value_length);

[[nodiscard]] bool is_compact_row(std::span<const std::byte> bytes) noexcept;

// Not-null columns come back in encoded order, followed by the null columns. When `handle` is
// given and the row carries a checksum, the checksum is verified against it.
std::error_code decode_row(std::span<const std::byte> bytes,
                           std::vector<ColumnValue>& out,
                           const kv::Handle* handle = nullptr);

// Legacy rows do not record value kinds beyond the datum flag: byte strings decode as strings
// and timestamps as signed UTC microseconds.
std::error_code decode_legacy_row(std::span<const std::byte> bytes, std::vector<ColumnValue>& out);

}  // namespace rowpool::codec
