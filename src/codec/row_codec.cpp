#include "rowpool/codec/row_codec.hpp"
#include "rowpool/codec/codec_errors.hpp"

#include <algorithm>
#include <bit>
#include <chrono>
#include <limits>
#include <string>
#include <utility>

namespace rowpool::codec {

namespace {

constexpr std::uint64_t kSignMask = 0x8000000000000000ULL;
constexpr std::int64_t kMinTimestampMicros = -62'135'596'800LL * 1'000'000LL;
constexpr std::int64_t kMaxTimestampMicros = 253'402'300'799LL * 1'000'000LL + 999'999LL;
constexpr std::chrono::seconds kMaxZoneOffset{24 * 60 * 60};
constexpr std::int64_t kMaxColumnId = std::numeric_limits<std::uint32_t>::max();

void append_u8(std::vector<std::byte>& out, std::uint8_t value)
{
    out.push_back(static_cast<std::byte>(value));
}

template <typename T>
void append_le(std::vector<std::byte>& out, T value)
{
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        out.push_back(static_cast<std::byte>((value >> (8U * index)) & 0xFFU));
    }
}

template <typename T>
void store_le(std::byte* destination, T value)
{
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        destination[index] = static_cast<std::byte>((value >> (8U * index)) & 0xFFU);
    }
}

void append_u64_be(std::vector<std::byte>& out, std::uint64_t value)
{
    for (std::size_t index = 0; index < sizeof(value); ++index) {
        const auto shift = 8U * (sizeof(value) - 1U - index);
        out.push_back(static_cast<std::byte>((value >> shift) & 0xFFU));
    }
}

void append_uvarint(std::vector<std::byte>& out, std::uint64_t value)
{
    while (value >= 0x80U) {
        out.push_back(static_cast<std::byte>((value & 0x7FU) | 0x80U));
        value >>= 7U;
    }
    out.push_back(static_cast<std::byte>(value));
}

void append_raw(std::vector<std::byte>& out, const void* data, std::size_t size)
{
    const auto* bytes = static_cast<const std::byte*>(data);
    out.insert(out.end(), bytes, bytes + size);
}

template <typename T>
[[nodiscard]] T load_le(std::span<const std::byte> bytes)
{
    T value = 0;
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        value |= static_cast<T>(std::to_integer<std::uint8_t>(bytes[index])) << (8U * index);
    }
    return value;
}

[[nodiscard]] std::uint64_t load_u64_be(std::span<const std::byte> bytes)
{
    std::uint64_t value = 0U;
    for (std::size_t index = 0; index < sizeof(value); ++index) {
        value = (value << 8U) | std::to_integer<std::uint8_t>(bytes[index]);
    }
    return value;
}

void remember(std::error_code& first, std::error_code error)
{
    if (!first) {
        first = error;
    }
}

std::error_code validate_row(std::span<const ColumnValue> row)
{
    if (row.size() > kMaxRowColumns) {
        return CodecErrc::TooManyColumns;
    }
    for (const auto& column : row) {
        if (column.column_id < 0 || column.column_id > kMaxColumnId) {
            return CodecErrc::ColumnIdOutOfRange;
        }
    }
    return {};
}

std::int64_t to_utc_micros(Timestamp value, const TimeZone& zone, std::error_code& soft_error)
{
    if (zone.utc_offset > kMaxZoneOffset || zone.utc_offset < -kMaxZoneOffset) {
        remember(soft_error, CodecErrc::TimestampOverflow);
        return 0;
    }
    const auto offset = std::chrono::duration_cast<std::chrono::microseconds>(zone.utc_offset).count();
    if (value.micros < kMinTimestampMicros + offset || value.micros > kMaxTimestampMicros + offset) {
        remember(soft_error, CodecErrc::TimestampOverflow);
        return 0;
    }
    return value.micros - offset;
}

std::size_t clamp_length(std::size_t length, std::size_t limit, std::error_code& soft_error)
{
    if (length > limit) {
        remember(soft_error, CodecErrc::ValueTruncated);
        return limit;
    }
    return length;
}

// Compact value payload: one kind byte followed by the little-endian or raw value.
void append_compact_value(std::vector<std::byte>& out,
                          const Datum& value,
                          const TimeZone& zone,
                          std::size_t max_value_length,
                          std::error_code& soft_error)
{
    append_u8(out, static_cast<std::uint8_t>(value.kind()));
    switch (value.kind()) {
    case DatumKind::Int64:
        append_le(out, static_cast<std::uint64_t>(value.as_int64()));
        break;
    case DatumKind::Uint64:
        append_le(out, value.as_uint64());
        break;
    case DatumKind::Float64:
        append_le(out, std::bit_cast<std::uint64_t>(value.as_float64()));
        break;
    case DatumKind::String: {
        const auto& text = value.as_string();
        append_raw(out, text.data(), clamp_length(text.size(), max_value_length, soft_error));
        break;
    }
    case DatumKind::Bytes: {
        const auto& bytes = value.as_bytes();
        append_raw(out, bytes.data(), clamp_length(bytes.size(), max_value_length, soft_error));
        break;
    }
    case DatumKind::Timestamp:
        append_le(out, static_cast<std::uint64_t>(to_utc_micros(value.as_timestamp(), zone, soft_error)));
        break;
    case DatumKind::Null:
    default:
        break;
    }
}

std::error_code encode_compact(const TimeZone& zone,
                               std::span<const ColumnValue> row,
                               std::vector<std::byte>& buffer,
                               const RawChecksum* checksum,
                               std::size_t max_value_length)
{
    const auto not_null_count = static_cast<std::size_t>(
        std::count_if(row.begin(), row.end(), [](const ColumnValue& column) { return !column.value.is_null(); }));
    const auto null_count = row.size() - not_null_count;

    append_u8(buffer, kCompactRowVersion);
    append_u8(buffer, checksum != nullptr ? kCompactRowFlagChecksum : 0U);
    append_le(buffer, static_cast<std::uint16_t>(not_null_count));
    append_le(buffer, static_cast<std::uint16_t>(null_count));

    for (const auto& column : row) {
        if (!column.value.is_null()) {
            append_le(buffer, static_cast<std::uint32_t>(column.column_id));
        }
    }
    for (const auto& column : row) {
        if (column.value.is_null()) {
            append_le(buffer, static_cast<std::uint32_t>(column.column_id));
        }
    }

    const std::size_t offsets_begin = buffer.size();
    buffer.resize(buffer.size() + not_null_count * sizeof(std::uint32_t));
    const std::size_t data_begin = buffer.size();

    std::error_code soft_error{};
    std::size_t slot = 0U;
    for (const auto& column : row) {
        if (column.value.is_null()) {
            continue;
        }
        append_compact_value(buffer, column.value, zone, max_value_length, soft_error);
        const auto end_offset = buffer.size() - data_begin;
        if (end_offset > std::numeric_limits<std::uint32_t>::max()) {
            buffer.clear();
            return CodecErrc::RowTooLarge;
        }
        store_le(buffer.data() + offsets_begin + slot * sizeof(std::uint32_t), static_cast<std::uint32_t>(end_offset));
        ++slot;
    }

    if (checksum != nullptr) {
        append_le(buffer, checksum->compute(buffer));
    }
    return soft_error;
}

// Fills `staging` with the interleaved id, value pairs the legacy format stores.
void stage_legacy_pairs(const TimeZone& zone,
                        std::span<const ColumnValue> row,
                        std::span<Datum> staging,
                        std::size_t max_value_length,
                        std::error_code& soft_error)
{
    for (std::size_t index = 0; index < row.size(); ++index) {
        const auto& column = row[index];
        staging[2U * index] = Datum::from_int64(column.column_id);

        auto& slot = staging[2U * index + 1U];
        switch (column.value.kind()) {
        case DatumKind::Timestamp:
            slot = Datum::from_int64(to_utc_micros(column.value.as_timestamp(), zone, soft_error));
            break;
        case DatumKind::String: {
            const auto& text = column.value.as_string();
            slot = Datum::from_string(text.substr(0U, clamp_length(text.size(), max_value_length, soft_error)));
            break;
        }
        case DatumKind::Bytes: {
            const auto& bytes = column.value.as_bytes();
            const auto length = clamp_length(bytes.size(), max_value_length, soft_error);
            slot = Datum::from_bytes(std::vector<std::byte>(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(length)));
            break;
        }
        default:
            slot = column.value;
            break;
        }
    }
}

void append_legacy_datum(std::vector<std::byte>& out, const Datum& value)
{
    switch (value.kind()) {
    case DatumKind::Null:
        append_u8(out, kLegacyNilFlag);
        break;
    case DatumKind::Int64:
        append_u8(out, kLegacyIntFlag);
        append_u64_be(out, static_cast<std::uint64_t>(value.as_int64()) ^ kSignMask);
        break;
    case DatumKind::Uint64:
        append_u8(out, kLegacyUintFlag);
        append_u64_be(out, value.as_uint64());
        break;
    case DatumKind::Float64: {
        auto bits = std::bit_cast<std::uint64_t>(value.as_float64());
        bits = (bits & kSignMask) == 0U ? bits | kSignMask : ~bits;
        append_u8(out, kLegacyFloatFlag);
        append_u64_be(out, bits);
        break;
    }
    case DatumKind::String: {
        const auto& text = value.as_string();
        append_u8(out, kLegacyCompactBytesFlag);
        append_uvarint(out, text.size());
        append_raw(out, text.data(), text.size());
        break;
    }
    case DatumKind::Bytes: {
        const auto& bytes = value.as_bytes();
        append_u8(out, kLegacyCompactBytesFlag);
        append_uvarint(out, bytes.size());
        append_raw(out, bytes.data(), bytes.size());
        break;
    }
    case DatumKind::Timestamp:
        append_u8(out, kLegacyIntFlag);
        append_u64_be(out, static_cast<std::uint64_t>(value.as_timestamp().micros) ^ kSignMask);
        break;
    default:
        break;
    }
}

std::error_code encode_legacy(const TimeZone& zone,
                              std::span<const ColumnValue> row,
                              std::vector<std::byte>& out,
                              std::span<Datum> scratch_values,
                              std::size_t max_value_length)
{
    if (row.empty()) {
        append_u8(out, kLegacyNilFlag);
        return {};
    }

    std::vector<Datum> local_staging;
    auto staging = scratch_values;
    if (staging.size() < 2U * row.size()) {
        local_staging.resize(2U * row.size());
        staging = local_staging;
    }

    std::error_code soft_error{};
    stage_legacy_pairs(zone, row, staging, max_value_length, soft_error);
    for (std::size_t index = 0; index < 2U * row.size(); ++index) {
        append_legacy_datum(out, staging[index]);
    }
    return soft_error;
}

class ByteReader final {
public:
    explicit ByteReader(std::span<const std::byte> bytes) noexcept
        : bytes_{bytes}
    {}

    [[nodiscard]] bool has(std::size_t count) const noexcept
    {
        return bytes_.size() - offset_ >= count;
    }

    [[nodiscard]] bool exhausted() const noexcept
    {
        return offset_ == bytes_.size();
    }

    std::span<const std::byte> take(std::size_t count) noexcept
    {
        auto slice = bytes_.subspan(offset_, count);
        offset_ += count;
        return slice;
    }

    bool read_uvarint(std::uint64_t& value) noexcept
    {
        value = 0U;
        for (unsigned shift = 0U; shift < 64U; shift += 7U) {
            if (!has(1U)) {
                return false;
            }
            const auto byte = std::to_integer<std::uint8_t>(take(1U)[0]);
            value |= static_cast<std::uint64_t>(byte & 0x7FU) << shift;
            if ((byte & 0x80U) == 0U) {
                return true;
            }
        }
        return false;
    }

private:
    std::span<const std::byte> bytes_{};
    std::size_t offset_ = 0U;
};

std::error_code decode_compact_value(std::span<const std::byte> payload, Datum& out)
{
    if (payload.empty()) {
        return CodecErrc::CorruptRow;
    }
    const auto kind = static_cast<DatumKind>(std::to_integer<std::uint8_t>(payload[0]));
    const auto body = payload.subspan(1U);

    const auto require_fixed = [&]() { return body.size() == sizeof(std::uint64_t); };

    switch (kind) {
    case DatumKind::Int64:
        if (!require_fixed()) {
            return CodecErrc::CorruptRow;
        }
        out = Datum::from_int64(static_cast<std::int64_t>(load_le<std::uint64_t>(body)));
        return {};
    case DatumKind::Uint64:
        if (!require_fixed()) {
            return CodecErrc::CorruptRow;
        }
        out = Datum::from_uint64(load_le<std::uint64_t>(body));
        return {};
    case DatumKind::Float64:
        if (!require_fixed()) {
            return CodecErrc::CorruptRow;
        }
        out = Datum::from_float64(std::bit_cast<double>(load_le<std::uint64_t>(body)));
        return {};
    case DatumKind::Timestamp:
        if (!require_fixed()) {
            return CodecErrc::CorruptRow;
        }
        out = Datum::from_timestamp(Timestamp{static_cast<std::int64_t>(load_le<std::uint64_t>(body))});
        return {};
    case DatumKind::String:
        out = Datum::from_string(std::string(reinterpret_cast<const char*>(body.data()), body.size()));
        return {};
    case DatumKind::Bytes:
        out = Datum::from_bytes(std::vector<std::byte>(body.begin(), body.end()));
        return {};
    case DatumKind::Null:
    default:
        return CodecErrc::CorruptRow;
    }
}

std::error_code decode_legacy_datum(ByteReader& reader, Datum& out)
{
    if (!reader.has(1U)) {
        return CodecErrc::CorruptRow;
    }
    const auto flag = std::to_integer<std::uint8_t>(reader.take(1U)[0]);
    switch (flag) {
    case kLegacyNilFlag:
        out = Datum::null();
        return {};
    case kLegacyIntFlag:
        if (!reader.has(8U)) {
            return CodecErrc::CorruptRow;
        }
        out = Datum::from_int64(static_cast<std::int64_t>(load_u64_be(reader.take(8U)) ^ kSignMask));
        return {};
    case kLegacyUintFlag:
        if (!reader.has(8U)) {
            return CodecErrc::CorruptRow;
        }
        out = Datum::from_uint64(load_u64_be(reader.take(8U)));
        return {};
    case kLegacyFloatFlag: {
        if (!reader.has(8U)) {
            return CodecErrc::CorruptRow;
        }
        auto bits = load_u64_be(reader.take(8U));
        bits = (bits & kSignMask) != 0U ? bits & ~kSignMask : ~bits;
        out = Datum::from_float64(std::bit_cast<double>(bits));
        return {};
    }
    case kLegacyCompactBytesFlag: {
        std::uint64_t length = 0U;
        if (!reader.read_uvarint(length) || !reader.has(static_cast<std::size_t>(length))) {
            return CodecErrc::CorruptRow;
        }
        const auto body = reader.take(static_cast<std::size_t>(length));
        out = Datum::from_string(std::string(reinterpret_cast<const char*>(body.data()), body.size()));
        return {};
    }
    default:
        return CodecErrc::CorruptRow;
    }
}

}  // namespace

std::error_code encode_row(const TimeZone& zone,
                           std::span<const ColumnValue> row,
                           std::vector<std::byte>& buffer,
                           std::span<Datum> scratch_values,
                           const RawChecksum* checksum,
                           const RowEncoder& encoder)
{
    buffer.clear();
    if (auto ec = validate_row(row); ec) {
        return ec;
    }
    if (encoder.enabled) {
        return encode_compact(zone, row, buffer, checksum, encoder.max_value_length);
    }
    return encode_legacy(zone, row, buffer, scratch_values, encoder.max_value_length);
}

std::error_code encode_legacy_row(const TimeZone& zone,
                                  std::span<const ColumnValue> row,
                                  std::vector<std::byte>& out,
                                  std::size_t max_value_length)
{
    out.clear();
    if (auto ec = validate_row(row); ec) {
        return ec;
    }
    return encode_legacy(zone, row, out, {}, max_value_length);
}

bool is_compact_row(std::span<const std::byte> bytes) noexcept
{
    return !bytes.empty() && std::to_integer<std::uint8_t>(bytes[0]) == kCompactRowVersion;
}

std::error_code decode_row(std::span<const std::byte> bytes, std::vector<ColumnValue>& out, const kv::Handle* handle)
{
    out.clear();
    if (bytes.size() < kCompactRowHeaderSize || !is_compact_row(bytes)) {
        return CodecErrc::CorruptRow;
    }

    const auto flags = std::to_integer<std::uint8_t>(bytes[1]);
    const bool has_checksum = (flags & kCompactRowFlagChecksum) != 0U;
    auto body = bytes;
    if (has_checksum) {
        if (body.size() < kCompactRowHeaderSize + sizeof(std::uint32_t)) {
            return CodecErrc::CorruptRow;
        }
        body = bytes.first(bytes.size() - sizeof(std::uint32_t));
        if (handle != nullptr) {
            const auto stored = load_le<std::uint32_t>(bytes.last(sizeof(std::uint32_t)));
            if (RawChecksum{*handle}.compute(body) != stored) {
                return CodecErrc::ChecksumMismatch;
            }
        }
    }

    ByteReader reader{body};
    reader.take(2U);
    const auto counts = reader.take(4U);
    const std::size_t not_null_count = load_le<std::uint16_t>(counts.first(2U));
    const std::size_t null_count = load_le<std::uint16_t>(counts.subspan(2U));
    const std::size_t total = not_null_count + null_count;

    if (!reader.has(total * sizeof(std::uint32_t) + not_null_count * sizeof(std::uint32_t))) {
        return CodecErrc::CorruptRow;
    }

    out.resize(total);
    for (std::size_t index = 0; index < total; ++index) {
        out[index].column_id = static_cast<std::int64_t>(load_le<std::uint32_t>(reader.take(sizeof(std::uint32_t))));
    }

    std::vector<std::uint32_t> end_offsets(not_null_count);
    for (auto& end_offset : end_offsets) {
        end_offset = load_le<std::uint32_t>(reader.take(sizeof(std::uint32_t)));
    }

    std::size_t start = 0U;
    for (std::size_t index = 0; index < not_null_count; ++index) {
        const std::size_t end = end_offsets[index];
        if (end < start || !reader.has(end - start)) {
            out.clear();
            return CodecErrc::CorruptRow;
        }
        if (auto ec = decode_compact_value(reader.take(end - start), out[index].value); ec) {
            out.clear();
            return ec;
        }
        start = end;
    }

    if (!reader.exhausted()) {
        out.clear();
        return CodecErrc::CorruptRow;
    }
    return {};
}

std::error_code decode_legacy_row(std::span<const std::byte> bytes, std::vector<ColumnValue>& out)
{
    out.clear();
    if (bytes.size() == 1U && std::to_integer<std::uint8_t>(bytes[0]) == kLegacyNilFlag) {
        return {};
    }

    ByteReader reader{bytes};
    while (!reader.exhausted()) {
        Datum id{};
        Datum value{};
        if (auto ec = decode_legacy_datum(reader, id); ec) {
            out.clear();
            return ec;
        }
        if (id.kind() != DatumKind::Int64) {
            out.clear();
            return CodecErrc::CorruptRow;
        }
        if (auto ec = decode_legacy_datum(reader, value); ec) {
            out.clear();
            return ec;
        }
        out.push_back(ColumnValue{id.as_int64(), std::move(value)});
    }
    return {};
}

}  // namespace rowpool::codec
