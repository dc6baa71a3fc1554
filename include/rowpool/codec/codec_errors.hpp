#pragma once

#include <system_error>

namespace rowpool::codec {

enum class CodecErrc {
    Success = 0,
    ValueTruncated,
    TimestampOverflow,
    ColumnIdOutOfRange,
    TooManyColumns,
    RowTooLarge,
    CorruptRow,
    ChecksumMismatch
};

const std::error_category& codec_error_category() noexcept;
std::error_code make_error_code(CodecErrc value) noexcept;

// Soft errors leave a complete encoding behind; hard errors leave none.
[[nodiscard]] bool is_soft_error(std::error_code error) noexcept;

}  // namespace rowpool::codec

namespace std {

template <>
struct is_error_code_enum<rowpool::codec::CodecErrc> : true_type {
};

}  // namespace std
