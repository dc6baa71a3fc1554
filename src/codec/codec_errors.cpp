#include "rowpool/codec/codec_errors.hpp"

#include "rowpool/errctx/error_context.hpp"

#include <string>

namespace rowpool::codec {

namespace {

class CodecErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "rowpool.codec";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<CodecErrc>(condition)) {
        case CodecErrc::Success:
            return "success";
        case CodecErrc::ValueTruncated:
            return "column value truncated to the encoder length limit";
        case CodecErrc::TimestampOverflow:
            return "timestamp out of range";
        case CodecErrc::ColumnIdOutOfRange:
            return "column id out of range";
        case CodecErrc::TooManyColumns:
            return "row has too many columns";
        case CodecErrc::RowTooLarge:
            return "encoded row exceeds 32-bit offsets";
        case CodecErrc::CorruptRow:
            return "corrupt row encoding";
        case CodecErrc::ChecksumMismatch:
            return "row checksum mismatch";
        default:
            return "unknown codec error";
        }
    }

    std::error_condition default_error_condition(int condition) const noexcept override
    {
        switch (static_cast<CodecErrc>(condition)) {
        case CodecErrc::ValueTruncated:
            return errctx::ErrorGroup::Truncate;
        case CodecErrc::TimestampOverflow:
            return errctx::ErrorGroup::Overflow;
        default:
            return {condition, *this};
        }
    }
};

const CodecErrorCategory kCategory{};

}  // namespace

const std::error_category& codec_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(CodecErrc value) noexcept
{
    return {static_cast<int>(value), codec_error_category()};
}

bool is_soft_error(std::error_code error) noexcept
{
    return error == CodecErrc::ValueTruncated || error == CodecErrc::TimestampOverflow;
}

}  // namespace rowpool::codec
