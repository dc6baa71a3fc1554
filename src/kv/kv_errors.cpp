#include "rowpool/kv/kv_errors.hpp"

#include <string>

namespace rowpool::kv {

namespace {

class KvErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "rowpool.kv";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<KvErrc>(condition)) {
        case KvErrc::Success:
            return "success";
        case KvErrc::EmptyKey:
            return "key must not be empty";
        case KvErrc::EntryTooLarge:
            return "entry exceeds the per-entry size limit";
        case KvErrc::TxnTooLarge:
            return "memory buffer exceeds the total size limit";
        default:
            return "unknown kv error";
        }
    }
};

const KvErrorCategory kCategory{};

}  // namespace

const std::error_category& kv_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(KvErrc value) noexcept
{
    return {static_cast<int>(value), kv_error_category()};
}

}  // namespace rowpool::kv
