#pragma once

#include <system_error>

namespace rowpool::kv {

enum class KvErrc {
    Success = 0,
    EmptyKey,
    EntryTooLarge,
    TxnTooLarge
};

const std::error_category& kv_error_category() noexcept;
std::error_code make_error_code(KvErrc value) noexcept;

}  // namespace rowpool::kv

namespace std {

template <>
struct is_error_code_enum<rowpool::kv::KvErrc> : true_type {
};

}  // namespace std
