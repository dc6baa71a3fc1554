#pragma once

#include "rowpool/kv/mem_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <system_error>
#include <vector>

namespace rowpool::kv {

class MemDbBuffer final : public MemBuffer {
public:
    struct Config final {
        std::size_t entry_size_limit = 6U * 1024U * 1024U;
        std::size_t total_size_limit = 100U * 1024U * 1024U;
    };

    struct Entry final {
        std::vector<std::byte> value{};
        KeyFlag flags = KeyFlag::None;
    };

    MemDbBuffer();
    explicit MemDbBuffer(Config config);

    std::error_code set(std::span<const std::byte> key, std::span<const std::byte> value) override;
    std::error_code set_with_flags(std::span<const std::byte> key,
                                   std::span<const std::byte> value,
                                   std::span<const KeyFlag> flags) override;

    [[nodiscard]] const Entry* get(std::span<const std::byte> key) const;
    [[nodiscard]] KeyFlag flags(std::span<const std::byte> key) const;

    // Number of keys held.
    [[nodiscard]] std::size_t len() const noexcept;
    // Total bytes of keys and values held.
    [[nodiscard]] std::size_t size() const noexcept;

    void reset() noexcept;

private:
    struct KeyLess final {
        using is_transparent = void;

        bool operator()(std::span<const std::byte> lhs, std::span<const std::byte> rhs) const noexcept;
        bool operator()(const Key& lhs, const Key& rhs) const noexcept;
        bool operator()(const Key& lhs, std::span<const std::byte> rhs) const noexcept;
        bool operator()(std::span<const std::byte> lhs, const Key& rhs) const noexcept;
    };

    std::error_code write(std::span<const std::byte> key, std::span<const std::byte> value, KeyFlag flags);

    Config config_{};
    std::map<Key, Entry, KeyLess> entries_{};
    std::size_t total_bytes_ = 0U;
};

}  // namespace rowpool::kv
