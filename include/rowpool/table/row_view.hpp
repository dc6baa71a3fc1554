#pragma once

#include "rowpool/codec/datum.hpp"

#include <cstddef>
#include <span>

namespace rowpool::table {

// Read-only positional row handed to constraint checks. Does not own the values.
class RowView final {
public:
    RowView() = default;
    explicit RowView(std::span<const codec::Datum> values) noexcept;

    [[nodiscard]] std::size_t column_count() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const codec::Datum& column(std::size_t index) const;
    [[nodiscard]] bool is_null(std::size_t index) const;
    [[nodiscard]] std::span<const codec::Datum> values() const noexcept;

    [[nodiscard]] auto begin() const noexcept
    {
        return values_.begin();
    }

    [[nodiscard]] auto end() const noexcept
    {
        return values_.end();
    }

private:
    std::span<const codec::Datum> values_{};
};

}  // namespace rowpool::table
