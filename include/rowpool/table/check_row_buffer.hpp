#pragma once

#include "rowpool/codec/datum.hpp"
#include "rowpool/table/row_view.hpp"

#include <cstddef>
#include <vector>

namespace rowpool::table {

// Stages the column values of one row for constraint checks.
class CheckRowBuffer final {
public:
    bool reset(std::size_t capacity);
    void add_col_val(codec::Datum value);

    // Valid until the next reset or add_col_val.
    [[nodiscard]] RowView row_to_check() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;

private:
    std::vector<codec::Datum> row_to_check_{};
};

}  // namespace rowpool::table
