#include "rowpool/table/check_row_buffer.hpp"
#include "rowpool/table/reusable_slice.hpp"

#include <utility>

namespace rowpool::table {

bool CheckRowBuffer::reset(std::size_t capacity)
{
    return ensure_capacity_and_reset(row_to_check_, 0U, capacity);
}

void CheckRowBuffer::add_col_val(codec::Datum value)
{
    row_to_check_.push_back(std::move(value));
}

RowView CheckRowBuffer::row_to_check() const noexcept
{
    return RowView{row_to_check_};
}

std::size_t CheckRowBuffer::size() const noexcept
{
    return row_to_check_.size();
}

std::size_t CheckRowBuffer::capacity() const noexcept
{
    return row_to_check_.capacity();
}

}  // namespace rowpool::table
