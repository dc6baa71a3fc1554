#include "rowpool/table/row_view.hpp"

#include <stdexcept>
#include <string>

namespace rowpool::table {

RowView::RowView(std::span<const codec::Datum> values) noexcept
    : values_{values}
{}

std::size_t RowView::column_count() const noexcept
{
    return values_.size();
}

bool RowView::empty() const noexcept
{
    return values_.empty();
}

const codec::Datum& RowView::column(std::size_t index) const
{
    if (index >= values_.size()) {
        throw std::out_of_range{"RowView column " + std::to_string(index) + " beyond row of " +
                                std::to_string(values_.size()) + " columns"};
    }
    return values_[index];
}

bool RowView::is_null(std::size_t index) const
{
    return column(index).is_null();
}

std::span<const codec::Datum> RowView::values() const noexcept
{
    return values_;
}

}  // namespace rowpool::table
