#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace rowpool::table {

// Sets `slice` to exactly `size` elements, reusing its storage when the capacity already covers
// `capacity_hint` (or `size` when no hint is given). Otherwise the slice is replaced by fresh
// storage of at least that capacity; previous contents are not carried over. Capacity never
// shrinks. Returns true when fresh storage was allocated.
template <typename T>
bool ensure_capacity_and_reset(std::vector<T>& slice, std::size_t size, std::optional<std::size_t> capacity_hint = std::nullopt)
{
    const std::size_t capacity = std::max(size, capacity_hint.value_or(size));
    if (slice.capacity() < capacity) {
        std::vector<T> fresh;
        fresh.reserve(capacity);
        fresh.resize(size);
        slice = std::move(fresh);
        return true;
    }
    slice.resize(size);
    return false;
}

}  // namespace rowpool::table
