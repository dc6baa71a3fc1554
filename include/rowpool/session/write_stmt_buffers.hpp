#pragma once

#include "rowpool/codec/datum.hpp"

#include <cstddef>
#include <vector>

namespace rowpool::session {

// Per-statement scratch owned by the session. Row encoding borrows both areas so consecutive
// rows reuse the same allocations.
struct WriteStmtBuffers final {
    // Receives each encoded row value.
    std::vector<std::byte> row_value_buffer{};
    // Interleaved id, value staging for the legacy row format; sized to 2 * row length.
    std::vector<codec::Datum> add_row_values{};

    // Drops both allocations, for use when the statement ends.
    void release() noexcept
    {
        std::vector<std::byte>{}.swap(row_value_buffer);
        std::vector<codec::Datum>{}.swap(add_row_values);
    }
};

}  // namespace rowpool::session
