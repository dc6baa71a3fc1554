#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace rowpool::tools {

// Whitespace between digits is ignored and either case is accepted. Throws
// std::invalid_argument on any other character or an odd digit count.
[[nodiscard]] std::vector<std::byte> parse_hex(std::string_view text);

}  // namespace rowpool::tools
