#pragma once

#include <cstddef>
#include <string>

namespace reasongraph {

/// Lower-case hex SHA-256 of the trimmed content, truncated to length
/// characters (at most 64). Identical content always maps to the same id.
std::string contentHash(const std::string& content, size_t length = 16);

} // namespace reasongraph
