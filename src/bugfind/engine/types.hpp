#pragma once

#include "fragment.hpp"
#include <cstddef>
#include <vector>

namespace bugfind::engine {

// one located match of a fragment; line and column are 1-based
struct occurrence {
  size_t line = 0;
  size_t column = 0;
  size_t fragment_index = 0;
  const fragment* source = nullptr; // owned by the search session

  // true when this occurrence continues `previous`: same column, next line
  bool follows(const occurrence& previous) const noexcept {
    return line == previous.line + 1 && column == previous.column;
  }
};

// a complete pattern match, one occurrence per fragment in pattern order
struct match_result {
  std::vector<occurrence> parts;

  size_t size() const noexcept { return parts.size(); }
  size_t first_line() const noexcept { return parts.empty() ? 0 : parts.front().line; }
  size_t column() const noexcept { return parts.empty() ? 0 : parts.front().column; }
};

struct search_options {
  size_t max_matches = 0; // 0 means unlimited
};

} // namespace bugfind::engine
