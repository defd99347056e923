#pragma once

#include <cstddef>
#include <set>
#include <unordered_map>
#include <vector>

namespace bugfind::engine {

// landscape positions consumed by finalized matches, keyed by line then column.
// the set only grows; committed matches are never retracted.
class exclusion_set {
public:
  // mark column + offset on line for every offset in the footprint
  void mark(size_t line, size_t column, const std::vector<size_t>& footprint);

  // true if any footprint position shifted to (line, column) is already consumed
  bool is_blocked(size_t line, size_t column, const std::vector<size_t>& footprint) const;

  bool is_consumed(size_t line, size_t column) const;

  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

  void clear();

private:
  std::unordered_map<size_t, std::set<size_t>> consumed_;
  size_t size_ = 0;
};

} // namespace bugfind::engine
