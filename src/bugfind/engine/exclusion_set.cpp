#include "exclusion_set.hpp"

namespace bugfind::engine {

void exclusion_set::mark(size_t line, size_t column, const std::vector<size_t>& footprint) {
  if (footprint.empty()) {
    return;
  }

  auto& columns = consumed_[line];
  for (size_t offset : footprint) {
    if (columns.insert(column + offset).second) {
      ++size_;
    }
  }
}

bool exclusion_set::is_blocked(size_t line, size_t column, const std::vector<size_t>& footprint) const {
  auto it = consumed_.find(line);
  if (it == consumed_.end()) {
    return false;
  }

  const auto& columns = it->second;
  for (size_t offset : footprint) {
    if (columns.count(column + offset) != 0) {
      return true;
    }
  }
  return false;
}

bool exclusion_set::is_consumed(size_t line, size_t column) const {
  auto it = consumed_.find(line);
  return it != consumed_.end() && it->second.count(column) != 0;
}

void exclusion_set::clear() {
  consumed_.clear();
  size_ = 0;
}

} // namespace bugfind::engine
