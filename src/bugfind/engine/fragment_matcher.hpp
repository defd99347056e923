#pragma once

#include "fragment.hpp"
#include "types.hpp"
#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

namespace bugfind::engine {

// wildcard-aware Boyer-Moore-Horspool matcher for a single fragment
class fragment_matcher {
public:
  fragment_matcher(const fragment& part, size_t fragment_index);

  // every match in the line, overlapping matches included, ordered by column
  std::vector<occurrence> find_occurrences(size_t line_number, std::string_view line_text) const;

  size_t pattern_size() const { return part_->size(); }

  bool is_valid() const { return !part_->empty(); }

private:
  const fragment* part_;
  size_t fragment_index_ = 0;
  std::array<size_t, 256> shift_table_{};

  void build_shift_table();
  bool match_at_position(std::string_view text, size_t pos) const;
};

} // namespace bugfind::engine
