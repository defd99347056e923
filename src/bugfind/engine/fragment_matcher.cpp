#include "fragment_matcher.hpp"
#include <algorithm>

namespace bugfind::engine {

fragment_matcher::fragment_matcher(const fragment& part, size_t fragment_index)
    : part_(&part), fragment_index_(fragment_index) {
  build_shift_table();
}

void fragment_matcher::build_shift_table() {
  const size_t pattern_len = part_->size();
  if (pattern_len == 0) {
    return;
  }

  shift_table_.fill(pattern_len);

  const std::string& text = part_->text();
  for (size_t i = 0; i + 1 < pattern_len; ++i) {
    if (!part_->is_wildcard(i)) {
      shift_table_[static_cast<unsigned char>(text[i])] = pattern_len - 1 - i;
    }
  }

  // wildcards require conservative shifts to avoid skipping matches
  for (size_t i = 0; i + 1 < pattern_len; ++i) {
    if (part_->is_wildcard(i)) {
      size_t wildcard_shift = pattern_len - 1 - i;
      for (size_t b = 0; b < shift_table_.size(); ++b) {
        shift_table_[b] = std::min(shift_table_[b], wildcard_shift);
      }
    }
  }

  for (auto& shift : shift_table_) {
    if (shift == 0) {
      shift = 1;
    }
  }
}

std::vector<occurrence> fragment_matcher::find_occurrences(size_t line_number, std::string_view line_text) const {
  std::vector<occurrence> results;
  const size_t pattern_len = part_->size();
  if (!is_valid() || line_text.size() < pattern_len) {
    return results;
  }

  size_t i = 0;
  while (i + pattern_len <= line_text.size()) {
    if (match_at_position(line_text, i)) {
      results.push_back(occurrence{line_number, i + 1, fragment_index_, part_});
      // resume one past the hit so overlapping matches are reported
      i += 1;
    } else {
      size_t last_index = i + pattern_len - 1;
      i += shift_table_[static_cast<unsigned char>(line_text[last_index])];
    }
  }

  return results;
}

bool fragment_matcher::match_at_position(std::string_view text, size_t pos) const {
  const std::string& pattern = part_->text();
  const auto& footprint = part_->footprint();
  for (auto it = footprint.rbegin(); it != footprint.rend(); ++it) {
    if (pattern[*it] != text[pos + *it]) {
      return false;
    }
  }
  return true;
}

} // namespace bugfind::engine
