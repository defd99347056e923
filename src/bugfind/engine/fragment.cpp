#include "fragment.hpp"
#include "utils/text_utils.hpp"
#include <utility>

namespace bugfind::engine {

fragment::fragment(std::string text) : text_(std::move(text)) {
  footprint_.reserve(text_.size());
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] != k_wildcard) {
      footprint_.push_back(i);
    }
  }
}

std::vector<fragment> parse_fragments(const std::vector<std::string>& lines) {
  std::vector<std::string> stripped;
  stripped.reserve(lines.size());
  for (const auto& line : lines) {
    stripped.push_back(utils::rstrip_copy(line));
  }

  while (!stripped.empty() && stripped.back().empty()) {
    stripped.pop_back();
  }

  std::vector<fragment> fragments;
  fragments.reserve(stripped.size());
  for (auto& text : stripped) {
    fragments.emplace_back(std::move(text));
  }
  return fragments;
}

} // namespace bugfind::engine
