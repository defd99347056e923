#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace bugfind::engine {

constexpr char k_wildcard = ' ';

// one line of a multiline pattern; spaces are wildcards, everything else is literal
class fragment {
public:
  explicit fragment(std::string text);

  const std::string& text() const noexcept { return text_; }

  // offsets of the non-wildcard characters, in ascending order
  const std::vector<size_t>& footprint() const noexcept { return footprint_; }

  size_t size() const noexcept { return text_.size(); }
  bool empty() const noexcept { return text_.empty(); }

  bool is_wildcard(size_t offset) const noexcept { return text_[offset] == k_wildcard; }

private:
  std::string text_;
  std::vector<size_t> footprint_;
};

// parse raw pattern lines into fragments; trailing blanks are dropped per line
// and trailing empty lines are not part of the pattern
std::vector<fragment> parse_fragments(const std::vector<std::string>& lines);

} // namespace bugfind::engine
