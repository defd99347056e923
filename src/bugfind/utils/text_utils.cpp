#include "text_utils.hpp"

namespace bugfind::utils {

std::string rstrip_copy(std::string_view value) {
  size_t last = value.find_last_not_of(" \t\r\n\f\v");
  if (last == std::string_view::npos) {
    return {};
  }
  return std::string(value.substr(0, last + 1));
}

std::string_view strip_line_terminator(std::string_view line) {
  if (!line.empty() && line.back() == '\n') {
    line.remove_suffix(1);
  }
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      lines.emplace_back(strip_line_terminator(text.substr(start)));
      break;
    }
    lines.emplace_back(strip_line_terminator(text.substr(start, end - start + 1)));
    start = end + 1;
  }
  return lines;
}

} // namespace bugfind::utils
