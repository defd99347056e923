#include "pretty_landscape.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace bugfind::utils {

namespace {

constexpr auto line_number_color = redlog::color::bright_cyan;
constexpr auto match_color = redlog::color::bright_green;
constexpr auto context_color = redlog::color::bright_black;

std::string format_line_number(size_t line_number, size_t width) {
  std::ostringstream oss;
  oss << std::setw(static_cast<int>(width)) << line_number << ":";
  return redlog::detail::colorize(oss.str(), line_number_color);
}

/**
 * colorize one landscape row, highlighting columns set in the mask.
 */
std::string format_row(const std::string& text, const std::vector<bool>& highlight_mask) {
  std::string out;
  std::string run;
  bool run_highlighted = false;

  auto flush = [&]() {
    if (run.empty()) {
      return;
    }
    out += redlog::detail::colorize(run, run_highlighted ? match_color : context_color);
    run.clear();
  };

  for (size_t i = 0; i < text.size(); ++i) {
    bool highlighted = i < highlight_mask.size() && highlight_mask[i];
    if (highlighted != run_highlighted) {
      flush();
      run_highlighted = highlighted;
    }
    run.push_back(text[i]);
  }
  flush();
  return out;
}

} // anonymous namespace

std::string format_match_positions(const engine::match_result& match) {
  std::ostringstream oss;
  for (size_t i = 0; i < match.parts.size(); ++i) {
    if (i > 0) {
      oss << " ";
    }
    oss << "L" << match.parts[i].line << ":C" << match.parts[i].column;
  }
  return oss.str();
}

std::string format_match_highlight(
    const std::vector<std::string>& landscape, const engine::match_result& match, const highlight_options& opts
) {
  if (match.parts.empty() || match.parts.back().line == 0 || match.parts.back().line > landscape.size()) {
    return "";
  }

  size_t first_line = match.parts.front().line;
  size_t last_line = match.parts.back().line;
  size_t begin = first_line > opts.context_lines ? first_line - opts.context_lines : 1;
  size_t end = std::min(landscape.size(), last_line + opts.context_lines);
  size_t width = std::to_string(end).size();

  std::ostringstream oss;
  for (size_t line = begin; line <= end; ++line) {
    const std::string& text = landscape[line - 1];
    std::vector<bool> mask(text.size(), false);

    for (const auto& part : match.parts) {
      if (part.line != line || !part.source) {
        continue;
      }
      for (size_t offset : part.source->footprint()) {
        size_t index = part.column - 1 + offset;
        if (index < mask.size()) {
          mask[index] = true;
        }
      }
    }

    if (opts.show_line_numbers) {
      oss << format_line_number(line, width) << " ";
    }
    oss << format_row(text, mask) << "\n";
  }

  return oss.str();
}

} // namespace bugfind::utils
