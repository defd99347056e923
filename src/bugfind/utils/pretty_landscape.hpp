#pragma once

#include "engine/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace bugfind::utils {

/**
 * options for controlling match rendering.
 */
struct highlight_options {
  size_t context_lines = 0; // landscape lines shown above and below the match
  bool show_line_numbers = true;
};

/**
 * compact textual form of a match, e.g. "L3:C5 L4:C5".
 */
std::string format_match_positions(const engine::match_result& match);

/**
 * render the landscape rows covered by a match.
 * footprint characters of the match are highlighted in green, the rest of
 * each row and any context rows in gray. respects redlog color settings.
 *
 * @param landscape landscape lines without terminators
 * @param match match to render
 * @param opts formatting options
 * @return formatted rows, one per line, or an empty string if the match lies outside the landscape
 */
std::string format_match_highlight(
    const std::vector<std::string>& landscape, const engine::match_result& match, const highlight_options& opts = {}
);

} // namespace bugfind::utils
