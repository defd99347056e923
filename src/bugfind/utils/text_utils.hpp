#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bugfind::utils {

// drop trailing whitespace (spaces, tabs, line terminators); leading characters are kept
std::string rstrip_copy(std::string_view value);

// drop a single trailing "\n" or "\r\n"
std::string_view strip_line_terminator(std::string_view line);

// split text into lines without terminators; a final terminator does not start a new line
std::vector<std::string> split_lines(std::string_view text);

} // namespace bugfind::utils
