#pragma once

#include <optional>
#include <string>
#include <vector>

namespace bugfind::utils {

// file reading utilities
std::optional<std::string> read_file_string(const std::string& file_path);
std::optional<std::vector<std::string>> read_file_lines(const std::string& file_path);

} // namespace bugfind::utils
