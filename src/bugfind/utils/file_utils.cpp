#include "file_utils.hpp"
#include "text_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace bugfind::utils {

std::optional<std::string> read_file_string(const std::string& file_path) {
  std::error_code ec;
  if (std::filesystem::is_directory(file_path, ec)) {
    return std::nullopt;
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::string content;
  content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return std::nullopt;
  }
  return content;
}

std::optional<std::vector<std::string>> read_file_lines(const std::string& file_path) {
  auto content = read_file_string(file_path);
  if (!content.has_value()) {
    return std::nullopt;
  }
  return split_lines(*content);
}

} // namespace bugfind::utils
