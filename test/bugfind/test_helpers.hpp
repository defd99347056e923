#pragma once

#include "bugfind/engine/types.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <string>
#include <utility>
#include <vector>

namespace bugfind::test_helpers {

// temporary file removed when the helper goes out of scope
class temp_file {
public:
  explicit temp_file(const std::string& content) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("bugfind_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".txt");
    std::ofstream out(path_, std::ios::binary);
    out << content;
  }

  ~temp_file() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  temp_file(const temp_file&) = delete;
  temp_file& operator=(const temp_file&) = delete;

  std::string path() const { return path_.string(); }

private:
  std::filesystem::path path_;
};

inline std::vector<std::pair<size_t, size_t>> positions(const engine::match_result& match) {
  std::vector<std::pair<size_t, size_t>> out;
  for (const auto& part : match.parts) {
    out.emplace_back(part.line, part.column);
  }
  return out;
}

} // namespace bugfind::test_helpers
