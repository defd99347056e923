#pragma once

#include <cstddef>
#include <string>

namespace bugfindx::commands {

struct find_request {
  std::string pattern_file = "bug.txt";
  std::string landscape_file = "landscape.txt";
  bool show = false;
  bool highlight = false;
  size_t context_lines = 0;
  size_t max_matches = 0;
};

int find_command(const find_request& request);

} // namespace bugfindx::commands
