#include "find.hpp"

#include <iostream>

#include <redlog.hpp>

#include "bugfind/bugfind.hpp"

namespace bugfindx::commands {

int find_command(const find_request& request) {
  auto log = redlog::get_logger("bugfindx.find");

  bugfind::engine::search_options options;
  options.max_matches = request.max_matches;
  bugfind::engine::pattern_search search(options);

  auto loaded = search.load_pattern_file(request.pattern_file);
  if (!loaded.ok()) {
    log.err(
        "failed to load pattern", redlog::field("path", request.pattern_file),
        redlog::field("code", bugfind::engine::error_code_name(loaded.code))
    );
    std::cerr << "error: " << loaded.message << std::endl;
    return 1;
  }

  auto scanned = search.scan_landscape_file(request.landscape_file);
  if (!scanned.ok()) {
    log.err(
        "failed to scan landscape", redlog::field("path", request.landscape_file),
        redlog::field("code", bugfind::engine::error_code_name(scanned.code))
    );
    std::cerr << "error: " << scanned.message << std::endl;
    return 1;
  }

  auto detected = search.detect_matches();
  if (!detected.ok()) {
    log.err("match detection failed", redlog::field("error", detected.status_info.message));
    std::cerr << "error: " << detected.status_info.message << std::endl;
    return 1;
  }

  std::cout << "Number of patterns found: " << search.match_count() << std::endl;

  bugfind::utils::highlight_options highlight;
  highlight.context_lines = request.context_lines;

  size_t index = 0;
  for (const auto& match : search.matches()) {
    ++index;
    if (request.show || request.highlight) {
      std::cout << "match " << index << ": " << bugfind::utils::format_match_positions(match) << "\n";
    }
    if (request.highlight) {
      std::cout << bugfind::utils::format_match_highlight(search.landscape_lines(), match, highlight);
    }
  }

  return 0;
}

} // namespace bugfindx::commands
