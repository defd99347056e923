#pragma once

#include "engine/exclusion_set.hpp"
#include "engine/fragment.hpp"
#include "engine/result.hpp"
#include "engine/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace bugfind::engine {

// one search from pattern load to final report.
// phases run in order: load_pattern, scan_landscape, detect_matches.
class pattern_search {
public:
  enum class phase { empty, pattern_loaded, landscape_scanned };

  explicit pattern_search(search_options options = {});

  // occurrences point into fragments_, so the session is move-only
  pattern_search(const pattern_search&) = delete;
  pattern_search& operator=(const pattern_search&) = delete;
  pattern_search(pattern_search&&) = default;
  pattern_search& operator=(pattern_search&&) = default;

  status load_pattern(const std::vector<std::string>& lines);
  status load_pattern_file(const std::string& file_path);

  status scan_landscape(const std::vector<std::string>& lines);
  status scan_landscape_file(const std::string& file_path);

  // returns the number of matches found by this call
  result<size_t> detect_matches();

  phase current_phase() const noexcept { return phase_; }
  size_t match_count() const noexcept { return match_count_; }
  const std::vector<match_result>& matches() const noexcept { return matches_; }
  const std::vector<fragment>& fragments() const noexcept { return fragments_; }
  const std::vector<occurrence>& occurrences(size_t fragment_index) const { return occurrences_.at(fragment_index); }
  const exclusion_set& exclusions() const noexcept { return exclusions_; }
  const std::vector<std::string>& landscape_lines() const noexcept { return landscape_; }

private:
  search_options options_;
  phase phase_ = phase::empty;
  std::vector<fragment> fragments_;
  std::vector<std::vector<occurrence>> occurrences_;
  std::vector<std::string> landscape_;
  std::vector<match_result> matches_;
  exclusion_set exclusions_;
  size_t match_count_ = 0;

  void reset_results();
  void clear_pattern();
};

// run all three phases over in-memory lines; the returned session owns the matches
result<pattern_search> run_search(
    const std::vector<std::string>& pattern_lines, const std::vector<std::string>& landscape_lines,
    const search_options& options = {}
);

} // namespace bugfind::engine
