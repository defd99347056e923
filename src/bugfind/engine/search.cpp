#include "search.hpp"
#include "engine/assembler.hpp"
#include "engine/fragment_matcher.hpp"
#include "utils/file_utils.hpp"
#include "utils/pretty_landscape.hpp"
#include "utils/text_utils.hpp"
#include <redlog.hpp>
#include <utility>

namespace bugfind::engine {

pattern_search::pattern_search(search_options options) : options_(options) {}

void pattern_search::reset_results() {
  matches_.clear();
  exclusions_.clear();
  match_count_ = 0;
}

void pattern_search::clear_pattern() {
  fragments_.clear();
  occurrences_.clear();
  landscape_.clear();
  reset_results();
  phase_ = phase::empty;
}

status pattern_search::load_pattern(const std::vector<std::string>& lines) {
  auto log = redlog::get_logger("bugfind.search");

  clear_pattern();

  auto parsed = parse_fragments(lines);
  if (parsed.empty()) {
    log.err("pattern is empty", redlog::field("lines", lines.size()));
    return make_status(error_code::invalid_pattern, "pattern is empty");
  }

  fragments_ = std::move(parsed);
  occurrences_.resize(fragments_.size());
  phase_ = phase::pattern_loaded;

  log.vrb("pattern loaded", redlog::field("fragments", fragments_.size()));
  for (size_t i = 0; i < fragments_.size(); ++i) {
    log.dbg(
        "fragment", redlog::field("index", i), redlog::field("text", fragments_[i].text()),
        redlog::field("footprint", fragments_[i].footprint().size())
    );
  }
  return ok_status();
}

status pattern_search::load_pattern_file(const std::string& file_path) {
  auto lines = utils::read_file_lines(file_path);
  if (!lines.has_value()) {
    auto log = redlog::get_logger("bugfind.search");
    log.err("cannot read pattern file", redlog::field("path", file_path));
    clear_pattern();
    return make_status(error_code::invalid_pattern, "cannot read pattern file: " + file_path);
  }
  return load_pattern(*lines);
}

status pattern_search::scan_landscape(const std::vector<std::string>& lines) {
  auto log = redlog::get_logger("bugfind.search");
  if (phase_ == phase::empty) {
    log.err("landscape scan requested before a pattern was loaded");
    return make_status(error_code::pattern_not_set, "pattern not set");
  }

  for (auto& list : occurrences_) {
    list.clear();
  }
  reset_results();

  landscape_.clear();
  landscape_.reserve(lines.size());
  for (const auto& line : lines) {
    landscape_.emplace_back(utils::strip_line_terminator(line));
  }

  std::vector<fragment_matcher> matchers;
  matchers.reserve(fragments_.size());
  for (size_t i = 0; i < fragments_.size(); ++i) {
    matchers.emplace_back(fragments_[i], i);
  }

  size_t total = 0;
  for (size_t line_index = 0; line_index < landscape_.size(); ++line_index) {
    const size_t line_number = line_index + 1;
    for (size_t i = 0; i < matchers.size(); ++i) {
      auto found = matchers[i].find_occurrences(line_number, landscape_[line_index]);
      total += found.size();
      occurrences_[i].insert(occurrences_[i].end(), found.begin(), found.end());
    }
  }

  phase_ = phase::landscape_scanned;
  log.vrb("landscape scanned", redlog::field("lines", landscape_.size()), redlog::field("occurrences", total));
  return ok_status();
}

status pattern_search::scan_landscape_file(const std::string& file_path) {
  auto log = redlog::get_logger("bugfind.search");
  if (phase_ == phase::empty) {
    log.err("landscape scan requested before a pattern was loaded");
    return make_status(error_code::pattern_not_set, "pattern not set");
  }

  auto lines = utils::read_file_lines(file_path);
  if (!lines.has_value()) {
    log.err("cannot read landscape file", redlog::field("path", file_path));
    return make_status(error_code::invalid_landscape, "cannot read landscape file: " + file_path);
  }
  return scan_landscape(*lines);
}

result<size_t> pattern_search::detect_matches() {
  auto log = redlog::get_logger("bugfind.search");
  if (phase_ != phase::landscape_scanned) {
    log.err("match detection requested before the landscape was scanned");
    return error_result<size_t>(error_code::pattern_not_set, "landscape not scanned");
  }

  size_t remaining = 0;
  if (options_.max_matches > 0) {
    if (match_count_ >= options_.max_matches) {
      return ok_result<size_t>(0);
    }
    remaining = options_.max_matches - match_count_;
  }

  assembler chains(occurrences_, exclusions_);
  auto found = chains.assemble(remaining);

  bool verbose_enabled = static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::verbose);
  for (auto& match : found) {
    ++match_count_;
    if (verbose_enabled) {
      log.vrb(
          "pattern match", redlog::field("index", match_count_),
          redlog::field("at", utils::format_match_positions(match))
      );
    }
    matches_.push_back(std::move(match));
  }

  log.vrb(
      "match detection completed", redlog::field("new_matches", found.size()), redlog::field("total", match_count_)
  );
  return ok_result(found.size());
}

result<pattern_search> run_search(
    const std::vector<std::string>& pattern_lines, const std::vector<std::string>& landscape_lines,
    const search_options& options
) {
  pattern_search session(options);

  auto loaded = session.load_pattern(pattern_lines);
  if (!loaded.ok()) {
    return error_result<pattern_search>(loaded.code, loaded.message);
  }

  auto scanned = session.scan_landscape(landscape_lines);
  if (!scanned.ok()) {
    return error_result<pattern_search>(scanned.code, scanned.message);
  }

  auto detected = session.detect_matches();
  if (!detected.ok()) {
    return error_result<pattern_search>(detected.status_info.code, detected.status_info.message);
  }

  return ok_result(std::move(session));
}

} // namespace bugfind::engine
