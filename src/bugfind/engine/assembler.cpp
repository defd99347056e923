#include "assembler.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <utility>

namespace bugfind::engine {

namespace {

bool position_less(const occurrence& lhs, size_t line, size_t column) {
  return lhs.line < line || (lhs.line == line && lhs.column < column);
}

} // namespace

assembler::assembler(const std::vector<std::vector<occurrence>>& occurrences, exclusion_set& exclusions)
    : occurrences_(occurrences), exclusions_(exclusions) {}

bool assembler::is_blocked(const occurrence& candidate) const {
  if (!candidate.source) {
    return false;
  }
  return exclusions_.is_blocked(candidate.line, candidate.column, candidate.source->footprint());
}

size_t assembler::first_candidate(size_t fragment_index, const occurrence& previous) const {
  const auto& candidates = occurrences_[fragment_index];
  size_t target_line = previous.line + 1;
  auto it = std::lower_bound(
      candidates.begin(), candidates.end(), target_line,
      [&](const occurrence& lhs, size_t line) { return position_less(lhs, line, previous.column); }
  );
  return static_cast<size_t>(it - candidates.begin());
}

std::optional<match_result> assembler::extend(const occurrence& start) const {
  const size_t fragment_count = occurrences_.size();
  if (fragment_count == 0) {
    return std::nullopt;
  }

  match_result chain;
  chain.parts.reserve(fragment_count);
  chain.parts.push_back(start);
  if (fragment_count == 1) {
    return chain;
  }

  // cursors[d] is the next candidate index for fragment d + 1
  std::vector<size_t> cursors;
  cursors.reserve(fragment_count - 1);
  cursors.push_back(first_candidate(1, start));

  while (!cursors.empty()) {
    const size_t depth = cursors.size();
    const auto& candidates = occurrences_[depth];
    const occurrence& previous = chain.parts.back();
    size_t& cursor = cursors.back();

    bool accepted = false;
    while (cursor < candidates.size()) {
      const occurrence& candidate = candidates[cursor];
      if (!candidate.follows(previous)) {
        break;
      }
      ++cursor;
      if (is_blocked(candidate)) {
        continue;
      }
      chain.parts.push_back(candidate);
      accepted = true;
      break;
    }

    if (accepted) {
      if (chain.parts.size() == fragment_count) {
        return chain;
      }
      cursors.push_back(first_candidate(depth + 1, chain.parts.back()));
      continue;
    }

    // no continuation at this depth; fall back to the sibling of the previous pick
    cursors.pop_back();
    if (cursors.empty()) {
      break;
    }
    chain.parts.pop_back();
  }

  return std::nullopt;
}

void assembler::commit(const match_result& match) {
  for (const auto& part : match.parts) {
    if (part.source) {
      exclusions_.mark(part.line, part.column, part.source->footprint());
    }
  }
}

std::vector<match_result> assembler::assemble(size_t max_matches) {
  auto log = redlog::get_logger("bugfind.assembler");
  std::vector<match_result> matches;
  if (occurrences_.empty()) {
    return matches;
  }

  size_t skipped = 0;
  size_t discarded = 0;
  for (const auto& start : occurrences_.front()) {
    if (is_blocked(start)) {
      ++skipped;
      continue;
    }

    auto chain = extend(start);
    if (!chain) {
      ++discarded;
      continue;
    }

    commit(*chain);
    log.ped("chain completed", redlog::field("line", start.line), redlog::field("column", start.column));
    matches.push_back(std::move(*chain));

    if (max_matches > 0 && matches.size() >= max_matches) {
      log.dbg("match limit reached", redlog::field("max_matches", max_matches));
      break;
    }
  }

  log.trc(
      "assembly completed", redlog::field("starts", occurrences_.front().size()),
      redlog::field("matches", matches.size()), redlog::field("blocked", skipped),
      redlog::field("discarded", discarded)
  );
  return matches;
}

} // namespace bugfind::engine
