#pragma once

#include "exclusion_set.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace bugfind::engine {

// chains fragment occurrences on consecutive lines into complete matches.
//
// starts are taken from the first fragment in discovery order. each start is
// extended greedily: at every depth the first unblocked occurrence that follows
// the previous one is accepted, and siblings are only revisited when the deeper
// extension fails. completed chains are committed to the exclusion set before
// the next start is evaluated, so an early match may consume characters that a
// different choice would have left for more matches overall.
class assembler {
public:
  // occurrences[i] holds fragment i's occurrences sorted by (line, column)
  assembler(const std::vector<std::vector<occurrence>>& occurrences, exclusion_set& exclusions);

  // build a chain from start without touching the exclusion set
  std::optional<match_result> extend(const occurrence& start) const;

  // try every start, committing each completed chain; stops at max_matches when non-zero
  std::vector<match_result> assemble(size_t max_matches = 0);

  void commit(const match_result& match);

private:
  const std::vector<std::vector<occurrence>>& occurrences_;
  exclusion_set& exclusions_;

  bool is_blocked(const occurrence& candidate) const;
  size_t first_candidate(size_t fragment_index, const occurrence& previous) const;
};

} // namespace bugfind::engine
