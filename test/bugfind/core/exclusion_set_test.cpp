#include <doctest/doctest.h>

#include "bugfind/engine/exclusion_set.hpp"

#include <vector>

namespace {

using bugfind::engine::exclusion_set;

} // namespace

TEST_CASE("exclusion set marks shifted footprint positions") {
  exclusion_set exclusions;
  exclusions.mark(2, 5, {0, 2});

  CHECK(exclusions.is_consumed(2, 5));
  CHECK_FALSE(exclusions.is_consumed(2, 6));
  CHECK(exclusions.is_consumed(2, 7));
  CHECK_FALSE(exclusions.is_consumed(1, 5));
  CHECK(exclusions.size() == 2);
}

TEST_CASE("exclusion set marking is idempotent") {
  exclusion_set exclusions;
  exclusions.mark(1, 1, {0, 1});
  exclusions.mark(1, 2, {0, 1});
  CHECK(exclusions.size() == 3);
  exclusions.mark(1, 1, {0, 1});
  CHECK(exclusions.size() == 3);
}

TEST_CASE("exclusion set blocks on any overlapping position") {
  exclusion_set exclusions;
  exclusions.mark(1, 1, {0, 1});

  CHECK(exclusions.is_blocked(1, 2, {0, 1}));
  CHECK_FALSE(exclusions.is_blocked(1, 3, {0, 1}));
  CHECK_FALSE(exclusions.is_blocked(2, 1, {0, 1}));
  // wildcard offsets are not part of the footprint and never block
  CHECK_FALSE(exclusions.is_blocked(1, 0, {0, 3}));
}

TEST_CASE("exclusion set ignores empty footprints") {
  exclusion_set exclusions;
  exclusions.mark(1, 1, {});
  CHECK(exclusions.empty());
  CHECK_FALSE(exclusions.is_blocked(1, 1, {}));
}

TEST_CASE("exclusion set clear resets state") {
  exclusion_set exclusions;
  exclusions.mark(4, 4, {0});
  exclusions.clear();
  CHECK(exclusions.empty());
  CHECK_FALSE(exclusions.is_consumed(4, 4));
}
