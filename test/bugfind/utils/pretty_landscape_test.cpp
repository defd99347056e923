#include <doctest/doctest.h>

#include "bugfind/engine/search.hpp"
#include "bugfind/utils/pretty_landscape.hpp"

#include <string>
#include <vector>

namespace {

using bugfind::engine::run_search;
using bugfind::utils::format_match_highlight;
using bugfind::utils::format_match_positions;
using bugfind::utils::highlight_options;

size_t count_lines(const std::string& text) {
  size_t count = 0;
  for (char c : text) {
    if (c == '\n') {
      ++count;
    }
  }
  return count;
}

} // namespace

TEST_CASE("match positions render as line and column pairs") {
  auto searched = run_search({"ab", "ab"}, {"xaby", "xaby"});
  REQUIRE(searched.ok());
  REQUIRE(searched.value.matches().size() == 1);
  CHECK(format_match_positions(searched.value.matches()[0]) == "L1:C2 L2:C2");
}

TEST_CASE("match highlight renders the covered rows") {
  std::vector<std::string> landscape = {"....", "xaby", "xaby", "...."};
  auto searched = run_search({"ab", "ab"}, landscape);
  REQUIRE(searched.ok());
  REQUIRE(searched.value.matches().size() == 1);
  const auto& match = searched.value.matches()[0];

  auto rendered = format_match_highlight(searched.value.landscape_lines(), match);
  CHECK(count_lines(rendered) == 2);
  CHECK(rendered.find("ab") != std::string::npos);
  CHECK(rendered.find("....") == std::string::npos);

  highlight_options opts;
  opts.context_lines = 1;
  auto with_context = format_match_highlight(searched.value.landscape_lines(), match, opts);
  CHECK(count_lines(with_context) == 4);
  CHECK(with_context.find("....") != std::string::npos);
}

TEST_CASE("match highlight is empty for matches outside the landscape") {
  auto searched = run_search({"ab"}, {"ab"});
  REQUIRE(searched.ok());
  REQUIRE(searched.value.matches().size() == 1);

  std::vector<std::string> shorter;
  CHECK(format_match_highlight(shorter, searched.value.matches()[0]).empty());
}
