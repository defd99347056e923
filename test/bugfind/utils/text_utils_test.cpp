#include <doctest/doctest.h>

#include "bugfind/utils/file_utils.hpp"
#include "bugfind/utils/text_utils.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

namespace {

using bugfind::test_helpers::temp_file;
using bugfind::utils::read_file_lines;
using bugfind::utils::rstrip_copy;
using bugfind::utils::split_lines;
using bugfind::utils::strip_line_terminator;

} // namespace

TEST_CASE("rstrip keeps leading whitespace") {
  CHECK(rstrip_copy("  ab \t\r\n") == "  ab");
  CHECK(rstrip_copy("a b") == "a b");
  CHECK(rstrip_copy(" \t ").empty());
  CHECK(rstrip_copy("").empty());
}

TEST_CASE("line terminators are removed once") {
  CHECK(strip_line_terminator("ab\n") == "ab");
  CHECK(strip_line_terminator("ab\r\n") == "ab");
  CHECK(strip_line_terminator("ab  ") == "ab  ");
  CHECK(strip_line_terminator("ab\n\n") == "ab\n");
}

TEST_CASE("split lines handles final terminators and blank lines") {
  CHECK(split_lines("") == std::vector<std::string>{});
  CHECK(split_lines("a") == std::vector<std::string>{"a"});
  CHECK(split_lines("a\n") == std::vector<std::string>{"a"});
  CHECK(split_lines("a\n\nb") == std::vector<std::string>{"a", "", "b"});
  CHECK(split_lines("a\r\nb\r\n") == std::vector<std::string>{"a", "b"});
  CHECK(split_lines(" a \n\n") == std::vector<std::string>{" a ", ""});
}

TEST_CASE("file lines are read verbatim") {
  temp_file file(" x  \ny\r\n");
  auto lines = read_file_lines(file.path());
  REQUIRE(lines.has_value());
  CHECK(*lines == std::vector<std::string>{" x  ", "y"});
}

TEST_CASE("missing files are reported") {
  CHECK_FALSE(read_file_lines("/nonexistent/bugfind/input.txt").has_value());
  CHECK_FALSE(bugfind::utils::read_file_string("/").has_value());
}
