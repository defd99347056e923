#include "commands/find.hpp"
#include "verbosity.hpp"
#include <args.hxx>
#include <redlog.hpp>
#include <iostream>
#include <string>

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() { bugfindx::cli::apply_verbosity(args::get(verbosity_flag)); }
} // namespace cli

int cmd_find(
    args::ValueFlag<std::string>& pattern_flag, args::ValueFlag<std::string>& landscape_flag, args::Flag& show_flag,
    args::Flag& highlight_flag, args::ValueFlag<size_t>& context_flag, args::ValueFlag<size_t>& max_flag
) {
  auto log = redlog::get_logger("bugfindx.find");
  cli::apply_verbosity();

  bugfindx::commands::find_request request;
  if (pattern_flag) {
    request.pattern_file = args::get(pattern_flag);
  }
  if (landscape_flag) {
    request.landscape_file = args::get(landscape_flag);
  }
  request.show = args::get(show_flag);
  request.highlight = args::get(highlight_flag);
  if (context_flag) {
    request.context_lines = args::get(context_flag);
  }
  if (max_flag) {
    request.max_matches = args::get(max_flag);
  }

  log.dbg(
      "find", redlog::field("pattern", request.pattern_file), redlog::field("landscape", request.landscape_file)
  );
  return bugfindx::commands::find_command(request);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("bugfindx - multiline pattern finder");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  // global flags
  parser.Add(cli::arguments);

  // find command
  args::Command find_cmd(parser, "find", "count occurrences of a multiline pattern in a landscape");
  args::ValueFlag<std::string> find_pattern_flag(
      find_cmd, "pattern", "pattern file path (default: bug.txt)", {'p', "pattern"}
  );
  args::ValueFlag<std::string> find_landscape_flag(
      find_cmd, "landscape", "landscape file path (default: landscape.txt)", {'l', "landscape"}
  );
  args::Flag find_show_flag(find_cmd, "show", "print the position of every match", {"show"});
  args::Flag find_highlight_flag(
      find_cmd, "highlight", "print every match with its characters highlighted", {"highlight"}
  );
  args::ValueFlag<size_t> find_context_flag(
      find_cmd, "lines", "context lines around highlighted matches", {'C', "context"}
  );
  args::ValueFlag<size_t> find_max_flag(find_cmd, "count", "stop after this many matches", {'m', "max"});

  try {
    parser.ParseCLI(argc, argv);

    if (find_cmd) {
      return cmd_find(
          find_pattern_flag, find_landscape_flag, find_show_flag, find_highlight_flag, find_context_flag, find_max_flag
      );
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
