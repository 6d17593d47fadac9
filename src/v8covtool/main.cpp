#include <cstdlib>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "commands/report.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() {
  int verbosity = args::get(verbosity_flag);
  redlog::set_level(redlog::level::info);
  if (verbosity == 1) {
    redlog::set_level(redlog::level::verbose);
  } else if (verbosity == 2) {
    redlog::set_level(redlog::level::trace);
  } else if (verbosity == 3) {
    redlog::set_level(redlog::level::debug);
  } else if (verbosity >= 4) {
    redlog::set_level(redlog::level::pedantic);
  }
}
} // namespace cli

namespace {
int g_exit_code = 0;
} // namespace

void cmd_report(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> temp_directory(
      parser, "dir", "directory holding the v8 coverage dumps", {"temp-directory"}
  );
  args::ValueFlag<std::string> reports_dir(parser, "dir", "directory reports are written to", {'o', "reports-dir"});
  args::ValueFlag<std::string> resolve(parser, "dir", "root that script urls are resolved against", {"resolve"});
  args::ValueFlagList<std::string> include(parser, "glob", "only report files matching this glob", {'n', "include"});
  args::ValueFlagList<std::string> exclude(parser, "glob", "exclude files matching this glob", {'x', "exclude"});
  args::ValueFlagList<std::string> extension(parser, "ext", "file extension to report on", {'e', "extension"});
  args::ValueFlagList<std::string> reporter(parser, "name", "reporter to run (json, text-summary)", {'r', "reporter"});
  args::Flag all(parser, "all", "report every matching file, including ones never loaded", {'a', "all"});
  args::Flag allow_relative(parser, "allow-relative", "keep scripts with relative urls", {"allow-relative"});
  args::ValueFlag<uint32_t> wrapper_length(
      parser, "length", "length of the module wrapper prepended to each script", {"wrapper-length"}
  );
  parser.Parse();

  g_exit_code = v8covtool::commands::report(
      temp_directory, reports_dir, resolve, include, exclude, extension, reporter, all, allow_relative, wrapper_length
  );
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser(
      "v8cov - v8 coverage to istanbul reports", "merge the coverage dumps of a test run and write istanbul reports"
  );
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command report_cmd(commands, "report", "aggregate coverage dumps and run reporters", &cmd_report);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  return g_exit_code;
}
