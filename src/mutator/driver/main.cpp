#include <cstddef>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddListingArguments(argparse::ArgumentParser& cmd) {
  cmd.add_argument("listing").help("Module listing (.mil)");
  cmd.add_argument("--proc").append().help(
      "Only process the named procedure (repeatable)");
}

// 0: warnings only, 1: info, 2 and above: debug
void ConfigureLogging(int verbosity) {
  spdlog::set_pattern("%^[%l]%$ %v");
  if (verbosity >= 2) {
    spdlog::set_level(spdlog::level::debug);
  } else if (verbosity == 1) {
    spdlog::set_level(spdlog::level::info);
  } else {
    spdlog::set_level(spdlog::level::warn);
  }
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  std::vector<std::string> args(
      argv, argv + static_cast<std::ptrdiff_t>(argc));

  int verbosity = 0;
  argparse::ArgumentParser program("mutator", "0.1.0");
  program.add_description(
      "Resolves mutation markers in stack-machine procedure listings");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (repeatable)");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Resolve markers and print the rewritten listing");
  AddListingArguments(run_cmd);
  run_cmd.add_argument("--config").help(
      "Pass configuration (default: search for mutator.toml)");
  run_cmd.add_argument("-o", "--output").help(
      "Write the rewritten listing here instead of stdout");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("List marker uses without rewriting");
  AddListingArguments(check_cmd);
  check_cmd.add_argument("--config").help(
      "Pass configuration (default: search for mutator.toml)");

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Parse and re-print a listing");
  dump_cmd.add_argument("listing").help("Module listing (.mil)");

  program.add_subparser(run_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(dump_cmd);

  try {
    program.parse_args(args);
  } catch (const std::exception& err) {
    mutator::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  ConfigureLogging(verbosity);

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      mutator::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  try {
    if (program.is_subcommand_used("run")) {
      return mutator::driver::RunCommand(run_cmd);
    }

    if (program.is_subcommand_used("check")) {
      return mutator::driver::CheckCommand(check_cmd);
    }

    if (program.is_subcommand_used("dump")) {
      return mutator::driver::DumpCommand(dump_cmd);
    }
  } catch (const std::exception& e) {
    mutator::driver::PrintError(e.what());
    return 1;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
