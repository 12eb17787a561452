#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddInputFiles(argparse::ArgumentParser& cmd) {
  cmd.add_argument("files").remaining().help(
      "Item descriptions (uses ctxerr.toml if not specified)");
}

// Log lines go to stderr so `generate --stdout` and `dump` stay clean
void SetUpLogging(bool verbose) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("ctxerr"));
  spdlog::set_pattern("%n: %^%l%$: %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("ctxerr", "0.1.0");
  program.add_description(
      "Generates context-attaching conversions for C++ error taxonomies");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log each generation step");

  // Subcommand: generate
  argparse::ArgumentParser generate_cmd("generate");
  generate_cmd.add_description("Generate C++ headers from item descriptions");
  generate_cmd.add_argument("-o").help("Output file (single input only)");
  generate_cmd.add_argument("--out-dir").help(
      "Output directory (overrides build.out_dir)");
  generate_cmd.add_argument("--stdout")
      .default_value(false)
      .implicit_value(true)
      .help("Print the generated headers instead of writing files");
  AddInputFiles(generate_cmd);

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Check item descriptions for errors");
  AddInputFiles(check_cmd);

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Print the generated model as YAML");
  AddInputFiles(dump_cmd);

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Create a new ctxerr project");
  init_cmd.add_argument("name").nargs(0, 1).help("Project name");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing ctxerr.toml");

  program.add_subparser(generate_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(dump_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    ctxerr::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  SetUpLogging(program.get<bool>("--verbose"));

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      ctxerr::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  if (program.is_subcommand_used("generate")) {
    return ctxerr::driver::GenerateCommand(generate_cmd);
  }

  if (program.is_subcommand_used("check")) {
    return ctxerr::driver::CheckCommand(check_cmd);
  }

  if (program.is_subcommand_used("dump")) {
    return ctxerr::driver::DumpCommand(dump_cmd);
  }

  if (program.is_subcommand_used("init")) {
    return ctxerr::driver::InitCommand(init_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
