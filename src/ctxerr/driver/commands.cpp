#include "commands.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "argparse/argparse.hpp"
#include "config.hpp"
#include "ctxerr/codegen/yaml_writer.hpp"
#include "ctxerr/common/diagnostic/diagnostic.hpp"
#include "input.hpp"
#include "pipeline.hpp"
#include "print.hpp"

namespace ctxerr::driver {
namespace {

namespace fs = std::filesystem;

constexpr const char* kSampleFileName = "errors.ctxerr.yaml";

auto WriteOutput(const fs::path& path, const std::string& content)
    -> Result<void> {
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot create directory '{}': {}",
                  path.parent_path().string(), ec.message())));
    }
  }
  std::ofstream out(path);
  out << content;
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot write '{}'", path.string())));
  }
  return {};
}

// Target path for every document, rejecting two inputs that would land on
// the same header
auto PlanOutputs(
    const PipelineResult& result, const GenerationInput& input,
    const std::optional<std::string>& output) -> Result<std::vector<fs::path>> {
  std::vector<fs::path> targets;
  std::map<fs::path, fs::path> claimed;
  for (const auto& doc : result.documents) {
    fs::path target = output ? fs::path(*output)
                             : input.out_dir / (OutputStem(doc.path) + ".hpp");
    auto [it, inserted] =
        claimed.emplace(target.lexically_normal(), doc.path);
    if (!inserted) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "'{}' and '{}' both generate '{}'", it->second.string(),
                  doc.path.string(), target.string())));
    }
    targets.push_back(std::move(target));
  }
  return targets;
}

auto SampleItemFile(const std::string& project_name) -> std::string {
  return fmt::format(
      "# Error taxonomy for {}\n"
      "includes:\n"
      "  - \"<system_error>\"\n"
      "items:\n"
      "  - kind: enum\n"
      "    name: Error\n"
      "    doc: \"Errors reported by {}\"\n"
      "    cases:\n"
      "      - name: Io\n"
      "        contextual: true\n"
      "        fields:\n"
      "          - std::error_code\n"
      "      - name: Parse\n"
      "        display: \"parse error at line {{line}}\"\n"
      "        fields:\n"
      "          - name: line\n"
      "            type: int\n",
      project_name, project_name);
}

}  // namespace

auto GenerateCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }
  if (auto out_dir = cmd.present<std::string>("--out-dir")) {
    input->out_dir = *out_dir;
  }
  auto output = cmd.present<std::string>("-o");
  bool to_stdout = cmd.get<bool>("--stdout");
  if (output && to_stdout) {
    PrintError("-o and --stdout cannot be combined");
    return 1;
  }
  if (output && input->files.size() != 1) {
    PrintError("-o requires exactly one input file");
    return 1;
  }

  auto result = RunPipeline(*input);
  if (result.diagnostics.HasErrors()) {
    PrintDiagnostics(result.diagnostics, &result.sources);
    return 1;
  }

  if (to_stdout) {
    for (const auto& doc : result.documents) {
      fmt::print("{}", RenderHeader(doc, *input));
    }
    return 0;
  }

  auto targets = PlanOutputs(result, *input, output);
  if (!targets) {
    PrintDiagnostic(targets.error());
    return 1;
  }
  for (std::size_t i = 0; i < result.documents.size(); ++i) {
    const auto& target = (*targets)[i];
    auto written =
        WriteOutput(target, RenderHeader(result.documents[i], *input));
    if (!written) {
      PrintDiagnostic(written.error());
      return 1;
    }
    spdlog::info("wrote {}", target.string());
  }
  return 0;
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }

  auto result = RunPipeline(*input);
  PrintDiagnostics(result.diagnostics, &result.sources);
  return result.diagnostics.HasErrors() ? 1 : 0;
}

auto DumpCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }

  auto result = RunPipeline(*input);
  if (result.diagnostics.HasErrors()) {
    PrintDiagnostics(result.diagnostics, &result.sources);
    return 1;
  }

  bool separate = result.documents.size() > 1;
  for (const auto& doc : result.documents) {
    if (separate) {
      fmt::print("--- # {}\n", doc.path.string());
    }
    fmt::print("{}", codegen::WriteYaml(doc.artifacts));
  }
  return 0;
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  std::optional<std::string> name;
  if (auto n = cmd.present<std::string>("name")) {
    name = *n;
  }
  bool force = cmd.get<bool>("--force");

  fs::path project_dir;
  std::string project_name;

  if (name) {
    project_dir = fs::path(*name);
    if (project_dir.is_relative()) {
      project_dir = fs::current_path() / project_dir;
    }
    project_name = project_dir.filename().string();

    if (fs::exists(project_dir)) {
      PrintError(
          fmt::format("directory '{}' already exists", project_dir.string()));
      return 1;
    }
  } else {
    project_dir = fs::current_path();
    project_name = project_dir.filename().string();

    if (fs::exists(project_dir / kConfigFileName) && !force) {
      PrintError(
          fmt::format(
              "{} already exists (use --force to overwrite)", kConfigFileName));
      return 1;
    }
  }

  if (!fs::exists(project_dir / kSampleFileName)) {
    auto sample = WriteOutput(
        project_dir / kSampleFileName, SampleItemFile(project_name));
    if (!sample) {
      PrintDiagnostic(sample.error());
      return 1;
    }
  }

  auto toml = WriteOutput(
      project_dir / kConfigFileName,
      fmt::format(
          "[package]\n"
          "name = \"{}\"\n"
          "\n"
          "[sources]\n"
          "files = [\"{}\"]\n"
          "\n"
          "[build]\n"
          "out_dir = \"generated\"\n",
          project_name, kSampleFileName));
  if (!toml) {
    PrintDiagnostic(toml.error());
    return 1;
  }

  if (name) {
    fmt::print("Created project '{}'\n", project_name);
  } else {
    fmt::print("Initialized project '{}'\n", project_name);
  }
  return 0;
}

}  // namespace ctxerr::driver
