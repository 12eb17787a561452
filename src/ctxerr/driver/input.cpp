#include "input.hpp"

#include <array>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "argparse/argparse.hpp"
#include "config.hpp"
#include "ctxerr/common/diagnostic/diagnostic.hpp"

namespace ctxerr::driver {

namespace {

namespace fs = std::filesystem;

// Longest first
constexpr std::array<std::string_view, 3> kInputSuffixes = {
    ".ctxerr.yaml", ".yaml", ".yml"};

}  // namespace

auto OutputStem(const fs::path& path) -> std::string {
  std::string name = path.filename().string();
  for (auto suffix : kInputSuffixes) {
    if (name.size() > suffix.size() && name.ends_with(suffix)) {
      return name.substr(0, name.size() - suffix.size());
    }
  }
  return path.stem().string();
}

auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>> {
  auto config_path = FindConfig();
  if (!config_path) {
    return std::nullopt;
  }
  spdlog::debug("using project file {}", config_path->string());
  auto config = LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return std::optional<ProjectConfig>(std::move(*config));
}

auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config) -> Result<GenerationInput> {
  GenerationInput input;

  // Files: CLI replaces config entirely
  if (auto files = cmd.present<std::vector<std::string>>("files")) {
    input.files = *files;
  } else if (config) {
    input.files = config->files;
  }

  if (input.files.empty()) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "no input files (pass item descriptions or create {})",
                kConfigFileName)));
  }

  if (config) {
    input.default_namespace = config->cpp_namespace;
    input.out_dir = config->out_dir;
    spdlog::debug(
        "project '{}': {} file(s)", config->name, config->files.size());
  }
  return input;
}

auto PrepareInput(const argparse::ArgumentParser& cmd)
    -> Result<GenerationInput> {
  auto config = LoadOptionalConfig();
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return BuildInput(cmd, *config);
}

}  // namespace ctxerr::driver
