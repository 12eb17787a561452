#pragma once

#include <argparse/argparse.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "ctxerr/common/diagnostic/diagnostic.hpp"

namespace ctxerr::driver {

// What one command works on, after merging the command line with the
// project configuration
struct GenerationInput {
  std::vector<std::string> files;
  // Used for documents that do not name a namespace
  std::string default_namespace;
  std::filesystem::path out_dir = ".";
};

// Output file stem for an item description:
// "fetch_error.ctxerr.yaml" -> "fetch_error"
auto OutputStem(const std::filesystem::path& path) -> std::string;

// Load ctxerr.toml if one is found above the working directory.
auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>>;

// Merge CLI arguments and optional config into a GenerationInput.
// Files on the command line replace the configured list.
auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config) -> Result<GenerationInput>;

// LoadOptionalConfig followed by BuildInput
auto PrepareInput(const argparse::ArgumentParser& cmd)
    -> Result<GenerationInput>;

}  // namespace ctxerr::driver
