#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ctxerr/common/diagnostic/diagnostic.hpp"

namespace ctxerr::driver {

inline constexpr const char* kConfigFileName = "ctxerr.toml";

struct ProjectConfig {
  std::string name;
  // Namespace for documents that do not set their own
  std::string cpp_namespace;
  std::vector<std::string> files;
  std::string out_dir = "generated";

  // Directory where ctxerr.toml was found
  std::filesystem::path root_dir;
};

// Search for ctxerr.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse ctxerr.toml.
// Returns error Diagnostic on parse errors or missing required fields.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace ctxerr::driver
