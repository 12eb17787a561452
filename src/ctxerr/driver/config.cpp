#include "config.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "ctxerr/common/diagnostic/diagnostic.hpp"
#include "ctxerr/common/identifier.hpp"

namespace ctxerr::driver {

namespace fs = std::filesystem;

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [package] section
  auto package = tbl["package"];
  if (!package) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: missing [package] section", config_path.string())));
  }

  auto name = package["name"].value<std::string>();
  if (!name) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: missing required field 'package.name'",
                config_path.string())));
  }
  config.name = *name;

  if (auto ns = package["namespace"].value<std::string>()) {
    if (!common::IsNamespace(*ns)) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "{}: 'package.namespace' is not a valid namespace: '{}'",
                  config_path.string(), *ns)));
    }
    config.cpp_namespace = *ns;
  }

  // [sources] section
  auto sources = tbl["sources"];
  if (!sources) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: missing [sources] section", config_path.string())));
  }

  auto* files_arr = sources["files"].as_array();
  if (files_arr == nullptr || files_arr->empty()) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: missing or empty 'sources.files'", config_path.string())));
  }
  for (const auto& elem : *files_arr) {
    auto str = elem.value<std::string>();
    if (!str) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "{}: 'sources.files' must hold strings",
                  config_path.string())));
    }
    // Resolve relative paths against config directory
    fs::path file_path = *str;
    if (file_path.is_relative()) {
      file_path = config.root_dir / file_path;
    }
    if (!fs::exists(file_path)) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "source file not found: {} (listed in {})", *str,
                  kConfigFileName)));
    }
    config.files.push_back(file_path.string());
  }

  // [build] section (optional)
  if (auto build = tbl["build"]) {
    if (auto out_dir = build["out_dir"].value<std::string>()) {
      config.out_dir = *out_dir;
    }
  }
  if (fs::path(config.out_dir).is_relative()) {
    config.out_dir = (config.root_dir / config.out_dir).string();
  }

  return config;
}

}  // namespace ctxerr::driver
