#pragma once

#include <filesystem>
#include <string>

#include "ctxerr/common/diagnostic/diagnostic.hpp"
#include "ctxerr/common/source_manager.hpp"
#include "ctxerr/item/raw_item.hpp"

namespace ctxerr::item {

// Structured front end: turns YAML item descriptions into RawItems.
//
// Only the shape of the document is checked here (known keys, scalar vs.
// sequence vs. map, required keys). Whether an item is a valid error
// taxonomy is decided by the generator. Every node keeps a span into the
// file registered with the SourceManager.
class YamlReader {
 public:
  explicit YamlReader(SourceManager& sources) : sources_(sources) {
  }

  auto ReadFile(const std::filesystem::path& path) -> Result<SourceDocument>;

  // `path` is only used for diagnostics
  auto ReadString(std::string path, std::string content)
      -> Result<SourceDocument>;

 private:
  SourceManager& sources_;
};

}  // namespace ctxerr::item
