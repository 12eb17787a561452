#include "ctxerr/common/source_span.hpp"

#include <fmt/core.h>

namespace ctxerr {

auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::string {
  if (!span.file_id) {
    return "";
  }

  const FileInfo* file = mgr.GetFile(span.file_id);
  if (file == nullptr) {
    return "";
  }

  auto pos = SourceManager::Locate(file->content, span.begin);
  return fmt::format("{}:{}:{}", file->path, pos.line, pos.column);
}

}  // namespace ctxerr
