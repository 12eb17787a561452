#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ctxerr {

struct FileId {
  uint32_t value = 0;

  explicit operator bool() const {
    return value != 0;
  }
  auto operator==(const FileId&) const -> bool = default;
};

inline constexpr FileId kInvalidFileId{};

struct FileInfo {
  std::string path;
  std::string content;
};

// 1-based position inside a file
struct LineColumn {
  uint32_t line = 1;
  uint32_t column = 1;
};

// Owns the text of every item description read during one driver run.
// Spans refer to files by FileId; ids stay valid for the manager's lifetime.
class SourceManager {
 public:
  auto AddFile(std::string path, std::string content) -> FileId {
    auto value = static_cast<uint32_t>(files_.size() + 1);
    files_.push_back(
        FileInfo{.path = std::move(path), .content = std::move(content)});
    return FileId{.value = value};
  }

  [[nodiscard]] auto GetFile(FileId id) const -> const FileInfo* {
    if (!id || id.value > files_.size()) {
      return nullptr;
    }
    return &files_[id.value - 1];
  }

  // Line and column of a byte offset. Offsets past the end clamp to the end.
  [[nodiscard]] static auto Locate(std::string_view content, uint32_t offset)
      -> LineColumn {
    LineColumn pos;
    for (uint32_t i = 0; i < offset && i < content.size(); ++i) {
      if (content[i] == '\n') {
        ++pos.line;
        pos.column = 1;
      } else {
        ++pos.column;
      }
    }
    return pos;
  }

 private:
  std::vector<FileInfo> files_;
};

}  // namespace ctxerr
