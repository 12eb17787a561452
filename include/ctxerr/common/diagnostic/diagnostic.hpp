#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "ctxerr/common/source_span.hpp"

namespace ctxerr {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Item description rejected by the generator
  kHostError,  // I/O, malformed YAML, bad configuration
  kNote,       // Auxiliary message
};

// Represents missing source span (for host errors or when span unavailable)
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

// A diagnostic span: either a resolved SourceSpan or UnknownSpan
using DiagSpan = std::variant<SourceSpan, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: generation error located in an item description
  static auto Error(SourceSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = ToDiagSpan(span),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error without source location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error with source location (e.g., unknown YAML key)
  static auto HostError(SourceSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = ToDiagSpan(span),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Add a note with source location
  auto WithNote(SourceSpan span, std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = ToDiagSpan(span),
            .message = std::move(msg),
        });
    return std::move(*this);
  }

  // Add a note without source location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
        });
    return std::move(*this);
  }

 private:
  // Spans of programmatically built items carry no file
  static auto ToDiagSpan(SourceSpan span) -> DiagSpan {
    if (!span.file_id) {
      return UnknownSpan{};
    }
    return span;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace ctxerr
