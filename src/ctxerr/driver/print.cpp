#include "print.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "ctxerr/common/diagnostic/diagnostic.hpp"
#include "ctxerr/common/diagnostic/diagnostic_sink.hpp"
#include "ctxerr/common/source_manager.hpp"
#include "ctxerr/common/source_span.hpp"
#include "ctxerr/support/overloaded.hpp"

namespace ctxerr::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

// Source line and caret marker under the span's first line
void PrintSourceExcerpt(const SourceSpan& span, const FileInfo& file) {
  const std::string& content = file.content;
  if (span.begin > content.size()) {
    return;
  }

  // Find line boundaries and compute line number
  uint32_t line_start = 0;
  uint32_t line_num = 1;
  for (uint32_t i = 0; i < span.begin; ++i) {
    if (content[i] == '\n') {
      line_start = i + 1;
      ++line_num;
    }
  }
  auto line_end_pos = content.find('\n', span.begin);
  uint32_t line_end = (line_end_pos == std::string::npos)
                          ? static_cast<uint32_t>(content.size())
                          : static_cast<uint32_t>(line_end_pos);

  std::string source_line = content.substr(line_start, line_end - line_start);
  std::string line_num_str = std::to_string(line_num);
  size_t field_width = std::max(line_num_str.size(), size_t{4});
  std::string num_field(field_width - line_num_str.size(), ' ');
  num_field += line_num_str;
  std::string blank_field(field_width, ' ');

  constexpr auto kGutterStyle = fmt::fg(fmt::terminal_color::white);

  fmt::print(
      stderr, " {} {}\n", fmt::styled(num_field + " |", kGutterStyle),
      source_line);

  // Clamp the marker to the current line
  uint32_t span_end = (span.end > span.begin) ? span.end : span.begin + 1;
  span_end = std::min(span_end, line_end);
  uint32_t span_width = span_end > span.begin ? span_end - span.begin : 1;

  std::string marker = "^" + std::string(span_width - 1, '~');
  constexpr auto kMarkerStyle = fmt::fg(fmt::terminal_color::green);

  fmt::print(
      stderr, " {} {}{}\n", fmt::styled(blank_field + " |", kGutterStyle),
      std::string(span.begin - line_start, ' '),
      fmt::styled(marker, kMarkerStyle));
}

// Print a single DiagItem with optional source context
void PrintDiagItem(
    const DiagItem& item, const SourceManager* sources, bool is_primary) {
  const char* kind_str = DiagKindToString(item.kind);
  fmt::text_style kind_style = DiagKindToStyle(item.kind);

  std::string location;
  std::optional<SourceSpan> span_opt;

  std::visit(
      support::Overloaded{
          [&](const SourceSpan& span) {
            span_opt = span;
            if (sources != nullptr) {
              location = FormatSourceLocation(span, *sources);
            }
          },
          [&](UnknownSpan) {
            // No location available
          },
      },
      item.span);

  auto message_style = is_primary ? fmt::emphasis::bold : fmt::text_style{};
  if (!location.empty()) {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled(location, fmt::emphasis::bold),
        fmt::styled(kind_str, kind_style),
        fmt::styled(item.message, message_style));
  } else {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled("ctxerr", kToolStyle),
        fmt::styled(kind_str, kind_style),
        fmt::styled(item.message, message_style));
  }

  if (!is_primary || !span_opt || sources == nullptr) {
    return;
  }
  if (const FileInfo* file = sources->GetFile(span_opt->file_id)) {
    PrintSourceExcerpt(*span_opt, *file);
  }
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("ctxerr", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, nullptr, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, nullptr, false);
  }
}

void PrintDiagnostics(
    const DiagnosticSink& sink, const SourceManager* sources) {
  for (const auto& diag : sink.GetDiagnostics()) {
    PrintDiagItem(diag.primary, sources, true);
    for (const auto& note : diag.notes) {
      PrintDiagItem(note, sources, false);
    }
  }

  auto error_count = sink.ErrorCount();
  if (error_count > 0) {
    fmt::print(
        stderr, "{} error{} generated.\n", error_count,
        error_count == 1 ? "" : "s");
  }
}

}  // namespace ctxerr::driver
