#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <variant>

#include "ctxerr/common/diagnostic/diagnostic.hpp"
#include "ctxerr/common/source_span.hpp"

namespace ctxerr::gen {

// Rule broken by a case marked contextual
enum class ContextualRule : uint8_t {
  kExactlyOneField,    // Must wrap exactly one field
  kNoDisplayTemplate,  // Display is synthesized, a custom one is rejected
};

auto ToString(ContextualRule rule) -> const char*;

// Item is not an enum with cases or a struct, or is structurally invalid
struct MalformedItem {
  std::string item_name;
  std::string reason;
  SourceSpan span;

  auto operator==(const MalformedItem&) const -> bool = default;
};

struct InvalidContextualCase {
  std::string case_name;
  ContextualRule rule;
  std::size_t field_count = 0;
  SourceSpan span;

  auto operator==(const InvalidContextualCase&) const -> bool = default;
};

// Two contextual cases in one capability scope wrap the same failure type
struct DuplicateWrappedType {
  std::string wrapped_type;
  std::string first_case;
  std::string second_case;
  std::string capability_name;
  SourceSpan first_span;
  SourceSpan second_span;

  auto operator==(const DuplicateWrappedType&) const -> bool = default;
};

using GenerationError =
    std::variant<MalformedItem, InvalidContextualCase, DuplicateWrappedType>;

template <typename T>
using GenResult = std::expected<T, GenerationError>;

// One-line description, as used for the diagnostic's primary message
auto Describe(const GenerationError& error) -> std::string;

// Generation-time diagnostic pointing at the offending item or case
auto ToDiagnostic(const GenerationError& error) -> Diagnostic;

}  // namespace ctxerr::gen
