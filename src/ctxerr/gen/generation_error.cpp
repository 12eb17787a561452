#include "ctxerr/gen/generation_error.hpp"

#include <string>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "ctxerr/support/overloaded.hpp"

namespace ctxerr::gen {

auto ToString(ContextualRule rule) -> const char* {
  switch (rule) {
    case ContextualRule::kExactlyOneField:
      return "a contextual case must wrap exactly one field";
    case ContextualRule::kNoDisplayTemplate:
      return "a contextual case cannot declare its own display template";
  }
  return "unknown rule";
}

auto Describe(const GenerationError& error) -> std::string {
  return std::visit(
      support::Overloaded{
          [](const MalformedItem& e) {
            return fmt::format(
                "malformed item '{}': {}", e.item_name, e.reason);
          },
          [](const InvalidContextualCase& e) {
            if (e.rule == ContextualRule::kExactlyOneField) {
              return fmt::format(
                  "invalid contextual case '{}': {} (found {})", e.case_name,
                  ToString(e.rule), e.field_count);
            }
            return fmt::format(
                "invalid contextual case '{}': {}", e.case_name,
                ToString(e.rule));
          },
          [](const DuplicateWrappedType& e) {
            return fmt::format(
                "duplicate wrapped type '{}' in capability '{}': cases '{}' "
                "and '{}' both wrap it",
                e.wrapped_type, e.capability_name, e.first_case,
                e.second_case);
          },
      },
      error);
}

auto ToDiagnostic(const GenerationError& error) -> Diagnostic {
  return std::visit(
      support::Overloaded{
          [&](const MalformedItem& e) {
            return Diagnostic::Error(e.span, Describe(error));
          },
          [&](const InvalidContextualCase& e) {
            auto diag = Diagnostic::Error(e.span, Describe(error));
            if (e.rule == ContextualRule::kNoDisplayTemplate) {
              return std::move(diag).WithNote(
                  "the display of a contextual case renders its message");
            }
            return diag;
          },
          [&](const DuplicateWrappedType& e) {
            return Diagnostic::Error(e.second_span, Describe(error))
                .WithNote(
                    e.first_span,
                    fmt::format("'{}' first wrapped here", e.wrapped_type))
                .WithNote(
                    "a failure type can be wrapped by at most one contextual "
                    "case per capability");
          },
      },
      error);
}

}  // namespace ctxerr::gen
