#include "ctxerr/gen/synthesizer.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "ctxerr/common/internal_error.hpp"
#include "ctxerr/model/type_definition.hpp"
#include "ctxerr/support/overloaded.hpp"

namespace ctxerr::gen {

namespace {

constexpr std::string_view kMessageFieldName = "message";
constexpr std::string_view kFallbackMessageFieldName = "context_message";

auto CopyCase(const model::Case& c) -> model::AugmentedCase {
  return model::AugmentedCase{
      .name = c.name,
      .fields = c.fields,
      .attributes = c.attributes,
      .kind = c.kind,
      .message_field = std::nullopt,
      .span = c.span,
  };
}

auto AugmentContextual(const model::Case& c) -> model::AugmentedCase {
  model::AugmentedCase result = CopyCase(c);

  model::Field& wrapped = result.fields.front();
  if (!wrapped.IsSource()) {
    wrapped.attributes.push_back(
        model::Attribute{
            .name = std::string(model::kSourceAttribute),
            .value = {},
            .span = wrapped.span});
  }

  model::Field message{
      .name = std::nullopt,
      .type = std::string(model::kMessageFieldType),
      .attributes = {},
      .span = c.span};
  std::string display;
  if (wrapped.name) {
    message.name = std::string(
        *wrapped.name == kMessageFieldName ? kFallbackMessageFieldName
                                           : kMessageFieldName);
    display = fmt::format("{{{}}}", *message.name);
  } else {
    display = "{1}";
  }
  result.fields.push_back(std::move(message));
  result.message_field = result.fields.size() - 1;

  result.attributes.push_back(
      model::Attribute{
          .name = std::string(model::kDisplayAttribute),
          .value = std::move(display),
          .span = c.span});
  return result;
}

}  // namespace

auto Synthesize(const model::Case& c) -> model::AugmentedCase {
  return std::visit(
      support::Overloaded{
          [&](std::monostate) -> model::AugmentedCase {
            common::ThrowInternalError(
                "Synthesize",
                fmt::format(
                    "case '{}' reached synthesis unclassified", c.name));
          },
          [&](const model::Contextual&) { return AugmentContextual(c); },
          [&](const model::Opaque&) { return CopyCase(c); },
      },
      c.kind);
}

auto SynthesizeDefinition(const model::TypeDefinition& def)
    -> model::AugmentedDefinition {
  model::AugmentedDefinition result{
      .name = def.name,
      .shape = def.shape,
      .cases = {},
      .attributes = def.attributes,
      .span = def.span,
  };
  result.cases.reserve(def.cases.size());
  for (const auto& c : def.cases) {
    result.cases.push_back(Synthesize(c));
    if (result.cases.back().IsContextual()) {
      spdlog::debug("{}::{}: injected message field", def.name, c.name);
    }
  }
  return result;
}

}  // namespace ctxerr::gen
