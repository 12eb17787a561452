#include "ctxerr/gen/classifier.hpp"

#include <expected>
#include <utility>

#include <spdlog/spdlog.h>

#include "ctxerr/common/identifier.hpp"
#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

auto ClassifyCase(const model::Case& c) -> GenResult<model::Case> {
  model::Case result = c;

  if (!c.contextual) {
    result.kind = model::Opaque{};
    return result;
  }

  if (c.fields.size() != 1) {
    return std::unexpected(
        InvalidContextualCase{
            .case_name = c.name,
            .rule = ContextualRule::kExactlyOneField,
            .field_count = c.fields.size(),
            .span = c.span,
        });
  }
  if (c.DisplayTemplate()) {
    return std::unexpected(
        InvalidContextualCase{
            .case_name = c.name,
            .rule = ContextualRule::kNoDisplayTemplate,
            .field_count = c.fields.size(),
            .span = c.span,
        });
  }

  result.kind = model::Contextual{
      .wrapped_type = common::NormalizeTypeSpelling(c.fields.front().type)};
  return result;
}

auto Classify(const model::TypeDefinition& def)
    -> GenResult<model::TypeDefinition> {
  model::TypeDefinition result = def;
  for (auto& c : result.cases) {
    auto classified = ClassifyCase(c);
    if (!classified) {
      return std::unexpected(std::move(classified.error()));
    }
    c = std::move(*classified);

    if (const auto* ctx = std::get_if<model::Contextual>(&c.kind)) {
      spdlog::debug(
          "{}::{}: contextual, wraps '{}'", def.name, c.name,
          ctx->wrapped_type);
    } else {
      spdlog::debug("{}::{}: opaque", def.name, c.name);
    }
  }
  return result;
}

}  // namespace ctxerr::gen
