#include "ctxerr/gen/capability_registry.hpp"

#include <expected>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

#include "ctxerr/common/identifier.hpp"
#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

auto CapabilityRegistry::Register(const model::AugmentedCase& augmented)
    -> std::expected<void, GenerationError> {
  const auto* contextual = std::get_if<model::Contextual>(&augmented.kind);
  if (contextual == nullptr) {
    return {};
  }

  auto key = common::NormalizeTypeSpelling(contextual->wrapped_type);
  auto [it, inserted] = by_wrapped_type_.try_emplace(key, entries_.size());
  if (!inserted) {
    const RegistryEntry& first = entries_[it->second];
    return std::unexpected(
        DuplicateWrappedType{
            .wrapped_type = key,
            .first_case = first.case_name,
            .second_case = augmented.name,
            .capability_name = name_,
            .first_span = first.span,
            .second_span = augmented.span,
        });
  }

  entries_.push_back(
      RegistryEntry{
          .wrapped_type = key,
          .case_name = augmented.name,
          .span = augmented.span,
      });
  spdlog::debug("{}: '{}' -> {}", name_, key, augmented.name);
  return {};
}

auto CapabilityRegistry::Find(std::string_view wrapped_type) const
    -> const RegistryEntry* {
  auto it = by_wrapped_type_.find(common::NormalizeTypeSpelling(wrapped_type));
  if (it == by_wrapped_type_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

}  // namespace ctxerr::gen
