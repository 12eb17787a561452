#include "ctxerr/gen/assembler.hpp"

#include <utility>
#include <variant>
#include <vector>

#include "ctxerr/common/internal_error.hpp"
#include "ctxerr/gen/emitter.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

namespace {

template <typename T>
auto FindFragment(const std::vector<Fragment>& fragments, const char* what)
    -> const T& {
  for (const auto& fragment : fragments) {
    if (const auto* found = std::get_if<T>(&fragment)) {
      return *found;
    }
  }
  common::ThrowInternalError("GeneratedArtifact", what);
}

}  // namespace

auto GeneratedArtifact::Definition() const
    -> const model::AugmentedDefinition& {
  return FindFragment<model::AugmentedDefinition>(
      fragments, "artifact has no definition fragment");
}

auto GeneratedArtifact::Declaration() const -> const CapabilityDeclaration& {
  return FindFragment<CapabilityDeclaration>(
      fragments, "artifact has no capability declaration");
}

auto GeneratedArtifact::Realizations() const -> std::vector<Realization> {
  std::vector<Realization> result;
  for (const auto& fragment : fragments) {
    if (const auto* r = std::get_if<Realization>(&fragment)) {
      result.push_back(*r);
    }
  }
  return result;
}

auto Assemble(model::AugmentedDefinition def, Capability capability)
    -> GeneratedArtifact {
  GeneratedArtifact artifact{
      .item_name = def.name,
      .capability_name = capability.declaration.name,
      .fragments = {},
  };
  artifact.fragments.reserve(2 + capability.realizations.size());
  artifact.fragments.emplace_back(std::move(def));
  artifact.fragments.emplace_back(std::move(capability.declaration));
  for (auto& realization : capability.realizations) {
    artifact.fragments.emplace_back(std::move(realization));
  }
  return artifact;
}

}  // namespace ctxerr::gen
