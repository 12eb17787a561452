#pragma once

#include <string>
#include <variant>
#include <vector>

#include "ctxerr/gen/emitter.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

// One piece of generated output, in emission order
using Fragment = std::variant<
    model::AugmentedDefinition, CapabilityDeclaration, Realization>;

// Replacement for one annotated item: the augmented definition, then the
// capability declaration, then one realization per wrapped type.
struct GeneratedArtifact {
  std::string item_name;
  std::string capability_name;
  std::vector<Fragment> fragments;

  [[nodiscard]] auto Definition() const -> const model::AugmentedDefinition&;
  [[nodiscard]] auto Declaration() const -> const CapabilityDeclaration&;
  [[nodiscard]] auto Realizations() const -> std::vector<Realization>;
};

auto Assemble(model::AugmentedDefinition def, Capability capability)
    -> GeneratedArtifact;

}  // namespace ctxerr::gen
