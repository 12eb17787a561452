#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ctxerr/gen/capability_registry.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

// Name of the single generic operation every capability declares
inline constexpr std::string_view kContextOperation = "Context";

// Abstract side of the capability: one generic operation taking a
// stringifiable context and returning the success value or the target
// error, parameterized over the associated success type `Ok`.
struct CapabilityDeclaration {
  std::string name;
  std::string operation;
  std::string target_type;

  auto operator==(const CapabilityDeclaration&) const -> bool = default;
};

// Concrete side for one wrapped type: on failure the original failure and
// the stringified context build `case_name` positionally; success passes
// through unchanged.
struct Realization {
  std::string capability;
  std::string wrapped_type;
  std::string target_type;
  std::string case_name;
  model::ItemShape shape = model::ItemShape::kEnum;

  auto operator==(const Realization&) const -> bool = default;
};

struct Capability {
  CapabilityDeclaration declaration;
  std::vector<Realization> realizations;  // Registry order
};

auto EmitCapability(
    const CapabilityRegistry& registry, const model::AugmentedDefinition& def)
    -> Capability;

}  // namespace ctxerr::gen
