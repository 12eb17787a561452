#include "ctxerr/gen/emitter.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "ctxerr/gen/capability_registry.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

auto EmitCapability(
    const CapabilityRegistry& registry, const model::AugmentedDefinition& def)
    -> Capability {
  Capability capability{
      .declaration =
          CapabilityDeclaration{
              .name = registry.Name(),
              .operation = std::string(kContextOperation),
              .target_type = def.name,
          },
      .realizations = {},
  };

  for (const auto& entry : registry.Entries()) {
    capability.realizations.push_back(
        Realization{
            .capability = registry.Name(),
            .wrapped_type = entry.wrapped_type,
            .target_type = def.name,
            .case_name = entry.case_name,
            .shape = def.shape,
        });
    spdlog::debug(
        "{}: realization for '{}' builds {}::{}", registry.Name(),
        entry.wrapped_type, def.name, entry.case_name);
  }
  return capability;
}

}  // namespace ctxerr::gen
