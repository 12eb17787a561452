#include "ctxerr/gen/generate.hpp"

#include <expected>
#include <utility>

#include <spdlog/spdlog.h>

#include "ctxerr/gen/assembler.hpp"
#include "ctxerr/gen/capability_registry.hpp"
#include "ctxerr/gen/classifier.hpp"
#include "ctxerr/gen/emitter.hpp"
#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/gen/synthesizer.hpp"
#include "ctxerr/model/builder.hpp"

namespace ctxerr::gen {

auto Generate(const item::RawItem& item) -> GenResult<GeneratedArtifact> {
  auto def = model::BuildTypeDefinition(item);
  if (!def) {
    return std::unexpected(std::move(def.error()));
  }
  return Generate(*def);
}

auto Generate(const model::TypeDefinition& def)
    -> GenResult<GeneratedArtifact> {
  auto classified = Classify(def);
  if (!classified) {
    return std::unexpected(std::move(classified.error()));
  }

  auto augmented = SynthesizeDefinition(*classified);

  CapabilityRegistry registry(classified->CapabilityName());
  for (const auto& c : augmented.cases) {
    auto registered = registry.Register(c);
    if (!registered) {
      return std::unexpected(std::move(registered.error()));
    }
  }

  auto capability = EmitCapability(registry, augmented);
  spdlog::debug(
      "generated '{}': {} case(s), capability '{}' with {} realization(s)",
      augmented.name, augmented.cases.size(), capability.declaration.name,
      capability.realizations.size());
  return Assemble(std::move(augmented), std::move(capability));
}

}  // namespace ctxerr::gen
