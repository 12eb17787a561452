#pragma once

#include "ctxerr/gen/assembler.hpp"
#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/item/raw_item.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

// Runs Build -> Classify -> Synthesize -> Register -> Emit -> Assemble for
// one annotated item. Pure: no I/O and no state shared between calls. Any
// failure aborts the whole item; nothing partial is returned.
auto Generate(const item::RawItem& item) -> GenResult<GeneratedArtifact>;

// Same pipeline starting from an already built definition
auto Generate(const model::TypeDefinition& def) -> GenResult<GeneratedArtifact>;

}  // namespace ctxerr::gen
