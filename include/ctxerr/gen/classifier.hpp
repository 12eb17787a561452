#pragma once

#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

// Assigns Contextual{wrapped_type} or Opaque to one case.
// A contextual case must have exactly one field (checked first) and no
// display template; otherwise InvalidContextualCase names the broken rule.
// Non-contextual cases come back with fields and attributes untouched, so
// classifying a classified case is a no-op.
auto ClassifyCase(const model::Case& c) -> GenResult<model::Case>;

// Classifies every case in declaration order; aborts on the first failure.
auto Classify(const model::TypeDefinition& def)
    -> GenResult<model::TypeDefinition>;

}  // namespace ctxerr::gen
