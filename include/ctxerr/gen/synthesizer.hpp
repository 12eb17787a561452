#pragma once

#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {

// Builds the AugmentedCase for a classified case.
//
// Contextual: fields become [wrapped field marked as source, message of type
// std::string], followed by a display attribute rendering the message
// verbatim. The message is named when the wrapped field is named and
// positional otherwise, so it is always the second field.
// Opaque: an exact copy of the input.
//
// Validation already happened in the classifier; an unclassified case is a
// generator bug and throws common::InternalError.
auto Synthesize(const model::Case& c) -> model::AugmentedCase;

auto SynthesizeDefinition(const model::TypeDefinition& def)
    -> model::AugmentedDefinition;

}  // namespace ctxerr::gen
