#pragma once

#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/item/raw_item.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::model {

// Builds the immutable TypeDefinition for one annotated item.
//
// An enum contributes one Case per variant; a struct becomes a single
// implicit Case named after the struct and carrying the struct's
// attributes. The contextual marker is lifted out of the attribute list into
// Case::contextual. Cases come out unclassified (kind == std::monostate).
//
// Fails with MalformedItem when the item is neither an enum with at least
// one case nor a struct, or when names, fields or generator arguments are
// structurally invalid.
auto BuildTypeDefinition(const item::RawItem& item)
    -> gen::GenResult<TypeDefinition>;

}  // namespace ctxerr::model
