#pragma once

#include <string>
#include <vector>

#include "ctxerr/gen/assembler.hpp"

namespace ctxerr::codegen {

// Renders artifacts in the structural form the front end reads, extended
// with what generation decided: the kind of each case, the injected message
// field, the capability and its realizations. Used by `ctxerr dump`.
auto WriteYaml(const std::vector<gen::GeneratedArtifact>& artifacts)
    -> std::string;

}  // namespace ctxerr::codegen
