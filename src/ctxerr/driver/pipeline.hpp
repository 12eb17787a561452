#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "ctxerr/common/diagnostic/diagnostic_sink.hpp"
#include "ctxerr/common/source_manager.hpp"
#include "ctxerr/gen/assembler.hpp"
#include "ctxerr/item/raw_item.hpp"
#include "input.hpp"

namespace ctxerr::driver {

struct GeneratedDocument {
  std::filesystem::path path;
  item::SourceDocument document;
  // One per item, in document order
  std::vector<gen::GeneratedArtifact> artifacts;
};

// Everything one command run produced. Documents are only listed when every
// item in them generated; diagnostics point into `sources`.
struct PipelineResult {
  SourceManager sources;
  DiagnosticSink diagnostics;
  std::vector<GeneratedDocument> documents;
};

// Read every input file and run the generator on each item. Items are
// independent: a failing item is reported and the remaining ones still run.
auto RunPipeline(const GenerationInput& input) -> PipelineResult;

// Render one document as a C++ header
auto RenderHeader(const GeneratedDocument& doc, const GenerationInput& input)
    -> std::string;

}  // namespace ctxerr::driver
