#include "pipeline.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ctxerr/codegen/cpp_codegen.hpp"
#include "ctxerr/gen/generate.hpp"
#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/item/yaml_reader.hpp"
#include "input.hpp"

namespace ctxerr::driver {

auto RunPipeline(const GenerationInput& input) -> PipelineResult {
  PipelineResult result;
  item::YamlReader reader(result.sources);

  for (const auto& file : input.files) {
    spdlog::debug("reading {}", file);
    auto document = reader.ReadFile(file);
    if (!document) {
      result.diagnostics.Report(std::move(document.error()));
      continue;
    }

    GeneratedDocument generated{
        .path = file, .document = std::move(*document), .artifacts = {}};
    bool ok = true;
    for (const auto& raw : generated.document.items) {
      auto artifact = gen::Generate(raw);
      if (!artifact) {
        result.diagnostics.Report(gen::ToDiagnostic(artifact.error()));
        ok = false;
        continue;
      }
      spdlog::debug(
          "{}: generated '{}' with capability '{}'", file,
          artifact->item_name, artifact->capability_name);
      generated.artifacts.push_back(std::move(*artifact));
    }
    if (ok) {
      result.documents.push_back(std::move(generated));
    }
  }
  return result;
}

auto RenderHeader(const GeneratedDocument& doc, const GenerationInput& input)
    -> std::string {
  const auto& ns = doc.document.cpp_namespace.empty()
                       ? input.default_namespace
                       : doc.document.cpp_namespace;
  codegen::CppCodegen codegen(
      codegen::CppRenderOptions{
          .source_name = doc.path.filename().string(),
          .cpp_namespace = ns,
          .includes = doc.document.includes,
      });
  return codegen.Generate(doc.artifacts);
}

}  // namespace ctxerr::driver
