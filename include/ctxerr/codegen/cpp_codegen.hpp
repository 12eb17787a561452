#pragma once

#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "ctxerr/gen/assembler.hpp"
#include "ctxerr/gen/emitter.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::codegen {

struct CppRenderOptions {
  std::string source_name;  // Shown in the "generated from" banner
  std::string cpp_namespace;
  std::vector<std::string> includes;
};

// Renders generated artifacts as one self-contained C++23 header. Fragments
// are emitted in artifact order, so each definition precedes its
// capability, which precedes the capability's realizations.
class CppCodegen {
 public:
  explicit CppCodegen(CppRenderOptions options)
      : options_(std::move(options)) {
  }

  auto Generate(const std::vector<gen::GeneratedArtifact>& artifacts)
      -> std::string;

  // Member name of a field in the rendered struct (`field<N>` if positional)
  static auto MemberName(const model::Field& field, std::size_t index)
      -> std::string;

  // Index of the field the collaborator treats as the causal source
  static auto SourceFieldIndex(const model::AugmentedCase& c)
      -> std::optional<std::size_t>;

 private:
  void EmitHeader();
  void EmitFragment(const gen::Fragment& fragment);
  void EmitEnum(const model::AugmentedDefinition& def);
  void EmitStruct(const model::AugmentedDefinition& def);
  void EmitFields(const model::AugmentedCase& c);
  void EmitEnumAccessors(const model::AugmentedDefinition& def);
  void EmitEnumDisplay(const model::AugmentedDefinition& def);
  void EmitEnumSource(const model::AugmentedDefinition& def);
  void EmitDeclaration(const gen::CapabilityDeclaration& decl);
  void EmitRealization(const gen::Realization& realization);
  void EmitDoc(const std::vector<model::Attribute>& attributes);

  // Expression rendering the case's display; `prefix` reaches the fields
  static auto DisplayExpression(
      const model::AugmentedCase& c, const std::string& prefix)
      -> std::string;

  CppRenderOptions options_;
  std::ostringstream out_;
  int indent_ = 0;

  void Indent();
  void Line(const std::string& text);
};

}  // namespace ctxerr::codegen
