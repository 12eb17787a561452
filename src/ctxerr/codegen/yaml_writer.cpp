#include "ctxerr/codegen/yaml_writer.hpp"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "ctxerr/gen/assembler.hpp"
#include "ctxerr/gen/emitter.hpp"
#include "ctxerr/model/type_definition.hpp"
#include "ctxerr/support/overloaded.hpp"

namespace ctxerr::codegen {

namespace {

// Attributes with a dedicated key in the input format
auto IsKeyedAttribute(const model::Attribute& attr) -> bool {
  return attr.name == model::kDisplayAttribute ||
         attr.name == model::kDocAttribute ||
         attr.name == model::kSourceAttribute;
}

void WriteAttributes(
    YAML::Emitter& out, const std::vector<model::Attribute>& attributes) {
  for (const auto& name : {model::kDisplayAttribute, model::kDocAttribute}) {
    if (const auto* attr = model::FindAttribute(attributes, name)) {
      out << YAML::Key << std::string(name) << YAML::Value << attr->value;
    }
  }
  bool opened = false;
  for (const auto& attr : attributes) {
    if (IsKeyedAttribute(attr)) {
      continue;
    }
    if (!opened) {
      out << YAML::Key << "attributes" << YAML::Value << YAML::BeginMap;
      opened = true;
    }
    out << YAML::Key << attr.name << YAML::Value << attr.value;
  }
  if (opened) {
    out << YAML::EndMap;
  }
}

void WriteField(YAML::Emitter& out, const model::Field& field, bool injected) {
  out << YAML::BeginMap;
  if (field.name) {
    out << YAML::Key << "name" << YAML::Value << *field.name;
  }
  out << YAML::Key << "type" << YAML::Value << field.type;
  if (field.IsSource()) {
    out << YAML::Key << "source" << YAML::Value << true;
  }
  if (injected) {
    out << YAML::Key << "injected" << YAML::Value << true;
  }
  WriteAttributes(out, field.attributes);
  out << YAML::EndMap;
}

void WriteCase(YAML::Emitter& out, const model::AugmentedCase& c) {
  out << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << c.name;
  std::visit(
      support::Overloaded{
          [&](std::monostate) {
            out << YAML::Key << "kind" << YAML::Value << "unclassified";
          },
          [&](const model::Contextual& contextual) {
            out << YAML::Key << "kind" << YAML::Value << "contextual";
            out << YAML::Key << "wraps" << YAML::Value
                << contextual.wrapped_type;
          },
          [&](const model::Opaque&) {
            out << YAML::Key << "kind" << YAML::Value << "opaque";
          },
      },
      c.kind);
  WriteAttributes(out, c.attributes);
  if (!c.fields.empty()) {
    out << YAML::Key << "fields" << YAML::Value << YAML::BeginSeq;
    for (std::size_t i = 0; i < c.fields.size(); ++i) {
      WriteField(out, c.fields[i], c.message_field == i);
    }
    out << YAML::EndSeq;
  }
  out << YAML::EndMap;
}

void WriteDefinition(
    YAML::Emitter& out, const model::AugmentedDefinition& def) {
  out << YAML::BeginMap;
  out << YAML::Key << "kind" << YAML::Value << ToString(def.shape);
  out << YAML::Key << "name" << YAML::Value << def.name;
  WriteAttributes(out, def.attributes);
  out << YAML::Key << "cases" << YAML::Value << YAML::BeginSeq;
  for (const auto& c : def.cases) {
    WriteCase(out, c);
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
}

void WriteArtifact(
    YAML::Emitter& out, const gen::GeneratedArtifact& artifact) {
  const auto& decl = artifact.Declaration();
  out << YAML::BeginMap;
  out << YAML::Key << "item" << YAML::Value << artifact.item_name;
  out << YAML::Key << "definition" << YAML::Value;
  WriteDefinition(out, artifact.Definition());

  out << YAML::Key << "capability" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << decl.name;
  out << YAML::Key << "operation" << YAML::Value << decl.operation;
  out << YAML::Key << "target" << YAML::Value << decl.target_type;
  out << YAML::Key << "realizations" << YAML::Value << YAML::BeginSeq;
  for (const auto& realization : artifact.Realizations()) {
    out << YAML::BeginMap;
    out << YAML::Key << "wraps" << YAML::Value << realization.wrapped_type;
    out << YAML::Key << "case" << YAML::Value << realization.case_name;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;

  out << YAML::EndMap;
}

}  // namespace

auto WriteYaml(const std::vector<gen::GeneratedArtifact>& artifacts)
    -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "artifacts" << YAML::Value << YAML::BeginSeq;
  for (const auto& artifact : artifacts) {
    WriteArtifact(out, artifact);
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

}  // namespace ctxerr::codegen
