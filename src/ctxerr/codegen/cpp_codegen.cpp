#include "ctxerr/codegen/cpp_codegen.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "ctxerr/gen/assembler.hpp"
#include "ctxerr/gen/emitter.hpp"
#include "ctxerr/model/type_definition.hpp"
#include "ctxerr/support/overloaded.hpp"

namespace ctxerr::codegen {

namespace {

constexpr std::string_view kSupport = "::ctxerr::support::";

auto Support(std::string_view name) -> std::string {
  return std::string(kSupport) + std::string(name);
}

auto EscapeCppString(std::string_view text) -> std::string {
  std::string result = "\"";
  for (char c : text) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\t':
        result += "\\t";
        break;
      case '\r':
        result += "\\r";
        break;
      default:
        result += c;
        break;
    }
  }
  result += "\"";
  return result;
}

auto IncludeLine(const std::string& include) -> std::string {
  if (include.starts_with('<') || include.starts_with('"')) {
    return "#include " + include;
  }
  return "#include \"" + include + "\"";
}

auto TargetType(const gen::Realization& realization) -> std::string {
  if (realization.shape == model::ItemShape::kStruct) {
    return realization.target_type;
  }
  return realization.target_type + "::" + realization.case_name;
}

}  // namespace

auto CppCodegen::MemberName(const model::Field& field, std::size_t index)
    -> std::string {
  if (field.name) {
    return *field.name;
  }
  return fmt::format("field{}", index);
}

auto CppCodegen::SourceFieldIndex(const model::AugmentedCase& c)
    -> std::optional<std::size_t> {
  for (std::size_t i = 0; i < c.fields.size(); ++i) {
    if (c.fields[i].IsSource()) {
      return i;
    }
  }
  for (std::size_t i = 0; i < c.fields.size(); ++i) {
    if (c.fields[i].name == model::kSourceAttribute) {
      return i;
    }
  }
  return std::nullopt;
}

auto CppCodegen::Generate(const std::vector<gen::GeneratedArtifact>& artifacts)
    -> std::string {
  out_.str("");
  indent_ = 0;

  EmitHeader();

  if (!options_.cpp_namespace.empty()) {
    Line("namespace " + options_.cpp_namespace + " {");
    Line("");
  }
  for (const auto& artifact : artifacts) {
    for (const auto& fragment : artifact.fragments) {
      EmitFragment(fragment);
    }
  }
  if (!options_.cpp_namespace.empty()) {
    Line("}  // namespace " + options_.cpp_namespace);
  }
  return out_.str();
}

void CppCodegen::EmitHeader() {
  if (options_.source_name.empty()) {
    Line("// Generated by ctxerr. Do not edit.");
  } else {
    Line(
        "// Generated by ctxerr from " + options_.source_name +
        ". Do not edit.");
  }
  Line("#pragma once");
  Line("");
  for (const char* header :
       {"<expected>", "<string>", "<string_view>", "<type_traits>",
        "<utility>", "<variant>"}) {
    Line(std::string("#include ") + header);
  }
  Line("");
  Line("#include <ctxerr/support/support.hpp>");
  if (!options_.includes.empty()) {
    Line("");
    for (const auto& include : options_.includes) {
      Line(IncludeLine(include));
    }
  }
  Line("");
}

void CppCodegen::EmitFragment(const gen::Fragment& fragment) {
  std::visit(
      support::Overloaded{
          [&](const model::AugmentedDefinition& def) {
            if (def.shape == model::ItemShape::kEnum) {
              EmitEnum(def);
            } else {
              EmitStruct(def);
            }
          },
          [&](const gen::CapabilityDeclaration& decl) {
            EmitDeclaration(decl);
          },
          [&](const gen::Realization& realization) {
            EmitRealization(realization);
          },
      },
      fragment);
  Line("");
}

void CppCodegen::EmitDoc(const std::vector<model::Attribute>& attributes) {
  const auto* doc = model::FindAttribute(attributes, model::kDocAttribute);
  if (doc == nullptr) {
    return;
  }
  std::string_view text = doc->value;
  while (!text.empty()) {
    auto end = text.find('\n');
    auto line = text.substr(0, end);
    Line(line.empty() ? "//" : "// " + std::string(line));
    if (end == std::string_view::npos) {
      break;
    }
    text.remove_prefix(end + 1);
  }
}

void CppCodegen::EmitFields(const model::AugmentedCase& c) {
  for (std::size_t i = 0; i < c.fields.size(); ++i) {
    const auto& field = c.fields[i];
    EmitDoc(field.attributes);
    Line(field.type + " " + MemberName(field, i) + ";");
  }
}

auto CppCodegen::DisplayExpression(
    const model::AugmentedCase& c, const std::string& prefix) -> std::string {
  const auto* tmpl =
      model::FindAttribute(c.attributes, model::kDisplayAttribute);
  if (tmpl == nullptr) {
    return EscapeCppString(c.name);
  }

  std::string expr = Support("Render") + "(" + EscapeCppString(tmpl->value);
  for (std::size_t i = 0; i < c.fields.size(); ++i) {
    const auto& field = c.fields[i];
    auto arg = Support("Arg") + "(" + prefix + MemberName(field, i) + ")";
    if (field.name) {
      expr += ", fmt::arg(" + EscapeCppString(*field.name) + ", " + arg + ")";
    } else {
      expr += ", " + arg;
    }
  }
  expr += ")";
  return expr;
}

void CppCodegen::EmitEnum(const model::AugmentedDefinition& def) {
  EmitDoc(def.attributes);
  Line("class " + def.name + " {");
  Line(" public:");
  indent_++;
  for (const auto& c : def.cases) {
    EmitDoc(c.attributes);
    Line("struct " + c.name + " {");
    indent_++;
    EmitFields(c);
    indent_--;
    Line("};");
    Line("");
  }

  std::string alternatives;
  for (const auto& c : def.cases) {
    alternatives += (alternatives.empty() ? "" : ", ") + c.name;
  }
  Line("using Variant = std::variant<" + alternatives + ">;");
  Line("");

  for (const auto& c : def.cases) {
    Line(
        def.name + "(" + c.name +
        " value)  // NOLINT(google-explicit-constructor)");
    Line("    : value_(std::move(value)) {");
    Line("}");
  }
  Line("");

  EmitEnumAccessors(def);
  EmitEnumDisplay(def);
  EmitEnumSource(def);

  indent_--;
  Line(" private:");
  indent_++;
  Line("Variant value_;");
  indent_--;
  Line("};");
}

void CppCodegen::EmitEnumAccessors(const model::AugmentedDefinition& def) {
  Line("[[nodiscard]] auto Get() const -> const Variant& {");
  Line("  return value_;");
  Line("}");
  Line("");
  Line("template <typename Case>");
  Line("[[nodiscard]] auto Is() const -> bool {");
  Line("  return std::holds_alternative<Case>(value_);");
  Line("}");
  Line("");
  Line("template <typename Case>");
  Line("[[nodiscard]] auto As() const -> const Case* {");
  Line("  return std::get_if<Case>(&value_);");
  Line("}");
  Line("");

  Line("[[nodiscard]] auto CaseName() const -> std::string_view {");
  indent_++;
  Line("return std::visit(");
  Line("    " + Support("Overloaded") + "{");
  indent_ += 3;
  for (const auto& c : def.cases) {
    Line(
        "[](const " + c.name + "&) -> std::string_view { return " +
        EscapeCppString(c.name) + "; },");
  }
  indent_ -= 3;
  Line("    },");
  Line("    value_);");
  indent_--;
  Line("}");
  Line("");
}

void CppCodegen::EmitEnumDisplay(const model::AugmentedDefinition& def) {
  Line("[[nodiscard]] auto Display() const -> std::string {");
  indent_++;
  Line("return std::visit(");
  Line("    " + Support("Overloaded") + "{");
  indent_ += 3;
  for (const auto& c : def.cases) {
    auto expr = DisplayExpression(c, "e.");
    auto param = expr.starts_with('"') ? "&" : "& e";
    Line("[](const " + c.name + param + ") -> std::string {");
    Line("  return " + expr + ";");
    Line("},");
  }
  indent_ -= 3;
  Line("    },");
  Line("    value_);");
  indent_--;
  Line("}");
  Line("");
}

void CppCodegen::EmitEnumSource(const model::AugmentedDefinition& def) {
  Line("[[nodiscard]] auto HasSource() const -> bool {");
  indent_++;
  Line("return std::visit(");
  Line("    " + Support("Overloaded") + "{");
  indent_ += 3;
  for (const auto& c : def.cases) {
    Line(
        "[](const " + c.name + "&) { return " +
        (SourceFieldIndex(c) ? "true" : "false") + "; },");
  }
  indent_ -= 3;
  Line("    },");
  Line("    value_);");
  indent_--;
  Line("}");
  Line("");

  Line("template <typename T>");
  Line("[[nodiscard]] auto SourceAs() const -> const T* {");
  indent_++;
  Line("return std::visit(");
  Line("    " + Support("Overloaded") + "{");
  indent_ += 3;
  for (const auto& c : def.cases) {
    auto index = SourceFieldIndex(c);
    if (!index) {
      Line("[](const " + c.name + "&) -> const T* { return nullptr; },");
      continue;
    }
    Line("[](const " + c.name + "& e) -> const T* {");
    Line(
        "  return " + Support("SourceIf") + "<T>(e." +
        MemberName(c.fields[*index], *index) + ");");
    Line("},");
  }
  indent_ -= 3;
  Line("    },");
  Line("    value_);");
  indent_--;
  Line("}");
  Line("");
}

void CppCodegen::EmitStruct(const model::AugmentedDefinition& def) {
  // A struct definition carries its single case under its own name
  const auto& c = def.cases.front();
  EmitDoc(def.attributes);
  Line("struct " + def.name + " {");
  indent_++;
  EmitFields(c);
  Line("");

  Line("[[nodiscard]] auto Display() const -> std::string {");
  Line("  return " + DisplayExpression(c, "") + ";");
  Line("}");
  Line("");

  auto index = SourceFieldIndex(c);
  Line("[[nodiscard]] auto HasSource() const -> bool {");
  Line(std::string("  return ") + (index ? "true" : "false") + ";");
  Line("}");
  Line("");

  Line("template <typename T>");
  Line("[[nodiscard]] auto SourceAs() const -> const T* {");
  if (index) {
    Line(
        "  return " + Support("SourceIf") + "<T>(" +
        MemberName(c.fields[*index], *index) + ");");
  } else {
    Line("  return nullptr;");
  }
  Line("}");
  indent_--;
  Line("};");
}

void CppCodegen::EmitDeclaration(const gen::CapabilityDeclaration& decl) {
  Line(
      "// Converts the failure of a std::expected into " + decl.target_type +
      ", attaching a");
  Line("// context message. Realized below once per wrapped failure type.");
  Line("template <typename Result>");
  Line("struct " + decl.name + ";");
  Line("");
  Line(
      "template <typename Result, " + Support("Stringifiable") + " C>");
  Line(
      "  requires " + Support("Realizes") + "<" + decl.name +
      ", std::remove_cvref_t<Result>>");
  Line(
      "auto " + decl.operation + "(Result&& result, const C& context) {");
  indent_++;
  Line(
      "return " + decl.name + "<std::remove_cvref_t<Result>>::" +
      decl.operation + "(");
  Line("    std::forward<Result>(result), context);");
  indent_--;
  Line("}");
}

void CppCodegen::EmitRealization(const gen::Realization& realization) {
  const auto& wrapped = realization.wrapped_type;
  auto expected = "std::expected<T, " + wrapped + ">";
  Line("template <typename T>");
  Line("struct " + realization.capability + "<" + expected + "> {");
  indent_++;
  Line("using Ok = T;");
  Line("");
  Line("template <" + Support("Stringifiable") + " C>");
  Line(
      "static auto " + std::string(gen::kContextOperation) + "(" + expected +
      " result, const C& context)");
  Line("    -> std::expected<T, " + realization.target_type + "> {");
  indent_++;
  Line(
      "return " + Support("AttachContext") + "<" + realization.target_type +
      ">(");
  Line(
      "    std::move(result), [&context](" + wrapped + "&& failure) {");
  Line(
      "      return " + TargetType(realization) + "{std::move(failure), " +
      Support("Stringify") + "(context)};");
  Line("    });");
  indent_--;
  Line("}");
  indent_--;
  Line("};");
}

void CppCodegen::Indent() {
  out_ << std::string(static_cast<std::size_t>(indent_) * 2, ' ');
}

void CppCodegen::Line(const std::string& text) {
  if (text.empty()) {
    out_ << "\n";
    return;
  }
  Indent();
  out_ << text << "\n";
}

}  // namespace ctxerr::codegen
