#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ctxerr/codegen/cpp_codegen.hpp"
#include "ctxerr/gen/assembler.hpp"
#include "ctxerr/gen/generate.hpp"
#include "ctxerr/item/raw_item.hpp"
#include "tests/common/raw_items.hpp"

namespace ctxerr::codegen {
namespace {

using test::Attr;
using test::Case;
using test::ContextualCase;
using test::EnumItem;
using test::Named;
using test::Positional;
using test::StructItem;

auto Artifact(const item::RawItem& raw) -> gen::GeneratedArtifact {
  auto artifact = gen::Generate(raw);
  EXPECT_TRUE(artifact.has_value());
  return *artifact;
}

auto Render(
    std::vector<gen::GeneratedArtifact> artifacts,
    CppRenderOptions options = {}) -> std::string {
  return CppCodegen(std::move(options)).Generate(artifacts);
}

auto Contains(const std::string& text, const std::string& needle) -> bool {
  return text.find(needle) != std::string::npos;
}

TEST(CppCodegenTest, HeaderCarriesBannerIncludesAndNamespace) {
  auto text = Render(
      {Artifact(test::FetchError())},
      {.source_name = "errors.ctxerr.yaml",
       .cpp_namespace = "app::net",
       .includes = {"app/failures.hpp", "<system_error>"}});

  EXPECT_TRUE(text.starts_with(
      "// Generated by ctxerr from errors.ctxerr.yaml. Do not edit.\n"
      "#pragma once\n"));
  EXPECT_TRUE(Contains(text, "#include <expected>\n"));
  EXPECT_TRUE(Contains(text, "#include <ctxerr/support/support.hpp>\n"));
  EXPECT_TRUE(Contains(text, "#include \"app/failures.hpp\"\n"));
  EXPECT_TRUE(Contains(text, "#include <system_error>\n"));
  EXPECT_TRUE(Contains(text, "namespace app::net {\n"));
  EXPECT_TRUE(text.ends_with("}  // namespace app::net\n"));
}

TEST(CppCodegenTest, NoNamespaceWhenNoneGiven) {
  auto text = Render({Artifact(test::FetchError())});
  EXPECT_FALSE(Contains(text, "namespace "));
  EXPECT_TRUE(Contains(text, "// Generated by ctxerr. Do not edit.\n"));
}

TEST(CppCodegenTest, EnumCasesBecomeNestedStructs) {
  auto text = Render({Artifact(test::FetchError())});

  EXPECT_TRUE(Contains(text, "class Error {\n public:\n"));
  EXPECT_TRUE(Contains(
      text,
      "  struct Reqwest {\n"
      "    NetworkFailure field0;\n"
      "    std::string field1;\n"
      "  };\n"));
  EXPECT_TRUE(
      Contains(text, "  using Variant = std::variant<Reqwest, Io>;\n"));
  EXPECT_TRUE(Contains(
      text, "  Error(Io value)  // NOLINT(google-explicit-constructor)\n"));
  EXPECT_TRUE(Contains(text, "  Variant value_;\n"));
}

TEST(CppCodegenTest, DeclarationAndRealizationsFollowDefinition) {
  auto text = Render({Artifact(test::FetchError())});

  auto def = text.find("class Error {");
  auto decl = text.find("template <typename Result>\nstruct ContextErr;");
  auto first = text.find("struct ContextErr<std::expected<T, NetworkFailure>>");
  auto second = text.find("struct ContextErr<std::expected<T, IoFailure>>");
  ASSERT_NE(def, std::string::npos);
  ASSERT_NE(decl, std::string::npos);
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(def, decl);
  EXPECT_LT(decl, first);
  EXPECT_LT(first, second);

  EXPECT_TRUE(Contains(
      text,
      "  requires ::ctxerr::support::Realizes<ContextErr, "
      "std::remove_cvref_t<Result>>\n"
      "auto Context(Result&& result, const C& context) {\n"));
  EXPECT_TRUE(
      Contains(text, "    -> std::expected<T, Error> {\n"));
  EXPECT_TRUE(Contains(
      text,
      "return Error::Reqwest{std::move(failure), "
      "::ctxerr::support::Stringify(context)};"));
}

TEST(CppCodegenTest, StructRealizationBuildsTheStructDirectly) {
  auto text = Render({Artifact(StructItem(
      "ReadError", {Positional("IoFailure")}, {Attr("contextual", "true")},
      "ContextErr1"))});

  EXPECT_TRUE(Contains(
      text,
      "struct ReadError {\n"
      "  IoFailure field0;\n"
      "  std::string field1;\n"));
  EXPECT_TRUE(
      Contains(text, "struct ContextErr1<std::expected<T, IoFailure>> {"));
  EXPECT_TRUE(Contains(
      text,
      "return ReadError{std::move(failure), "
      "::ctxerr::support::Stringify(context)};"));
  EXPECT_TRUE(Contains(
      text, "  return ::ctxerr::support::SourceIf<T>(field0);\n"));
}

TEST(CppCodegenTest, DisplayTemplatePassesNamedAndPositionalFields) {
  auto raw = EnumItem(
      "Error",
      {Case(
           "Parse", {Named("line", "int"), Named("file", "std::string")},
           {Attr("display", "parse error in {file} at line {line}")}),
       Case(
           "Range", {Positional("int"), Positional("int")},
           {Attr("display", "{0}..{1}")}),
       ContextualCase("Io", {Positional("IoFailure")})});
  auto text = Render({Artifact(raw)});

  EXPECT_TRUE(Contains(
      text,
      "return ::ctxerr::support::Render(\"parse error in {file} at line "
      "{line}\", fmt::arg(\"line\", ::ctxerr::support::Arg(e.line)), "
      "fmt::arg(\"file\", ::ctxerr::support::Arg(e.file)));"));
  EXPECT_TRUE(Contains(
      text,
      "return ::ctxerr::support::Render(\"{0}..{1}\", "
      "::ctxerr::support::Arg(e.field0), "
      "::ctxerr::support::Arg(e.field1));"));
  // The injected message is the second positional argument
  EXPECT_TRUE(Contains(
      text,
      "return ::ctxerr::support::Render(\"{1}\", "
      "::ctxerr::support::Arg(e.field0), "
      "::ctxerr::support::Arg(e.field1));"));
}

TEST(CppCodegenTest, CaseWithoutTemplateDisplaysItsName) {
  auto raw = EnumItem(
      "Error", {Case("Timeout", {}),
                ContextualCase("Io", {Positional("IoFailure")})});
  auto text = Render({Artifact(raw)});
  EXPECT_TRUE(Contains(text, "[](const Timeout&) -> std::string {\n"));
  EXPECT_TRUE(Contains(text, "  return \"Timeout\";\n"));
}

TEST(CppCodegenTest, DocAttributesBecomeComments) {
  auto raw = test::FetchError();
  raw.attributes.push_back(Attr("doc", "Fetch failures.\n\nSee README."));
  auto text = Render({Artifact(raw)});
  EXPECT_TRUE(Contains(
      text, "// Fetch failures.\n//\n// See README.\nclass Error {\n"));
}

TEST(CppCodegenTest, SourceFieldPrefersAttributeOverName) {
  auto with_attr = model::AugmentedCase{
      .name = "Io",
      .fields =
          {test::ModelField("source", "int"),
           test::ModelField("cause", "IoFailure")},
      .attributes = {},
      .kind = std::monostate{},
      .message_field = std::nullopt,
      .span = {}};
  with_attr.fields[1].attributes.push_back(
      model::Attribute{
          .name = std::string(model::kSourceAttribute),
          .value = {},
          .span = {}});
  EXPECT_EQ(CppCodegen::SourceFieldIndex(with_attr), 1U);

  with_attr.fields[1].attributes.clear();
  EXPECT_EQ(CppCodegen::SourceFieldIndex(with_attr), 0U);

  with_attr.fields[0].name = "code";
  EXPECT_EQ(CppCodegen::SourceFieldIndex(with_attr), std::nullopt);
}

TEST(CppCodegenTest, MemberNames) {
  EXPECT_EQ(CppCodegen::MemberName(test::ModelField("line", "int"), 3), "line");
  EXPECT_EQ(
      CppCodegen::MemberName(test::ModelField(std::nullopt, "int"), 3),
      "field3");
}

TEST(CppCodegenTest, TwoItemsShareOneHeader) {
  auto read = Artifact(StructItem(
      "ReadError", {Positional("IoFailure")}, {Attr("contextual", "true")},
      "ContextErr1"));
  auto text = Render({Artifact(test::FetchError()), read});
  EXPECT_LT(text.find("class Error {"), text.find("struct ReadError {"));
  EXPECT_EQ(text.find("#pragma once"), text.rfind("#pragma once"));
}

}  // namespace
}  // namespace ctxerr::codegen
