#include <gtest/gtest.h>

#include <string>

#include <yaml-cpp/yaml.h>

#include "ctxerr/codegen/yaml_writer.hpp"
#include "ctxerr/gen/generate.hpp"
#include "tests/common/raw_items.hpp"

namespace ctxerr::codegen {
namespace {

using test::Attr;
using test::Case;
using test::ContextualCase;
using test::EnumItem;
using test::Named;
using test::Positional;

auto Dump(const item::RawItem& raw) -> YAML::Node {
  auto artifact = gen::Generate(raw);
  EXPECT_TRUE(artifact.has_value());
  return YAML::Load(WriteYaml({*artifact}));
}

TEST(YamlWriterTest, ListsOneEntryPerArtifact) {
  auto fetch = gen::Generate(test::FetchError());
  ASSERT_TRUE(fetch.has_value());
  auto root = YAML::Load(WriteYaml({*fetch, *fetch}));
  ASSERT_TRUE(root["artifacts"].IsSequence());
  EXPECT_EQ(root["artifacts"].size(), 2U);
}

TEST(YamlWriterTest, EmptyInputGivesEmptyList) {
  auto root = YAML::Load(WriteYaml({}));
  ASSERT_TRUE(root["artifacts"].IsSequence());
  EXPECT_EQ(root["artifacts"].size(), 0U);
}

TEST(YamlWriterTest, ContextualCaseShowsInjectedMessage) {
  auto artifact = Dump(test::FetchError())["artifacts"][0];
  EXPECT_EQ(artifact["item"].as<std::string>(), "Error");

  auto def = artifact["definition"];
  EXPECT_EQ(def["kind"].as<std::string>(), "enum");
  EXPECT_EQ(def["name"].as<std::string>(), "Error");

  auto reqwest = def["cases"][0];
  EXPECT_EQ(reqwest["name"].as<std::string>(), "Reqwest");
  EXPECT_EQ(reqwest["kind"].as<std::string>(), "contextual");
  EXPECT_EQ(reqwest["wraps"].as<std::string>(), "NetworkFailure");
  EXPECT_EQ(reqwest["display"].as<std::string>(), "{1}");

  auto fields = reqwest["fields"];
  ASSERT_EQ(fields.size(), 2U);
  EXPECT_EQ(fields[0]["type"].as<std::string>(), "NetworkFailure");
  EXPECT_TRUE(fields[0]["source"].as<bool>());
  EXPECT_FALSE(fields[0]["injected"]);
  EXPECT_EQ(fields[1]["type"].as<std::string>(), "std::string");
  EXPECT_TRUE(fields[1]["injected"].as<bool>());
}

TEST(YamlWriterTest, OpaqueCaseKeepsItsAttributes) {
  auto raw = EnumItem(
      "Error",
      {ContextualCase("Io", {Positional("IoFailure")}),
       Case(
           "Parse", {Named("line", "int")},
           {Attr("display", "line {line}"), Attr("deprecated", "use Io")})});
  auto parse = Dump(raw)["artifacts"][0]["definition"]["cases"][1];

  EXPECT_EQ(parse["kind"].as<std::string>(), "opaque");
  EXPECT_FALSE(parse["wraps"]);
  EXPECT_EQ(parse["display"].as<std::string>(), "line {line}");
  EXPECT_EQ(parse["attributes"]["deprecated"].as<std::string>(), "use Io");
  EXPECT_EQ(parse["fields"][0]["name"].as<std::string>(), "line");
  EXPECT_FALSE(parse["fields"][0]["injected"]);
}

TEST(YamlWriterTest, CapabilityListsRealizationsInOrder) {
  auto capability = Dump(test::FetchError())["artifacts"][0]["capability"];
  EXPECT_EQ(capability["name"].as<std::string>(), "ContextErr");
  EXPECT_EQ(capability["operation"].as<std::string>(), "Context");
  EXPECT_EQ(capability["target"].as<std::string>(), "Error");

  auto realizations = capability["realizations"];
  ASSERT_EQ(realizations.size(), 2U);
  EXPECT_EQ(realizations[0]["wraps"].as<std::string>(), "NetworkFailure");
  EXPECT_EQ(realizations[0]["case"].as<std::string>(), "Reqwest");
  EXPECT_EQ(realizations[1]["wraps"].as<std::string>(), "IoFailure");
  EXPECT_EQ(realizations[1]["case"].as<std::string>(), "Io");
}

TEST(YamlWriterTest, ItemWithoutContextualCasesHasNoRealizations) {
  auto raw = EnumItem("Error", {Case("Timeout", {})});
  auto capability = Dump(raw)["artifacts"][0]["capability"];
  ASSERT_TRUE(capability["realizations"].IsSequence());
  EXPECT_EQ(capability["realizations"].size(), 0U);
}

}  // namespace
}  // namespace ctxerr::codegen
