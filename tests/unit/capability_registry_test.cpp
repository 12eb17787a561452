#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "ctxerr/gen/capability_registry.hpp"
#include "ctxerr/gen/generation_error.hpp"
#include "ctxerr/model/type_definition.hpp"

namespace ctxerr::gen {
namespace {

auto ContextualCase(std::string name, std::string wrapped)
    -> model::AugmentedCase {
  return model::AugmentedCase{
      .name = std::move(name),
      .fields = {},
      .attributes = {},
      .kind = model::Contextual{.wrapped_type = std::move(wrapped)},
      .message_field = 1,
      .span = {},
  };
}

auto OpaqueCase(std::string name) -> model::AugmentedCase {
  return model::AugmentedCase{
      .name = std::move(name),
      .fields = {},
      .attributes = {},
      .kind = model::Opaque{},
      .message_field = std::nullopt,
      .span = {},
  };
}

TEST(CapabilityRegistryTest, KeepsRegistrationOrder) {
  CapabilityRegistry registry("ContextErr");
  ASSERT_TRUE(registry.Register(ContextualCase("Reqwest", "NetworkFailure")));
  ASSERT_TRUE(registry.Register(ContextualCase("Io", "IoFailure")));

  EXPECT_EQ(registry.Name(), "ContextErr");
  ASSERT_EQ(registry.Entries().size(), 2U);
  EXPECT_EQ(registry.Entries()[0].wrapped_type, "NetworkFailure");
  EXPECT_EQ(registry.Entries()[0].case_name, "Reqwest");
  EXPECT_EQ(registry.Entries()[1].wrapped_type, "IoFailure");
  EXPECT_EQ(registry.Entries()[1].case_name, "Io");
}

TEST(CapabilityRegistryTest, IgnoresOpaqueCases) {
  CapabilityRegistry registry("ContextErr");
  ASSERT_TRUE(registry.Register(OpaqueCase("Parse")));
  EXPECT_TRUE(registry.Entries().empty());
}

TEST(CapabilityRegistryTest, RejectsSecondClaimOnWrappedType) {
  CapabilityRegistry registry("ContextErr");
  ASSERT_TRUE(registry.Register(ContextualCase("A", "IoFailure")));
  auto second = registry.Register(ContextualCase("B", "IoFailure"));
  ASSERT_FALSE(second.has_value());

  const auto* dup = std::get_if<DuplicateWrappedType>(&second.error());
  ASSERT_NE(dup, nullptr);
  EXPECT_EQ(dup->wrapped_type, "IoFailure");
  EXPECT_EQ(dup->first_case, "A");
  EXPECT_EQ(dup->second_case, "B");
  EXPECT_EQ(dup->capability_name, "ContextErr");
  EXPECT_EQ(registry.Entries().size(), 1U);
}

TEST(CapabilityRegistryTest, SpellingVariantsAreOneType) {
  CapabilityRegistry registry("ContextErr");
  ASSERT_TRUE(registry.Register(ContextualCase("A", "std::vector<int>")));
  auto second = registry.Register(ContextualCase("B", "std::vector< int >"));
  ASSERT_FALSE(second.has_value());
  EXPECT_TRUE(std::holds_alternative<DuplicateWrappedType>(second.error()));
}

TEST(CapabilityRegistryTest, FindLooksUpByWrappedType) {
  CapabilityRegistry registry("ContextErr");
  ASSERT_TRUE(registry.Register(ContextualCase("Io", "IoFailure")));

  const auto* entry = registry.Find("IoFailure");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->case_name, "Io");
  EXPECT_EQ(registry.Find(" IoFailure "), entry);
  EXPECT_EQ(registry.Find("NetworkFailure"), nullptr);
}

TEST(CapabilityRegistryTest, ScopesAreIndependent) {
  CapabilityRegistry first("ContextErr");
  CapabilityRegistry second("ContextErr");
  ASSERT_TRUE(first.Register(ContextualCase("A", "IoFailure")));
  EXPECT_TRUE(second.Register(ContextualCase("B", "IoFailure")));
}

}  // namespace
}  // namespace ctxerr::gen
