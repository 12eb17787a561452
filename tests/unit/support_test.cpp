#include <gtest/gtest.h>

#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "ctxerr/support/support.hpp"

namespace ctxerr::support {
namespace {

struct Displayed {
  int code;
  [[nodiscard]] auto Display() const -> std::string {
    return fmt::format("code {}", code);
  }
};

struct Streamed {
  int id;
};

auto operator<<(std::ostream& out, const Streamed& s) -> std::ostream& {
  return out << "stream#" << s.id;
}

struct Opaque {};

struct Wrapped {
  int value;
};

struct Target {
  Wrapped cause;
  std::string message;
};

template <typename Result>
struct WrapCapability;

template <typename T>
struct WrapCapability<std::expected<T, Wrapped>> {
  using Ok = T;
};

TEST(StringifyTest, AcceptsStringsDisplayAndFormattable) {
  EXPECT_EQ(Stringify("reading config"), "reading config");
  EXPECT_EQ(Stringify(std::string("owned")), "owned");
  EXPECT_EQ(Stringify(std::string_view("view")), "view");
  EXPECT_EQ(Stringify(Displayed{.code = 7}), "code 7");
  EXPECT_EQ(Stringify(42), "42");
}

TEST(StringifyTest, ConceptRejectsUnprintableTypes) {
  EXPECT_TRUE(Stringifiable<const char*>);
  EXPECT_TRUE(Stringifiable<Displayed>);
  EXPECT_FALSE(Stringifiable<Opaque>);
}

TEST(RenderTest, PositionalAndNamedArguments) {
  int line = 12;
  std::string file = "a.toml";
  EXPECT_EQ(
      Render(
          "{file}:{line}: {0}", Arg(line), fmt::arg("line", Arg(line)),
          fmt::arg("file", Arg(file))),
      "a.toml:12: 12");
}

TEST(RenderTest, FormatSpecAppliesToFormattableFields) {
  double ratio = 0.5;
  int width = 7;
  EXPECT_EQ(Render("{0:.2f}|{1:>3}", Arg(ratio), Arg(width)), "0.50|  7");
}

TEST(RenderTest, FieldsWithoutFormatter) {
  Displayed displayed{.code = 3};
  Streamed streamed{.id = 9};
  Opaque opaque;
  EXPECT_EQ(
      Render("{0}; {1}", Arg(displayed), Arg(streamed), Arg(opaque)),
      "code 3; stream#9");
  EXPECT_EQ(Render("{2}", Arg(displayed), Arg(streamed), Arg(opaque)),
            "<unprintable>");
}

TEST(AttachContextTest, SuccessPassesThrough) {
  std::expected<int, Wrapped> ok = 5;
  bool called = false;
  auto result = AttachContext<Target>(std::move(ok), [&](Wrapped&& w) {
    called = true;
    return Target{.cause = w, .message = "unused"};
  });
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 5);
  EXPECT_FALSE(called);
}

TEST(AttachContextTest, FailureBuildsTarget) {
  std::expected<int, Wrapped> failed = std::unexpected(Wrapped{.value = 4});
  auto result = AttachContext<Target>(std::move(failed), [](Wrapped&& w) {
    return Target{.cause = w, .message = "while loading"};
  });
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().cause.value, 4);
  EXPECT_EQ(result.error().message, "while loading");
}

TEST(AttachContextTest, VoidResults) {
  std::expected<void, Wrapped> ok;
  auto passed = AttachContext<Target>(std::move(ok), [](Wrapped&& w) {
    return Target{.cause = w, .message = "x"};
  });
  EXPECT_TRUE(passed.has_value());

  std::expected<void, Wrapped> failed = std::unexpected(Wrapped{.value = 1});
  auto wrapped = AttachContext<Target>(std::move(failed), [](Wrapped&& w) {
    return Target{.cause = w, .message = "x"};
  });
  ASSERT_FALSE(wrapped.has_value());
  EXPECT_EQ(wrapped.error().cause.value, 1);
}

TEST(SourceIfTest, MatchesExactType) {
  Wrapped w{.value = 2};
  EXPECT_EQ(SourceIf<Wrapped>(w), &w);
  EXPECT_EQ(SourceIf<Opaque>(w), nullptr);
}

TEST(RealizesTest, OnlySpecializedResultsRealize) {
  EXPECT_TRUE((Realizes<WrapCapability, std::expected<int, Wrapped>>));
  EXPECT_TRUE((Realizes<WrapCapability, std::expected<void, Wrapped>>));
  EXPECT_FALSE((Realizes<WrapCapability, std::expected<int, Opaque>>));
  EXPECT_FALSE((Realizes<WrapCapability, int>));
}

}  // namespace
}  // namespace ctxerr::support
