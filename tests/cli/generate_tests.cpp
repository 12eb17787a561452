#include <filesystem>
#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace ctxerr::test {
namespace {

class GenerateTest : public CliTestFixture {};

// Test: without ctxerr.toml the header lands in the working directory
TEST_F(GenerateTest, WritesHeaderNextToInvocation) {
  WriteItemFile("errors.ctxerr.yaml");

  auto result = Run({"generate", "errors.ctxerr.yaml"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  ASSERT_TRUE(FileExists("errors.hpp"));
  auto header = ReadFile("errors.hpp");
  EXPECT_NE(
      header.find("// Generated by ctxerr from errors.ctxerr.yaml"),
      std::string::npos);
  EXPECT_NE(header.find("#include \"failures.hpp\""), std::string::npos);
  EXPECT_NE(header.find("class Error {"), std::string::npos);
  EXPECT_NE(
      header.find("struct ContextErr<std::expected<T, NetworkFailure>>"),
      std::string::npos);
  EXPECT_NE(
      header.find("struct ContextErr<std::expected<T, IoFailure>>"),
      std::string::npos);
}

// Test: --out-dir picks the directory and creates it
TEST_F(GenerateTest, OutDirIsCreated) {
  WriteItemFile("errors.yaml");

  auto result = Run({"generate", "--out-dir", "out/gen", "errors.yaml"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("out/gen/errors.hpp"));
}

// Test: -o names the output file
TEST_F(GenerateTest, ExplicitOutputFile) {
  WriteItemFile("errors.yml");

  auto result = Run({"generate", "-o", "include/app_errors.hpp", "errors.yml"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("include/app_errors.hpp"));
  EXPECT_FALSE(FileExists("errors.hpp"));
}

// Test: -o only makes sense for a single input
TEST_F(GenerateTest, ExplicitOutputNeedsSingleInput) {
  WriteItemFile("a.yaml");
  WriteItemFile("b.yaml");

  auto result = Run({"generate", "-o", "out.hpp", "a.yaml", "b.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.stderr_output.find("exactly one input file"), std::string::npos);
}

// Test: -o and --stdout are mutually exclusive
TEST_F(GenerateTest, ExplicitOutputConflictsWithStdout) {
  WriteItemFile("errors.yaml");

  auto result =
      Run({"generate", "-o", "out.hpp", "--stdout", "errors.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.stderr_output.find("cannot be combined"), std::string::npos);
}

// Test: --stdout prints the header and writes nothing
TEST_F(GenerateTest, StdoutPrintsHeader) {
  WriteItemFile("errors.yaml", "app::net");

  auto result = Run({"generate", "--stdout", "errors.yaml"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.stdout_output.starts_with("// Generated by ctxerr"));
  EXPECT_NE(
      result.stdout_output.find("namespace app::net {"), std::string::npos);
  EXPECT_TRUE(result.stderr_output.empty()) << result.stderr_output;
  EXPECT_FALSE(FileExists("errors.hpp"));
}

// Test: two inputs with the same stem cannot share one header
TEST_F(GenerateTest, RejectsOutputCollision) {
  WriteItemFile("a/errors.yaml");
  WriteItemFile("b/errors.yaml");

  auto result = Run({"generate", "a/errors.yaml", "b/errors.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.stderr_output.find("both generate"), std::string::npos);
  EXPECT_FALSE(FileExists("errors.hpp"));
}

// Test: a rejected item produces diagnostics and no header
TEST_F(GenerateTest, InvalidItemWritesNothing) {
  WriteFile(
      "errors.yaml",
      R"(items:
  - kind: enum
    name: Error
    cases:
      - name: A
        contextual: true
        fields: [IoFailure]
      - name: B
        contextual: true
        fields: [IoFailure]
)");

  auto result = Run({"generate", "errors.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.stderr_output.find("duplicate wrapped type 'IoFailure'"),
      std::string::npos);
  EXPECT_NE(result.stderr_output.find("1 error generated."), std::string::npos);
  EXPECT_FALSE(FileExists("errors.hpp"));
}

// Test: items whose cases are all opaque still generate a capability
TEST_F(GenerateTest, OpaqueOnlyItemGeneratesDeclaration) {
  WriteFile(
      "timeouts.yaml",
      R"(kind: struct
name: Timeout
fields:
  - name: seconds
    type: int
)");

  auto result = Run({"generate", "--stdout", "timeouts.yaml"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(
      result.stdout_output.find("struct ContextErr;"), std::string::npos);
  EXPECT_EQ(
      result.stdout_output.find("struct ContextErr<"), std::string::npos);
}

// Test: a missing input file is reported
TEST_F(GenerateTest, MissingInputFile) {
  auto result = Run({"generate", "nope.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.stderr_output.find("cannot open item description"),
      std::string::npos);
}

// Test: -v logs each step to stderr
TEST_F(GenerateTest, VerboseLogsToStderr) {
  WriteItemFile("errors.yaml");

  auto result = Run({"-v", "generate", "--stdout", "errors.yaml"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(
      result.stderr_output.find("generated 'Error' with capability"),
      std::string::npos);
  EXPECT_EQ(
      result.stdout_output.find("generated 'Error'"), std::string::npos);
}

// Test: -C changes directory before running
TEST_F(GenerateTest, ChangeDirectoryFlag) {
  WriteItemFile("proj/errors.yaml");

  auto result = Run({"-C", "proj", "generate", "errors.yaml"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("proj/errors.hpp"));
}

}  // namespace
}  // namespace ctxerr::test
