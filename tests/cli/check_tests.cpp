#include <gtest/gtest.h>
#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace mutator::test {
namespace {

constexpr const char* kListing = R"(type Mutation
field Mutation.KeyI0
method Mutation.Placeholder(1) -> value
method Mutation.Crypt(2)

proc Compute -> value
  local x
  ldloc x
  ldsfld Mutation.KeyI0
  xor
  call Mutation.Placeholder
  ret
end

proc Decrypt
  local block
  local key
  ldloc block
  ldloc key
  call Mutation.Crypt
  ret
end
)";

constexpr const char* kConfig = R"([keys]
KeyI0 = 17

[placeholder]
transform = "identity"

[crypt]
transform = "xor"
)";

class CheckTest : public CliTestFixture {};

// Test: check lists every marker use and succeeds when all resolve
TEST_F(CheckTest, ListsMarkerUses) {
  WriteFile("in.mil", kListing);
  WriteFile("mutator.toml", kConfig);

  auto result = Run({"check", "in.mil"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("Compute@1: key field KeyI0")) << result.output;
  EXPECT_TRUE(result.Contains("Compute@3: placeholder, argument at [0, 3)"))
      << result.output;
  EXPECT_TRUE(result.Contains("Decrypt@2: crypt(block=block, key=key)"))
      << result.output;
  EXPECT_FALSE(result.Contains("generated.")) << result.output;
}

// Test: uses the configuration cannot resolve are warnings, not errors
TEST_F(CheckTest, UnconfiguredUsesAreWarnings) {
  WriteFile("in.mil", kListing);

  auto result = Run({"check", "in.mil"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("no value configured for KeyI0"))
      << result.output;
  EXPECT_TRUE(result.Contains("no placeholder transform configured"))
      << result.output;
  EXPECT_TRUE(result.Contains("no crypt transform configured"))
      << result.output;
  EXPECT_TRUE(result.Contains("3 warnings generated.")) << result.output;
}

// Test: --proc limits the report to the named procedures
TEST_F(CheckTest, SelectedProcedure) {
  WriteFile("in.mil", kListing);

  auto result = Run({"check", "in.mil", "--proc", "Decrypt"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_FALSE(result.Contains("Compute@")) << result.output;
  EXPECT_TRUE(result.Contains("1 warning generated.")) << result.output;
}

// Test: an unrecognized key field is an error, and run rejects it too
TEST_F(CheckTest, UnrecognizedKeyFieldIsError) {
  WriteFile(
      "in.mil",
      "type Mutation\nfield Mutation.KeyI16\n\nproc P -> value\n"
      "  ldsfld Mutation.KeyI16\n  ret\nend\n");

  auto check = Run({"check", "in.mil"});
  EXPECT_EQ(check.exit_code, 1);
  EXPECT_TRUE(check.Contains("unrecognized-key-field")) << check.output;
  EXPECT_TRUE(check.Contains("1 error generated.")) << check.output;

  auto run = Run({"run", "in.mil"});
  EXPECT_EQ(run.exit_code, 1);
  EXPECT_TRUE(run.Contains("unrecognized-key-field")) << run.output;
}

// Test: crypt operands that are not two locals are an error in both commands
TEST_F(CheckTest, MalformedCryptIsError) {
  WriteFile(
      "in.mil",
      "type Mutation\nmethod Mutation.Crypt(2)\n\nproc P\n"
      "  ldc 1\n  ldc 2\n  call Mutation.Crypt\n  ret\nend\n");
  WriteFile("mutator.toml", kConfig);

  auto check = Run({"check", "in.mil"});
  EXPECT_EQ(check.exit_code, 1);
  EXPECT_TRUE(check.Contains("malformed-crypt-operands")) << check.output;

  auto run = Run({"run", "in.mil"});
  EXPECT_EQ(run.exit_code, 1);
  EXPECT_TRUE(run.Contains("malformed-crypt-operands")) << run.output;
}

// Test: an untraceable placeholder argument is an error in both commands
TEST_F(CheckTest, UntraceablePlaceholderIsError) {
  WriteFile(
      "in.mil",
      "type Mutation\nmethod Mutation.Placeholder(1) -> value\n\n"
      "proc P -> value\n  label L\n  call Mutation.Placeholder\n  ret\n"
      "end\n");
  WriteFile("mutator.toml", kConfig);

  auto check = Run({"check", "in.mil"});
  EXPECT_EQ(check.exit_code, 1);
  EXPECT_TRUE(check.Contains("trace-failure")) << check.output;

  auto run = Run({"run", "in.mil"});
  EXPECT_EQ(run.exit_code, 1);
  EXPECT_TRUE(run.Contains("trace-failure")) << run.output;
}

// Test: a store to a marker field is an unexpected use
TEST_F(CheckTest, UnexpectedUseIsError) {
  WriteFile(
      "in.mil",
      "type Mutation\nfield Mutation.KeyI0\n\nproc P\n"
      "  ldc 1\n  stsfld Mutation.KeyI0\n  ret\nend\n");

  auto result = Run({"check", "in.mil"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("unexpected 'stsfld'")) << result.output;
  EXPECT_TRUE(result.Contains("unexpected-marker-use")) << result.output;
}

// Test: a module without the marker type has nothing to check
TEST_F(CheckTest, NoMarkerType) {
  WriteFile("in.mil", "type Helper\n\nproc P\n  ret\nend\n");

  auto result = Run({"check", "in.mil"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("nothing to resolve")) << result.output;
}

}  // namespace
}  // namespace mutator::test
