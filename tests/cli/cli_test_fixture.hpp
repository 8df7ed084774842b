#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

namespace mutator::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(const std::string& text) const -> bool {
    return output.find(text) != std::string::npos;
  }
};

// Test fixture for CLI integration tests
//
// Each test gets its own temporary directory; commands run with it as the
// working directory. The binary is taken from $MUTATOR_BIN, else the path
// the build configured.
//
// Usage:
//   TEST_F(RunTest, Resolves) {
//     WriteFile("in.mil", kListing);
//     auto result = Run({"run", "in.mil"});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(std::initializer_list<std::string> args) -> CliResult;

  // Run mutator from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, std::initializer_list<std::string> args)
      -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;

  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path mutator_bin_;

  auto RunImpl(
      const std::filesystem::path& working_dir,
      const std::vector<std::string>& args) -> CliResult;
};

}  // namespace mutator::test
