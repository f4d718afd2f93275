#pragma once

#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace wapps::test {

// Exit status and everything the process printed, stderr folded into
// stdout in write order.
struct CliResult {
  int exit_code;
  std::string combined_output;

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(const std::string& text) const -> bool {
    return combined_output.find(text) != std::string::npos;
  }
};

// Each test gets a scratch directory of its own; the wapps binary runs with
// that directory as its working directory, so config discovery and relative
// package paths resolve inside it.
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Paths are relative to the scratch directory. Missing parent
  // directories are created.
  void WriteFile(const std::filesystem::path& path, const std::string& text);
  void WriteBytes(
      const std::filesystem::path& path, const std::vector<uint8_t>& bytes);
  [[nodiscard]] auto ReadBytes(const std::filesystem::path& path) const
      -> std::vector<uint8_t>;
  [[nodiscard]] auto FileExists(const std::filesystem::path& path) const
      -> bool;

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return scratch_;
  }

 private:
  std::filesystem::path scratch_;
  std::filesystem::path binary_;
};

}  // namespace wapps::test
