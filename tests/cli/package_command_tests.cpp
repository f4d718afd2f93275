#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tests/cli/cli_test_fixture.hpp"
#include "tests/common/wasm_builder.hpp"
#include "wapps/package/package.hpp"

namespace wapps::test {
namespace {

class PackageCommandTest : public CliTestFixture {
 protected:
  void WritePackage(
      const std::string& filename, const nlohmann::json& metadata,
      const std::vector<uint8_t>& payload) {
    auto bytes = package::SerializePackage(metadata, payload);
    ASSERT_TRUE(bytes.has_value());
    WriteBytes(filename, *bytes);
  }

  void WriteDemo(const std::string& filename = "demo.wapp") {
    WritePackage(
        filename, {{"name", "Demo"}, {"description", "Red square"}},
        WasmBuilder().TypicalGuest().Build());
  }
};

// =============================================================================
// inspect
// =============================================================================

TEST_F(PackageCommandTest, InspectShowsHeaderAndTables) {
  WriteDemo();

  auto result = Run({"inspect", "demo.wapp"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("title:           Demo"));
  EXPECT_TRUE(result.Contains("description:     Red square"));
  EXPECT_TRUE(result.Contains("format version:  1"));
  EXPECT_TRUE(result.Contains("func wapps.publish_frame"));
  EXPECT_TRUE(result.Contains("memory memory"));
  EXPECT_TRUE(result.Contains("func update"));
}

TEST_F(PackageCommandTest, InspectUsesConfiguredFallbackTitle) {
  WritePackage("untitled.wapp", nlohmann::json::object(), {});
  WriteFile("wapps.toml", "[window]\ntitle = \"Arcade\"\n");

  auto result = Run({"inspect", "untitled.wapp"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("title:           Arcade"));
  EXPECT_TRUE(result.Contains("payload:         0 bytes"));
  EXPECT_TRUE(result.Contains("not a WebAssembly module"));
}

TEST_F(PackageCommandTest, InspectRejectsBadMagic) {
  WriteFile("fake.wapp", "PK\x03\x04 this is a zip file");

  auto result = Run({"inspect", "fake.wapp"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("not a WAPP package"));
  EXPECT_TRUE(result.Contains("offending field: magic"));
}

TEST_F(PackageCommandTest, InspectReportsMissingFile) {
  auto result = Run({"inspect", "nowhere.wapp"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("cannot open"));
}

TEST_F(PackageCommandTest, ChangeDirectoryOption) {
  std::filesystem::create_directories(TestDir() / "games");
  WriteDemo("games/demo.wapp");

  auto result = Run({"-C", "games", "inspect", "demo.wapp"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("Demo"));
}

TEST_F(PackageCommandTest, BrokenConfigIsReported) {
  WriteDemo();
  WriteFile("wapps.toml", "[log]\nlevel = \"loud\"\n");

  auto result = Run({"inspect", "demo.wapp"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("log.level"));
}

// =============================================================================
// check
// =============================================================================

TEST_F(PackageCommandTest, CheckAcceptsLinkableGuest) {
  WriteDemo();

  auto result = Run({"check", "demo.wapp"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("ok, 'Demo' links against this host"));
  EXPECT_TRUE(result.Contains("handlers: on_key_down"));
}

TEST_F(PackageCommandTest, CheckListsUnresolvedImports) {
  WritePackage(
      "greedy.wapp", {{"name", "Greedy"}},
      WasmBuilder()
          .Import("wasi_snapshot_preview1", "path_open")
          .Import("wasi_snapshot_preview1", "sock_accept")
          .Export("memory", package::ExternKind::kMemory)
          .Export("update")
          .Build());

  auto result = Run({"check", "greedy.wapp"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("link error"));
  EXPECT_TRUE(result.Contains("wasi_snapshot_preview1.path_open"));
  EXPECT_TRUE(result.Contains("wasi_snapshot_preview1.sock_accept"));
}

TEST_F(PackageCommandTest, CheckRequiresUpdate) {
  WritePackage(
      "idle.wapp", {{"name", "Idle"}},
      WasmBuilder().Export("memory", package::ExternKind::kMemory).Build());

  auto result = Run({"check", "idle.wapp"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("update"));
}

TEST_F(PackageCommandTest, CheckHonorsLegacyImportSetting) {
  WritePackage(
      "legacy.wapp", {{"name", "Legacy"}},
      WasmBuilder()
          .Import("wapps", "update_frame")
          .Export("memory", package::ExternKind::kMemory)
          .Export("update")
          .Build());

  EXPECT_TRUE(Run({"check", "legacy.wapp"}).Success());

  WriteFile("wapps.toml", "[guest]\nlegacy_frame_import = false\n");
  auto result = Run({"check", "legacy.wapp"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("wapps.update_frame"));
}

TEST_F(PackageCommandTest, CheckRejectsNonWasmPayload) {
  WritePackage(
      "text.wapp", {{"name", "Text"}}, {'h', 'e', 'l', 'l', 'o', '!', '!', '!'});

  auto result = Run({"check", "text.wapp"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("not WebAssembly"));
}

// =============================================================================
// pack
// =============================================================================

TEST_F(PackageCommandTest, PackBuildsLoadablePackage) {
  auto module = WasmBuilder().TypicalGuest().Build();
  WriteBytes("game.wasm", module);

  auto result = Run(
      {"pack", "game.wasm", "--name", "My Game", "--description", "Fun",
       "--meta", "author=someone", "--meta", "players=2"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  ASSERT_TRUE(FileExists("game.wapp"));
  auto parsed = package::ParsePackage(ReadBytes("game.wapp"));
  ASSERT_TRUE(parsed.has_value()) << parsed.error().Message();
  EXPECT_EQ(parsed->Name(), "My Game");
  EXPECT_EQ(parsed->Description(), "Fun");
  EXPECT_EQ(parsed->Metadata()["author"], "someone");
  EXPECT_EQ(parsed->Metadata()["players"], 2);
  EXPECT_EQ(
      std::vector<uint8_t>(parsed->Payload().begin(), parsed->Payload().end()),
      module);

  EXPECT_TRUE(Run({"check", "game.wapp"}).Success());
}

TEST_F(PackageCommandTest, PackHonorsOutputPath) {
  WriteBytes("game.wasm", WasmBuilder().TypicalGuest().Build());

  auto result = Run({"pack", "game.wasm", "-o", "out/custom.wapp"});

  EXPECT_FALSE(result.Success());

  std::filesystem::create_directories(TestDir() / "out");
  result = Run({"pack", "game.wasm", "-o", "out/custom.wapp"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("out/custom.wapp"));
}

TEST_F(PackageCommandTest, PackRejectsLongName) {
  WriteBytes("game.wasm", WasmBuilder().TypicalGuest().Build());

  auto result = Run({"pack", "game.wasm", "--name", std::string(256, 'x')});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("name too long"));
  EXPECT_FALSE(FileExists("game.wapp"));
}

TEST_F(PackageCommandTest, PackAcceptsNameAtLimit) {
  WriteBytes("game.wasm", WasmBuilder().TypicalGuest().Build());

  auto result = Run({"pack", "game.wasm", "--name", std::string(255, 'x')});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

TEST_F(PackageCommandTest, PackRejectsLongDescription) {
  WriteBytes("game.wasm", WasmBuilder().TypicalGuest().Build());

  auto result =
      Run({"pack", "game.wasm", "--description", std::string(1024, 'd')});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("description too long"));
}

TEST_F(PackageCommandTest, PackWarnsOnNonWasmModule) {
  WriteFile("notes.txt", "hello");

  auto result = Run({"pack", "notes.txt"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("does not look like a WebAssembly module"));
  EXPECT_TRUE(FileExists("notes.wapp"));
}

TEST_F(PackageCommandTest, PackRejectsMalformedMeta) {
  WriteBytes("game.wasm", WasmBuilder().TypicalGuest().Build());

  auto result = Run({"pack", "game.wasm", "--meta", "novalue"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("key=value"));
}

TEST_F(PackageCommandTest, NoSubcommandPrintsUsage) {
  auto result = Run(std::vector<std::string>{});

  EXPECT_TRUE(result.Success());
  EXPECT_TRUE(result.Contains("inspect"));
  EXPECT_TRUE(result.Contains("pack"));
}

}  // namespace
}  // namespace wapps::test
