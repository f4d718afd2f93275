#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "tests/common/wasm_builder.hpp"
#include "wapps/common/diagnostic.hpp"
#include "wapps/package/wasm_module_info.hpp"

namespace wapps::package {
namespace {

class WasmModuleInfoTest : public ::testing::Test {};

TEST_F(WasmModuleInfoTest, EmptyModuleHasNoTables) {
  auto bytes = test::WasmBuilder().Build();

  auto info = ScanWasmModule(bytes);

  ASSERT_TRUE(info.has_value()) << FormatDiagnostic(info.error());
  EXPECT_EQ(info->version, 1U);
  EXPECT_TRUE(info->imports.empty());
  EXPECT_TRUE(info->exports.empty());
}

TEST_F(WasmModuleInfoTest, ReadsImportsInOrder) {
  auto bytes = test::WasmBuilder()
                   .Import("wasi_snapshot_preview1", "fd_write")
                   .Import("wapps", "publish_frame")
                   .Import("env", "memory", ExternKind::kMemory)
                   .Import("env", "table", ExternKind::kTable)
                   .Import("env", "g", ExternKind::kGlobal)
                   .Build();

  auto info = ScanWasmModule(bytes);

  ASSERT_TRUE(info.has_value()) << FormatDiagnostic(info.error());
  ASSERT_EQ(info->imports.size(), 5U);
  EXPECT_EQ(info->imports[0].module, "wasi_snapshot_preview1");
  EXPECT_EQ(info->imports[0].name, "fd_write");
  EXPECT_EQ(info->imports[1].name, "publish_frame");
  EXPECT_EQ(info->imports[2].kind, ExternKind::kMemory);
  EXPECT_EQ(info->imports[3].kind, ExternKind::kTable);
  EXPECT_EQ(info->imports[4].kind, ExternKind::kGlobal);
}

TEST_F(WasmModuleInfoTest, ReadsExports) {
  auto bytes = test::WasmBuilder().TypicalGuest().Build();

  auto info = ScanWasmModule(bytes);

  ASSERT_TRUE(info.has_value()) << FormatDiagnostic(info.error());
  EXPECT_TRUE(info->HasExport("update", ExternKind::kFunction));
  EXPECT_TRUE(info->HasExport("memory", ExternKind::kMemory));
  EXPECT_TRUE(info->HasExport("on_key_down", ExternKind::kFunction));
  EXPECT_FALSE(info->HasExport("memory", ExternKind::kFunction));
  EXPECT_FALSE(info->HasExport("on_resize", ExternKind::kFunction));
}

TEST_F(WasmModuleInfoTest, SkipsOtherSections) {
  auto bytes = test::WasmBuilder().Export("update").Build();
  // Custom section (id 0) with name "x" and two bytes of content.
  std::vector<uint8_t> custom = {0x00, 0x04, 0x01, 'x', 0xDE, 0xAD};
  bytes.insert(bytes.end(), custom.begin(), custom.end());

  auto info = ScanWasmModule(bytes);

  ASSERT_TRUE(info.has_value()) << FormatDiagnostic(info.error());
  EXPECT_EQ(info->exports.size(), 1U);
}

TEST_F(WasmModuleInfoTest, MagicCheck) {
  EXPECT_TRUE(HasWasmMagic(test::WasmBuilder().Build()));
  std::vector<uint8_t> not_wasm = {'W', 'A', 'P', 'P', 1, 0, 0, 0};
  EXPECT_FALSE(HasWasmMagic(not_wasm));
  EXPECT_FALSE(HasWasmMagic({}));
}

TEST_F(WasmModuleInfoTest, RejectsWrongMagic) {
  std::vector<uint8_t> bytes = {'W', 'A', 'P', 'P', 1, 0, 0, 0};

  auto info = ScanWasmModule(bytes);

  ASSERT_FALSE(info.has_value());
  EXPECT_EQ(info.error().Kind(), DiagKind::kFormatError);
}

TEST_F(WasmModuleInfoTest, RejectsShortPreamble) {
  std::vector<uint8_t> bytes = {0x00, 'a', 's', 'm'};

  auto info = ScanWasmModule(bytes);

  ASSERT_FALSE(info.has_value());
  EXPECT_NE(info.error().primary.message.find("too small"), std::string::npos);
}

TEST_F(WasmModuleInfoTest, RejectsUnknownBinaryVersion) {
  std::vector<uint8_t> bytes = {0x00, 'a', 's', 'm', 2, 0, 0, 0};

  auto info = ScanWasmModule(bytes);

  ASSERT_FALSE(info.has_value());
  EXPECT_NE(info.error().primary.message.find("version 2"), std::string::npos);
}

TEST_F(WasmModuleInfoTest, SectionPastEndReportsOffset) {
  auto bytes = test::WasmBuilder().Build();
  // Export section claiming 100 bytes, with only one present.
  std::vector<uint8_t> section = {0x07, 100, 0x00};
  bytes.insert(bytes.end(), section.begin(), section.end());

  auto info = ScanWasmModule(bytes);

  ASSERT_FALSE(info.has_value());
  EXPECT_NE(info.error().primary.message.find("at byte"), std::string::npos);
}

TEST_F(WasmModuleInfoTest, SectionSizeMismatchIsRejected) {
  auto bytes = test::WasmBuilder().Build();
  // Export section with zero entries but one trailing byte.
  std::vector<uint8_t> section = {0x07, 0x02, 0x00, 0x00};
  bytes.insert(bytes.end(), section.begin(), section.end());

  auto info = ScanWasmModule(bytes);

  ASSERT_FALSE(info.has_value());
  EXPECT_NE(
      info.error().primary.message.find("size mismatch"), std::string::npos);
}

TEST_F(WasmModuleInfoTest, UnknownSectionIdIsRejected) {
  auto bytes = test::WasmBuilder().Build();
  std::vector<uint8_t> section = {0x2A, 0x00};
  bytes.insert(bytes.end(), section.begin(), section.end());

  auto info = ScanWasmModule(bytes);

  ASSERT_FALSE(info.has_value());
  EXPECT_NE(
      info.error().primary.message.find("unknown section id 42"),
      std::string::npos);
}

}  // namespace
}  // namespace wapps::package
