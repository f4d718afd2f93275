#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

#include "tests/common/fake_guest.hpp"
#include "wapps/common/diagnostic.hpp"
#include "wapps/runtime/capability_surface.hpp"

namespace wapps::runtime {
namespace {

class CapabilitySurfaceTest : public ::testing::Test {
 protected:
  test::FakeSystemServices services_;
  CapabilitySurface surface_{services_};
};

// =============================================================================
// Linking
// =============================================================================

TEST_F(CapabilitySurfaceTest, ResolvesEveryListedImport) {
  for (const auto& spec : kImportSpecs) {
    auto capability = surface_.Resolve(spec.module, spec.name);
    ASSERT_TRUE(capability.has_value()) << spec.module << "." << spec.name;
    EXPECT_EQ(*capability, spec.capability);
  }
}

TEST_F(CapabilitySurfaceTest, LinksTypicalGuest) {
  std::vector<ImportRef> imports = {
      {.module = "wasi_snapshot_preview1", .name = "fd_write"},
      {.module = "wasi_snapshot_preview1", .name = "proc_exit"},
      {.module = "wapps", .name = "publish_frame"},
  };

  auto linked = surface_.Link(imports);

  EXPECT_TRUE(linked.has_value());
}

TEST_F(CapabilitySurfaceTest, ModuleWithoutImportsLinks) {
  EXPECT_TRUE(surface_.Link({}).has_value());
}

TEST_F(CapabilitySurfaceTest, ReportsEveryUnresolvedImport) {
  std::vector<ImportRef> imports = {
      {.module = "wasi_snapshot_preview1", .name = "path_open"},
      {.module = "wapps", .name = "publish_frame"},
      {.module = "env", .name = "socket"},
  };

  auto linked = surface_.Link(imports);

  ASSERT_FALSE(linked.has_value());
  const auto& diag = linked.error();
  EXPECT_EQ(diag.Kind(), DiagKind::kLinkError);
  EXPECT_NE(diag.primary.message.find("2 imports"), std::string::npos);
  ASSERT_EQ(diag.notes.size(), 2U);
  EXPECT_EQ(
      diag.notes[0].message,
      "unresolved import wasi_snapshot_preview1.path_open");
  EXPECT_EQ(diag.notes[1].message, "unresolved import env.socket");
}

TEST_F(CapabilitySurfaceTest, ImportNameMustMatchModule) {
  EXPECT_FALSE(surface_.Resolve("wapps", "fd_write").has_value());
  EXPECT_FALSE(
      surface_.Resolve("wasi_snapshot_preview1", "publish_frame").has_value());
}

TEST_F(CapabilitySurfaceTest, NonFunctionImportsAreRejected) {
  std::vector<ImportRef> imports = {
      {.module = "env",
       .name = "memory",
       .kind = package::ExternKind::kMemory},
  };

  auto linked = surface_.Link(imports);

  ASSERT_FALSE(linked.has_value());
  ASSERT_EQ(linked.error().notes.size(), 1U);
  EXPECT_NE(
      linked.error().notes[0].message.find("memory imports"),
      std::string::npos);
}

TEST_F(CapabilitySurfaceTest, LegacyFrameImportIsAnAlias) {
  auto capability = surface_.Resolve("wapps", "update_frame");

  ASSERT_TRUE(capability.has_value());
  EXPECT_EQ(*capability, Capability::kPublishFrame);
}

TEST_F(CapabilitySurfaceTest, LegacyFrameImportCanBeDisabled) {
  CapabilitySurface strict(
      services_, CapabilityOptions{.legacy_frame_import = false});
  std::vector<ImportRef> imports = {
      {.module = "wapps", .name = "update_frame"}};

  EXPECT_FALSE(strict.Resolve("wapps", "update_frame").has_value());
  EXPECT_FALSE(strict.Link(imports).has_value());
  EXPECT_TRUE(strict.Resolve("wapps", "publish_frame").has_value());
}

// =============================================================================
// publish_frame
// =============================================================================

TEST_F(CapabilitySurfaceTest, NoFrameBeforeFirstPublish) {
  EXPECT_EQ(surface_.Frame().pointer, 0U);
  EXPECT_EQ(surface_.Frame().width, 0U);
  EXPECT_EQ(surface_.PublishCount(), 0U);
}

TEST_F(CapabilitySurfaceTest, PublishRecordsDescriptor) {
  surface_.PublishFrame(2, 3, 1024);

  EXPECT_EQ(surface_.Frame().width, 2U);
  EXPECT_EQ(surface_.Frame().height, 3U);
  EXPECT_EQ(surface_.Frame().pointer, 1024U);
  EXPECT_EQ(surface_.PublishCount(), 1U);
}

TEST_F(CapabilitySurfaceTest, LastPublishWins) {
  surface_.PublishFrame(2, 2, 1024);
  surface_.PublishFrame(4, 4, 2048);

  EXPECT_EQ(surface_.Frame().width, 4U);
  EXPECT_EQ(surface_.Frame().pointer, 2048U);
  EXPECT_EQ(surface_.PublishCount(), 2U);
}

TEST_F(CapabilitySurfaceTest, NegativeValuesAreReinterpreted) {
  surface_.PublishFrame(-1, 1, 16);

  EXPECT_EQ(surface_.Frame().width, 0xFFFFFFFFU);
}

TEST_F(CapabilitySurfaceTest, GenerationAdvancesOnPublishAndGuestCalls) {
  auto before = surface_.Frame().generation;

  surface_.PublishFrame(1, 1, 8);
  auto after_publish = surface_.Frame().generation;
  surface_.NoteGuestCall();

  EXPECT_GT(after_publish, before);
  EXPECT_GT(surface_.Frame().generation, after_publish);
}

// =============================================================================
// System calls
// =============================================================================

TEST_F(CapabilitySurfaceTest, ClocksComeFromServices) {
  EXPECT_EQ(surface_.ReadClock(0), 1'000'000'000ULL);
  EXPECT_EQ(surface_.ReadClock(1), 2'000'000'000ULL);
  EXPECT_EQ(surface_.ClockResolution(1), 1000ULL);
}

TEST_F(CapabilitySurfaceTest, UnknownClockIsRejected) {
  EXPECT_FALSE(surface_.ReadClock(4).has_value());
  EXPECT_FALSE(surface_.ClockResolution(99).has_value());
}

TEST_F(CapabilitySurfaceTest, RandomFillsBuffer) {
  std::array<uint8_t, 4> buffer{};

  surface_.FillRandom(buffer);

  EXPECT_EQ(buffer, (std::array<uint8_t, 4>{0, 1, 2, 3}));
}

TEST_F(CapabilitySurfaceTest, ConsoleAcceptsOnlyStdoutAndStderr) {
  EXPECT_TRUE(surface_.WriteConsole(kStdoutFd, "hello\n"));
  EXPECT_TRUE(surface_.WriteConsole(kStderrFd, "oops\n"));
  EXPECT_FALSE(surface_.WriteConsole(0, "stdin?"));
  EXPECT_FALSE(surface_.WriteConsole(3, "file"));

  EXPECT_EQ(services_.Stdout(), "hello\n");
  EXPECT_EQ(services_.Stderr(), "oops\n");
}

TEST_F(CapabilitySurfaceTest, ExitBecomesTrap) {
  auto trap = surface_.Exit(3);

  EXPECT_EQ(trap.reason, "guest exited with status 3");
}

}  // namespace
}  // namespace wapps::runtime
