#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "wapps/common/diagnostic.hpp"
#include "wapps/runtime/guest.hpp"
#include "wapps/runtime/system_services.hpp"

namespace wapps::runtime {

// Where the guest's current pixel buffer lives. Written only by
// publish_frame, read only by the frame bridge.
struct FrameDescriptor {
  uint32_t pointer = 0;
  uint32_t width = 0;
  uint32_t height = 0;
  // Bumped whenever guest memory may have moved. Cached views taken under
  // an older generation must not be reused.
  uint64_t generation = 0;
};

enum class Capability : uint8_t {
  kClock,
  kRandom,
  kConsole,
  kEmptyEnvironment,  // args/environ queries, always empty
  kExit,              // ends the guest as a trap, never the host
  kYield,
  kPublishFrame,
};

auto CapabilityName(Capability capability) -> std::string_view;

inline constexpr std::string_view kSystemModule = "wasi_snapshot_preview1";
inline constexpr std::string_view kHostModule = "wapps";
inline constexpr std::string_view kPublishFrameImport = "publish_frame";
inline constexpr std::string_view kLegacyFrameImport = "update_frame";

struct ImportSpec {
  std::string_view module;
  std::string_view name;
  Capability capability;
};

// The complete import set a guest can link against.
inline constexpr std::array<ImportSpec, 12> kImportSpecs = {{
    {kSystemModule, "clock_time_get", Capability::kClock},
    {kSystemModule, "clock_res_get", Capability::kClock},
    {kSystemModule, "random_get", Capability::kRandom},
    {kSystemModule, "fd_write", Capability::kConsole},
    {kSystemModule, "args_sizes_get", Capability::kEmptyEnvironment},
    {kSystemModule, "args_get", Capability::kEmptyEnvironment},
    {kSystemModule, "environ_sizes_get", Capability::kEmptyEnvironment},
    {kSystemModule, "environ_get", Capability::kEmptyEnvironment},
    {kSystemModule, "proc_exit", Capability::kExit},
    {kSystemModule, "sched_yield", Capability::kYield},
    {kHostModule, kPublishFrameImport, Capability::kPublishFrame},
    {kHostModule, kLegacyFrameImport, Capability::kPublishFrame},
}};

struct CapabilityOptions {
  // Accept wapps.update_frame as an alias of wapps.publish_frame.
  bool legacy_frame_import = true;
};

// Descriptor numbers the console capability accepts.
inline constexpr uint32_t kStdoutFd = 1;
inline constexpr uint32_t kStderrFd = 2;

// Host side of every import a guest may call. One surface per guest
// instance; the substrate adapter forwards import calls here and handles
// the ABI marshalling into guest memory itself.
class CapabilitySurface {
 public:
  explicit CapabilitySurface(
      SystemServices& services, CapabilityOptions options = {})
      : services_(services), options_(options) {
  }

  CapabilitySurface(const CapabilitySurface&) = delete;
  auto operator=(const CapabilitySurface&) -> CapabilitySurface& = delete;
  CapabilitySurface(CapabilitySurface&&) = delete;
  auto operator=(CapabilitySurface&&) -> CapabilitySurface& = delete;
  ~CapabilitySurface() = default;

  // The capability behind an import, or nullopt if the surface lacks it.
  [[nodiscard]] auto Resolve(std::string_view module, std::string_view name)
      const -> std::optional<Capability>;

  // Verify every import of a module before any guest code runs. Reports
  // all unresolved imports at once.
  [[nodiscard]] auto Link(std::span<const ImportRef> imports) const
      -> Result<void>;

  // wapps.publish_frame(width, height, pointer). Records the values as
  // given, last write wins; validity is checked at presentation time.
  void PublishFrame(int32_t width, int32_t height, int32_t pointer) noexcept;

  // Call after every guest call returns: memory may have grown or moved.
  void NoteGuestCall() noexcept {
    ++frame_.generation;
  }

  [[nodiscard]] auto Frame() const -> const FrameDescriptor& {
    return frame_;
  }

  [[nodiscard]] auto PublishCount() const -> uint64_t {
    return publish_count_;
  }

  // System-call semantics. ABI details (result pointers, iovecs) are the
  // substrate adapter's job.
  auto ReadClock(uint32_t clock_id) -> std::optional<uint64_t>;
  auto ClockResolution(uint32_t clock_id) -> std::optional<uint64_t>;
  void FillRandom(std::span<uint8_t> out);
  // False for any descriptor other than stdout/stderr.
  auto WriteConsole(uint32_t fd, std::string_view text) -> bool;
  // proc_exit: the substrate aborts the calling guest with this trap.
  [[nodiscard]] auto Exit(uint32_t code) const -> Trap;

 private:
  SystemServices& services_;
  CapabilityOptions options_;
  FrameDescriptor frame_;
  uint64_t publish_count_ = 0;
};

}  // namespace wapps::runtime
