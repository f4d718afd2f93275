#include "wapps/runtime/capability_surface.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace wapps::runtime {

namespace {

auto ToClockId(uint32_t clock_id) -> std::optional<ClockId> {
  if (clock_id > static_cast<uint32_t>(ClockId::kThreadCpuTime)) {
    return std::nullopt;
  }
  return static_cast<ClockId>(clock_id);
}

}  // namespace

auto CapabilityName(Capability capability) -> std::string_view {
  switch (capability) {
    case Capability::kClock:
      return "clock";
    case Capability::kRandom:
      return "random";
    case Capability::kConsole:
      return "console";
    case Capability::kEmptyEnvironment:
      return "environment";
    case Capability::kExit:
      return "exit";
    case Capability::kYield:
      return "yield";
    case Capability::kPublishFrame:
      return "publish_frame";
  }
  return "unknown";
}

auto CapabilitySurface::Resolve(
    std::string_view module, std::string_view name) const
    -> std::optional<Capability> {
  if (module == kHostModule && name == kLegacyFrameImport &&
      !options_.legacy_frame_import) {
    return std::nullopt;
  }
  for (const auto& spec : kImportSpecs) {
    if (spec.module == module && spec.name == name) {
      return spec.capability;
    }
  }
  return std::nullopt;
}

auto CapabilitySurface::Link(std::span<const ImportRef> imports) const
    -> Result<void> {
  std::vector<std::string> unresolved;
  for (const auto& import : imports) {
    if (import.kind != package::ExternKind::kFunction) {
      unresolved.push_back(
          fmt::format(
              "{}.{} ({} imports are not provided)", import.module,
              import.name, package::ExternKindName(import.kind)));
      continue;
    }
    auto capability = Resolve(import.module, import.name);
    if (!capability) {
      unresolved.push_back(fmt::format("{}.{}", import.module, import.name));
      continue;
    }
    spdlog::debug(
        "linked {}.{} -> {}", import.module, import.name,
        CapabilityName(*capability));
  }

  if (unresolved.empty()) {
    return {};
  }

  auto diag = Diagnostic::LinkError(
      fmt::format(
          "guest requires {} import{} the host does not provide",
          unresolved.size(), unresolved.size() == 1 ? "" : "s"));
  for (auto& name : unresolved) {
    diag = std::move(diag).WithNote(fmt::format("unresolved import {}", name));
  }
  return std::unexpected(std::move(diag));
}

void CapabilitySurface::PublishFrame(
    int32_t width, int32_t height, int32_t pointer) noexcept {
  // Guest integers are reinterpreted as unsigned: a negative size becomes a
  // huge one and fails the bounds check at presentation time.
  frame_.width = static_cast<uint32_t>(width);
  frame_.height = static_cast<uint32_t>(height);
  frame_.pointer = static_cast<uint32_t>(pointer);
  ++frame_.generation;
  ++publish_count_;
}

auto CapabilitySurface::ReadClock(uint32_t clock_id)
    -> std::optional<uint64_t> {
  auto clock = ToClockId(clock_id);
  if (!clock) {
    return std::nullopt;
  }
  return services_.NowNanoseconds(*clock);
}

auto CapabilitySurface::ClockResolution(uint32_t clock_id)
    -> std::optional<uint64_t> {
  auto clock = ToClockId(clock_id);
  if (!clock) {
    return std::nullopt;
  }
  return services_.ResolutionNanoseconds(*clock);
}

void CapabilitySurface::FillRandom(std::span<uint8_t> out) {
  services_.FillRandom(out);
}

auto CapabilitySurface::WriteConsole(uint32_t fd, std::string_view text)
    -> bool {
  if (fd == kStdoutFd) {
    services_.WriteConsole(ConsoleStream::kStdout, text);
    return true;
  }
  if (fd == kStderrFd) {
    services_.WriteConsole(ConsoleStream::kStderr, text);
    return true;
  }
  return false;
}

auto CapabilitySurface::Exit(uint32_t code) const -> Trap {
  return Trap{.reason = fmt::format("guest exited with status {}", code)};
}

}  // namespace wapps::runtime
