#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "wapps/runtime/guest.hpp"

namespace wapps::runtime {

// Button encoding shared with guests.
enum class PointerButton : int32_t {
  kPrimary = 1,
  kMiddle = 2,
  kSecondary = 3,
};

// Events in the guest's coordinate space (surface backing pixels, origin
// top-left) and key code space (USB HID usage IDs).
struct PointerMove {
  int32_t x;
  int32_t y;
  auto operator==(const PointerMove&) const -> bool = default;
};

struct PointerDown {
  int32_t x;
  int32_t y;
  PointerButton button;
  auto operator==(const PointerDown&) const -> bool = default;
};

struct PointerUp {
  int32_t x;
  int32_t y;
  PointerButton button;
  auto operator==(const PointerUp&) const -> bool = default;
};

struct KeyDown {
  int32_t code;
  auto operator==(const KeyDown&) const -> bool = default;
};

struct KeyUp {
  int32_t code;
  auto operator==(const KeyUp&) const -> bool = default;
};

struct Resize {
  int32_t width;
  int32_t height;
  auto operator==(const Resize&) const -> bool = default;
};

using InputEvent =
    std::variant<PointerMove, PointerDown, PointerUp, KeyDown, KeyUp, Resize>;

// Events as the host's event source reports them. Pointer positions are in
// logical surface units; buttons are zero-based (0 primary, 1 middle,
// 2 secondary); keys use physical key names ("KeyA", "ArrowUp", "Space").
struct HostPointerMotion {
  double x;
  double y;
};

struct HostPointerButton {
  double x;
  double y;
  int button_index;
  bool pressed;
};

struct HostKey {
  std::string code;
  bool pressed;
};

struct HostResize {
  double logical_width;
  double logical_height;
  int32_t backing_width;
  int32_t backing_height;
};

using HostEvent =
    std::variant<HostPointerMotion, HostPointerButton, HostKey, HostResize>;

// Logical size of the presentation surface and the pixel size of its
// backing store. They differ under display scaling.
struct SurfaceMetrics {
  double logical_width = 0;
  double logical_height = 0;
  int32_t backing_width = 0;
  int32_t backing_height = 0;
};

// Stable code for a physical key name, or nullopt if it is not in the table.
auto LookupKeyCode(std::string_view host_key) -> std::optional<int32_t>;

class InputTranslator {
 public:
  explicit InputTranslator(SurfaceMetrics metrics = {}) : metrics_(metrics) {
  }

  // nullopt when the event has no guest counterpart (unmapped key, extra
  // mouse button). A resize also updates the metrics used for scaling.
  auto Translate(const HostEvent& event) -> std::optional<InputEvent>;

  [[nodiscard]] auto Metrics() const -> const SurfaceMetrics& {
    return metrics_;
  }

 private:
  [[nodiscard]] auto ScaleX(double x) const -> int32_t;
  [[nodiscard]] auto ScaleY(double y) const -> int32_t;

  SurfaceMetrics metrics_;
};

// The guest entry point an event is delivered to.
auto EntryPointFor(const InputEvent& event) -> GuestExport;

// Deliver one event. Events whose entry point the guest does not export are
// dropped and count as success.
auto Dispatch(
    GuestInstance& instance, const ExportSet& exports, const InputEvent& event)
    -> CallResult;

}  // namespace wapps::runtime
