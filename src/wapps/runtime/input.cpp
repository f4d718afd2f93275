#include "wapps/runtime/input.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>

#include "absl/container/flat_hash_map.h"

#include "wapps/common/overloaded.hpp"

namespace wapps::runtime {

namespace {

// Physical key names to USB HID keyboard usage IDs.
constexpr std::array<std::pair<std::string_view, int32_t>, 104> kKeyTable = {{
    {"KeyA", 4},           {"KeyB", 5},
    {"KeyC", 6},           {"KeyD", 7},
    {"KeyE", 8},           {"KeyF", 9},
    {"KeyG", 10},          {"KeyH", 11},
    {"KeyI", 12},          {"KeyJ", 13},
    {"KeyK", 14},          {"KeyL", 15},
    {"KeyM", 16},          {"KeyN", 17},
    {"KeyO", 18},          {"KeyP", 19},
    {"KeyQ", 20},          {"KeyR", 21},
    {"KeyS", 22},          {"KeyT", 23},
    {"KeyU", 24},          {"KeyV", 25},
    {"KeyW", 26},          {"KeyX", 27},
    {"KeyY", 28},          {"KeyZ", 29},
    {"Digit1", 30},        {"Digit2", 31},
    {"Digit3", 32},        {"Digit4", 33},
    {"Digit5", 34},        {"Digit6", 35},
    {"Digit7", 36},        {"Digit8", 37},
    {"Digit9", 38},        {"Digit0", 39},
    {"Enter", 40},         {"Escape", 41},
    {"Backspace", 42},     {"Tab", 43},
    {"Space", 44},         {"Minus", 45},
    {"Equal", 46},         {"BracketLeft", 47},
    {"BracketRight", 48},  {"Backslash", 49},
    {"Semicolon", 51},     {"Quote", 52},
    {"Backquote", 53},     {"Comma", 54},
    {"Period", 55},        {"Slash", 56},
    {"CapsLock", 57},      {"F1", 58},
    {"F2", 59},            {"F3", 60},
    {"F4", 61},            {"F5", 62},
    {"F6", 63},            {"F7", 64},
    {"F8", 65},            {"F9", 66},
    {"F10", 67},           {"F11", 68},
    {"F12", 69},           {"PrintScreen", 70},
    {"ScrollLock", 71},    {"Pause", 72},
    {"Insert", 73},        {"Home", 74},
    {"PageUp", 75},        {"Delete", 76},
    {"End", 77},           {"PageDown", 78},
    {"ArrowRight", 79},    {"ArrowLeft", 80},
    {"ArrowDown", 81},     {"ArrowUp", 82},
    {"NumLock", 83},       {"NumpadDivide", 84},
    {"NumpadMultiply", 85}, {"NumpadSubtract", 86},
    {"NumpadAdd", 87},     {"NumpadEnter", 88},
    {"Numpad1", 89},       {"Numpad2", 90},
    {"Numpad3", 91},       {"Numpad4", 92},
    {"Numpad5", 93},       {"Numpad6", 94},
    {"Numpad7", 95},       {"Numpad8", 96},
    {"Numpad9", 97},       {"Numpad0", 98},
    {"NumpadDecimal", 99}, {"ContextMenu", 101},
    {"ControlLeft", 224},  {"ShiftLeft", 225},
    {"AltLeft", 226},      {"MetaLeft", 227},
    {"ControlRight", 228}, {"ShiftRight", 229},
    {"AltRight", 230},     {"MetaRight", 231},
}};

auto KeyMap() -> const absl::flat_hash_map<std::string_view, int32_t>& {
  static const absl::flat_hash_map<std::string_view, int32_t> map(
      kKeyTable.begin(), kKeyTable.end());
  return map;
}

auto ToButton(int button_index) -> std::optional<PointerButton> {
  switch (button_index) {
    case 0:
      return PointerButton::kPrimary;
    case 1:
      return PointerButton::kMiddle;
    case 2:
      return PointerButton::kSecondary;
    default:
      return std::nullopt;
  }
}

auto Scale(double value, double logical, int32_t backing) -> int32_t {
  double factor = 1.0;
  if (logical > 0 && backing > 0) {
    factor = static_cast<double>(backing) / logical;
  }
  double scaled = std::floor(value * factor);
  if (!std::isfinite(scaled)) {
    return 0;
  }
  constexpr double kMin = std::numeric_limits<int32_t>::min();
  constexpr double kMax = std::numeric_limits<int32_t>::max();
  if (scaled < kMin) {
    return std::numeric_limits<int32_t>::min();
  }
  if (scaled > kMax) {
    return std::numeric_limits<int32_t>::max();
  }
  return static_cast<int32_t>(scaled);
}

}  // namespace

auto LookupKeyCode(std::string_view host_key) -> std::optional<int32_t> {
  const auto& map = KeyMap();
  auto it = map.find(host_key);
  if (it == map.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto InputTranslator::ScaleX(double x) const -> int32_t {
  return Scale(x, metrics_.logical_width, metrics_.backing_width);
}

auto InputTranslator::ScaleY(double y) const -> int32_t {
  return Scale(y, metrics_.logical_height, metrics_.backing_height);
}

auto InputTranslator::Translate(const HostEvent& event)
    -> std::optional<InputEvent> {
  return std::visit(
      Overloaded{
          [&](const HostPointerMotion& e) -> std::optional<InputEvent> {
            return PointerMove{.x = ScaleX(e.x), .y = ScaleY(e.y)};
          },
          [&](const HostPointerButton& e) -> std::optional<InputEvent> {
            auto button = ToButton(e.button_index);
            if (!button) {
              return std::nullopt;
            }
            if (e.pressed) {
              return PointerDown{
                  .x = ScaleX(e.x), .y = ScaleY(e.y), .button = *button};
            }
            return PointerUp{
                .x = ScaleX(e.x), .y = ScaleY(e.y), .button = *button};
          },
          [&](const HostKey& e) -> std::optional<InputEvent> {
            auto code = LookupKeyCode(e.code);
            if (!code) {
              return std::nullopt;
            }
            if (e.pressed) {
              return KeyDown{.code = *code};
            }
            return KeyUp{.code = *code};
          },
          [&](const HostResize& e) -> std::optional<InputEvent> {
            metrics_ = SurfaceMetrics{
                .logical_width = e.logical_width,
                .logical_height = e.logical_height,
                .backing_width = e.backing_width,
                .backing_height = e.backing_height,
            };
            return Resize{.width = e.backing_width, .height = e.backing_height};
          },
      },
      event);
}

auto EntryPointFor(const InputEvent& event) -> GuestExport {
  return std::visit(
      Overloaded{
          [](const PointerMove&) { return GuestExport::kOnPointerMove; },
          [](const PointerDown&) { return GuestExport::kOnPointerDown; },
          [](const PointerUp&) { return GuestExport::kOnPointerUp; },
          [](const KeyDown&) { return GuestExport::kOnKeyDown; },
          [](const KeyUp&) { return GuestExport::kOnKeyUp; },
          [](const Resize&) { return GuestExport::kOnResize; },
      },
      event);
}

auto Dispatch(
    GuestInstance& instance, const ExportSet& exports, const InputEvent& event)
    -> CallResult {
  GuestExport entry = EntryPointFor(event);
  if (!exports.Has(entry)) {
    return {};
  }

  std::array<GuestValue, 3> args{};
  size_t count = std::visit(
      Overloaded{
          [&](const PointerMove& e) -> size_t {
            args = {e.x, e.y, 0};
            return 2;
          },
          [&](const PointerDown& e) -> size_t {
            args = {e.x, e.y, static_cast<int32_t>(e.button)};
            return 3;
          },
          [&](const PointerUp& e) -> size_t {
            args = {e.x, e.y, static_cast<int32_t>(e.button)};
            return 3;
          },
          [&](const KeyDown& e) -> size_t {
            args[0] = e.code;
            return 1;
          },
          [&](const KeyUp& e) -> size_t {
            args[0] = e.code;
            return 1;
          },
          [&](const Resize& e) -> size_t {
            args = {e.width, e.height, 0};
            return 2;
          },
      },
      event);

  return instance.Call(
      GuestExportName(entry), std::span<const GuestValue>(args.data(), count));
}

}  // namespace wapps::runtime
