#include "wapps/runtime/guest.hpp"

#include <cstddef>
#include <functional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace wapps::runtime {

auto GuestExportName(GuestExport entry) -> std::string_view {
  switch (entry) {
    case GuestExport::kUpdate:
      return "update";
    case GuestExport::kOnResize:
      return "on_resize";
    case GuestExport::kOnPointerMove:
      return "on_pointer_move";
    case GuestExport::kOnPointerDown:
      return "on_pointer_down";
    case GuestExport::kOnPointerUp:
      return "on_pointer_up";
    case GuestExport::kOnKeyDown:
      return "on_key_down";
    case GuestExport::kOnKeyUp:
      return "on_key_up";
  }
  return "unknown";
}

auto ExportSet::Discover(const GuestInstance& instance) -> ExportSet {
  return FromPredicate(
      [&](std::string_view name) { return instance.HasExport(name); });
}

auto ExportSet::FromPredicate(
    const std::function<bool(std::string_view)>& has) -> ExportSet {
  ExportSet set;
  for (size_t i = 0; i < kGuestExportCount; ++i) {
    auto entry = static_cast<GuestExport>(i);
    bool present = has(GuestExportName(entry));
    set.present_.set(i, present);
    spdlog::debug(
        "  - {}: {}", GuestExportName(entry), present ? "present" : "absent");
  }
  return set;
}

}  // namespace wapps::runtime
