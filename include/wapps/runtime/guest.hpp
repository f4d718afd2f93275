#pragma once

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "wapps/common/diagnostic.hpp"
#include "wapps/package/wasm_module_info.hpp"

// Contract between the host core and the execution substrate that compiles
// and runs guest modules. The substrate itself lives outside this library;
// it only has to provide these interfaces.

namespace wapps::runtime {

class CapabilitySurface;

using GuestValue = std::variant<int32_t, int64_t, double>;

// Abnormal, sandbox-enforced termination of a guest call.
struct Trap {
  std::string reason;
};

using CallResult = std::expected<void, Trap>;

// Linear memory owned by a guest instance. The host never writes it.
class GuestMemory {
 public:
  virtual ~GuestMemory() = default;

  // Current size in bytes.
  [[nodiscard]] virtual auto Size() const -> uint64_t = 0;

  // Changes every time the backing store is reallocated (growth, move).
  [[nodiscard]] virtual auto Identity() const -> uint64_t = 0;

  // Read-only view over the current backing store. Any guest call may
  // invalidate it.
  [[nodiscard]] virtual auto Acquire() const -> std::span<const uint8_t> = 0;
};

class GuestInstance {
 public:
  virtual ~GuestInstance() = default;

  [[nodiscard]] virtual auto HasExport(std::string_view name) const
      -> bool = 0;

  // Synchronously invoke an exported function. Functions consumed by the
  // host return nothing.
  virtual auto Call(std::string_view name, std::span<const GuestValue> args)
      -> CallResult = 0;

  // The instance's linear memory, or nullptr if it has none.
  virtual auto Memory() -> GuestMemory* = 0;
};

struct ImportRef {
  std::string module;
  std::string name;
  package::ExternKind kind = package::ExternKind::kFunction;
};

class CompiledModule {
 public:
  virtual ~CompiledModule() = default;

  [[nodiscard]] virtual auto Imports() const -> std::span<const ImportRef> = 0;

  // Bind imports to the surface and run the module's start code. The
  // surface outlives the returned instance.
  virtual auto Instantiate(CapabilitySurface& surface)
      -> Result<std::unique_ptr<GuestInstance>> = 0;
};

class Substrate {
 public:
  virtual ~Substrate() = default;

  virtual auto Compile(std::span<const uint8_t> payload)
      -> Result<std::unique_ptr<CompiledModule>> = 0;
};

// Entry points the host may call. Only kUpdate is required.
enum class GuestExport : uint8_t {
  kUpdate,
  kOnResize,
  kOnPointerMove,
  kOnPointerDown,
  kOnPointerUp,
  kOnKeyDown,
  kOnKeyUp,
};

inline constexpr size_t kGuestExportCount = 7;

auto GuestExportName(GuestExport entry) -> std::string_view;

// Which entry points a guest provides, resolved once after instantiation.
class ExportSet {
 public:
  ExportSet() = default;

  static auto Discover(const GuestInstance& instance) -> ExportSet;

  // Same as Discover, for a module that has only been scanned.
  static auto FromPredicate(const std::function<bool(std::string_view)>& has)
      -> ExportSet;

  [[nodiscard]] auto Has(GuestExport entry) const -> bool {
    return present_.test(static_cast<size_t>(entry));
  }

  [[nodiscard]] auto Count() const -> size_t {
    return present_.count();
  }

 private:
  std::bitset<kGuestExportCount> present_;
};

}  // namespace wapps::runtime
