#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "wapps/common/diagnostic.hpp"

namespace wapps::package {

enum class ExternKind : uint8_t {
  kFunction = 0,
  kTable = 1,
  kMemory = 2,
  kGlobal = 3,
  kTag = 4,
};

auto ExternKindName(ExternKind kind) -> std::string_view;

struct WasmImport {
  std::string module;
  std::string name;
  ExternKind kind;
};

struct WasmExport {
  std::string name;
  ExternKind kind;
};

// Import and export tables of a WebAssembly binary, read without compiling
// it. Only the preamble and section framing are validated; section bodies
// other than imports and exports are skipped.
struct WasmModuleInfo {
  uint32_t version = 0;
  std::vector<WasmImport> imports;
  std::vector<WasmExport> exports;

  [[nodiscard]] auto HasExport(std::string_view name, ExternKind kind) const
      -> bool;
};

// True if the payload starts with the WebAssembly magic "\0asm".
auto HasWasmMagic(std::span<const uint8_t> payload) -> bool;

auto ScanWasmModule(std::span<const uint8_t> payload)
    -> Result<WasmModuleInfo>;

}  // namespace wapps::package
