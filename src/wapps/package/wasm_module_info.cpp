#include "wapps/package/wasm_module_info.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "wapps/common/byte_order.hpp"

namespace wapps::package {

namespace {

constexpr std::array<uint8_t, 4> kWasmMagic = {0x00, 'a', 's', 'm'};
constexpr uint32_t kWasmVersion = 1;

constexpr uint8_t kImportSectionId = 2;
constexpr uint8_t kExportSectionId = 7;
constexpr uint8_t kLastKnownSectionId = 13;

// Bounds-checked reader over a byte range. Failures throw
// DiagnosticException carrying the offset; ScanWasmModule converts them.
class ByteCursor {
 public:
  ByteCursor(std::span<const uint8_t> bytes, size_t base)
      : bytes_(bytes), base_(base) {
  }

  [[nodiscard]] auto AtEnd() const -> bool {
    return pos_ >= bytes_.size();
  }

  [[nodiscard]] auto Offset() const -> size_t {
    return base_ + pos_;
  }

  auto ReadByte() -> uint8_t {
    if (pos_ >= bytes_.size()) {
      Fail("unexpected end of module");
    }
    return bytes_[pos_++];
  }

  auto ReadU32() -> uint32_t {
    uint64_t value = ReadLeb(5);
    if (value > UINT32_MAX) {
      Fail("LEB128 value does not fit in 32 bits");
    }
    return static_cast<uint32_t>(value);
  }

  auto ReadU64() -> uint64_t {
    return ReadLeb(10);
  }

  auto ReadBytes(size_t count) -> std::span<const uint8_t> {
    if (count > bytes_.size() - pos_) {
      Fail(fmt::format("{} bytes requested past end of module", count));
    }
    auto out = bytes_.subspan(pos_, count);
    pos_ += count;
    return out;
  }

  auto ReadName() -> std::string {
    uint32_t length = ReadU32();
    auto raw = ReadBytes(length);
    return {raw.begin(), raw.end()};
  }

  [[noreturn]] void Fail(const std::string& what) const {
    throw DiagnosticException(
        Diagnostic::FormatError(
            fmt::format("invalid guest module at byte {}: {}", Offset(), what)));
  }

 private:
  auto ReadLeb(int max_bytes) -> uint64_t {
    uint64_t result = 0;
    uint32_t shift = 0;
    for (int i = 0; i < max_bytes; ++i) {
      uint8_t byte = ReadByte();
      result |= static_cast<uint64_t>(byte & 0x7F) << shift;
      if ((byte & 0x80) == 0) {
        return result;
      }
      shift += 7;
    }
    Fail("LEB128 value too long");
  }

  std::span<const uint8_t> bytes_;
  size_t base_;
  size_t pos_ = 0;
};

void SkipLimits(ByteCursor& cursor) {
  uint8_t flags = cursor.ReadByte();
  cursor.ReadU64();
  if ((flags & 0x01) != 0) {
    cursor.ReadU64();
  }
}

void ReadImportSection(ByteCursor& cursor, WasmModuleInfo& info) {
  uint32_t count = cursor.ReadU32();
  for (uint32_t i = 0; i < count; ++i) {
    WasmImport import;
    import.module = cursor.ReadName();
    import.name = cursor.ReadName();
    uint8_t kind = cursor.ReadByte();
    switch (kind) {
      case 0x00:
        import.kind = ExternKind::kFunction;
        cursor.ReadU32();
        break;
      case 0x01:
        import.kind = ExternKind::kTable;
        cursor.ReadByte();
        SkipLimits(cursor);
        break;
      case 0x02:
        import.kind = ExternKind::kMemory;
        SkipLimits(cursor);
        break;
      case 0x03:
        import.kind = ExternKind::kGlobal;
        cursor.ReadByte();
        cursor.ReadByte();
        break;
      case 0x04:
        import.kind = ExternKind::kTag;
        cursor.ReadByte();
        cursor.ReadU32();
        break;
      default:
        cursor.Fail(fmt::format("unknown import kind 0x{:02X}", kind));
    }
    info.imports.push_back(std::move(import));
  }
}

void ReadExportSection(ByteCursor& cursor, WasmModuleInfo& info) {
  uint32_t count = cursor.ReadU32();
  for (uint32_t i = 0; i < count; ++i) {
    WasmExport exp;
    exp.name = cursor.ReadName();
    uint8_t kind = cursor.ReadByte();
    if (kind > static_cast<uint8_t>(ExternKind::kTag)) {
      cursor.Fail(fmt::format("unknown export kind 0x{:02X}", kind));
    }
    exp.kind = static_cast<ExternKind>(kind);
    cursor.ReadU32();
    info.exports.push_back(std::move(exp));
  }
}

}  // namespace

auto ExternKindName(ExternKind kind) -> std::string_view {
  switch (kind) {
    case ExternKind::kFunction:
      return "func";
    case ExternKind::kTable:
      return "table";
    case ExternKind::kMemory:
      return "memory";
    case ExternKind::kGlobal:
      return "global";
    case ExternKind::kTag:
      return "tag";
  }
  return "unknown";
}

auto WasmModuleInfo::HasExport(std::string_view name, ExternKind kind) const
    -> bool {
  return std::ranges::any_of(exports, [&](const WasmExport& e) {
    return e.kind == kind && e.name == name;
  });
}

auto HasWasmMagic(std::span<const uint8_t> payload) -> bool {
  return payload.size() >= kWasmMagic.size() &&
         std::equal(kWasmMagic.begin(), kWasmMagic.end(), payload.begin());
}

auto ScanWasmModule(std::span<const uint8_t> payload)
    -> Result<WasmModuleInfo> {
  if (payload.size() < 8) {
    return std::unexpected(
        Diagnostic::FormatError(
            fmt::format(
                "guest module too small ({} bytes, preamble needs 8)",
                payload.size())));
  }
  if (!HasWasmMagic(payload)) {
    return std::unexpected(
        Diagnostic::FormatError(
            fmt::format(
                "guest module is not WebAssembly: expected 00 61 73 6D, got "
                "{:02X} {:02X} {:02X} {:02X}",
                payload[0], payload[1], payload[2], payload[3])));
  }

  WasmModuleInfo info;
  info.version = common::LoadLittleEndian32(payload, 4);
  if (info.version != kWasmVersion) {
    return std::unexpected(
        Diagnostic::FormatError(
            fmt::format(
                "unsupported WebAssembly binary version {}", info.version)));
  }

  try {
    ByteCursor cursor(payload.subspan(8), 8);
    while (!cursor.AtEnd()) {
      uint8_t id = cursor.ReadByte();
      uint32_t size = cursor.ReadU32();
      size_t body_offset = cursor.Offset();
      auto body = cursor.ReadBytes(size);
      if (id > kLastKnownSectionId) {
        cursor.Fail(fmt::format("unknown section id {}", id));
      }

      ByteCursor section(body, body_offset);
      if (id == kImportSectionId) {
        ReadImportSection(section, info);
      } else if (id == kExportSectionId) {
        ReadExportSection(section, info);
      } else {
        continue;
      }
      if (!section.AtEnd()) {
        section.Fail("section size mismatch");
      }
    }
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }

  spdlog::debug(
      "scanned guest module: {} imports, {} exports", info.imports.size(),
      info.exports.size());
  return info;
}

}  // namespace wapps::package
