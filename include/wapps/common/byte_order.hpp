#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace wapps::common {

// Read a little-endian u32 at offset. Caller guarantees offset + 4 <= size.
inline auto LoadLittleEndian32(std::span<const uint8_t> bytes, size_t offset)
    -> uint32_t {
  return static_cast<uint32_t>(bytes[offset]) |
         (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
         (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
         (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

inline void AppendLittleEndian32(std::vector<uint8_t>& out, uint32_t value) {
  out.push_back(static_cast<uint8_t>(value & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

}  // namespace wapps::common
