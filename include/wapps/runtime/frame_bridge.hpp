#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "wapps/common/diagnostic.hpp"
#include "wapps/runtime/capability_surface.hpp"
#include "wapps/runtime/guest.hpp"

namespace wapps::runtime {

inline constexpr uint32_t kBytesPerPixel = 4;

// Host-owned RGBA8 snapshot of a guest frame, row-major, no padding.
class Image {
 public:
  Image(uint32_t width, uint32_t height, std::vector<uint8_t> pixels)
      : width_(width), height_(height), pixels_(std::move(pixels)) {
  }

  [[nodiscard]] auto Width() const -> uint32_t {
    return width_;
  }
  [[nodiscard]] auto Height() const -> uint32_t {
    return height_;
  }
  [[nodiscard]] auto Pixels() const -> std::span<const uint8_t> {
    return pixels_;
  }
  [[nodiscard]] auto Stride() const -> size_t {
    return static_cast<size_t>(width_) * kBytesPerPixel;
  }

  [[nodiscard]] auto PixelAt(uint32_t x, uint32_t y) const
      -> std::array<uint8_t, 4>;

 private:
  uint32_t width_;
  uint32_t height_;
  std::vector<uint8_t> pixels_;
};

// The descriptor does not fit the guest's memory as it is now.
struct PresentationError {
  FrameDescriptor descriptor;
  // Requested byte length; nullopt when width * height * 4 overflows.
  std::optional<uint64_t> byte_length;
  uint64_t memory_size = 0;

  [[nodiscard]] auto Message() const -> std::string;
  [[nodiscard]] auto ToDiagnostic() const -> Diagnostic;
};

// nullopt means the guest has not published a frame yet.
using PresentResult = std::expected<std::optional<Image>, PresentationError>;

// Copies the frame a guest published out of its linear memory.
//
// Guest memory can grow or move between any two guest calls, so a view
// taken over it is only trusted while the descriptor generation, memory
// identity and memory size all match the values it was taken under;
// otherwise it is re-acquired before reading. Every read is bounds-checked
// against the view actually used.
class FrameBridge {
 public:
  auto Present(const GuestMemory& memory, const FrameDescriptor& descriptor)
      -> PresentResult;

  // Forget the cached view (instance torn down or replaced).
  void Reset() {
    view_.reset();
  }

  // Number of times a fresh view was taken.
  [[nodiscard]] auto ViewAcquisitions() const -> uint64_t {
    return acquisitions_;
  }

 private:
  struct CachedView {
    std::span<const uint8_t> bytes;
    uint64_t identity;
    uint64_t generation;
  };

  auto CurrentView(const GuestMemory& memory, uint64_t generation)
      -> std::span<const uint8_t>;

  std::optional<CachedView> view_;
  uint64_t acquisitions_ = 0;
};

}  // namespace wapps::runtime
