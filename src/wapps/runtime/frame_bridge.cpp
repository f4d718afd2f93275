#include "wapps/runtime/frame_bridge.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "wapps/common/internal_error.hpp"

namespace wapps::runtime {

namespace {

auto FrameByteLength(const FrameDescriptor& descriptor)
    -> std::optional<uint64_t> {
  uint64_t pixels = static_cast<uint64_t>(descriptor.width) * descriptor.height;
  if (pixels > std::numeric_limits<uint64_t>::max() / kBytesPerPixel) {
    return std::nullopt;
  }
  return pixels * kBytesPerPixel;
}

}  // namespace

auto Image::PixelAt(uint32_t x, uint32_t y) const -> std::array<uint8_t, 4> {
  if (x >= width_ || y >= height_) {
    common::ThrowInternalError(
        "Image::PixelAt",
        fmt::format(
            "pixel ({}, {}) outside {}x{} image", x, y, width_, height_));
  }
  size_t offset = (static_cast<size_t>(y) * Stride()) +
                  (static_cast<size_t>(x) * kBytesPerPixel);
  return {
      pixels_[offset], pixels_[offset + 1], pixels_[offset + 2],
      pixels_[offset + 3]};
}

auto PresentationError::Message() const -> std::string {
  if (!byte_length) {
    return fmt::format(
        "frame {}x{} at offset {} is too large to address", descriptor.width,
        descriptor.height, descriptor.pointer);
  }
  return fmt::format(
      "frame {}x{} at offset {} needs bytes [{}, {}) but guest memory is {} "
      "bytes",
      descriptor.width, descriptor.height, descriptor.pointer,
      descriptor.pointer,
      static_cast<uint64_t>(descriptor.pointer) + *byte_length, memory_size);
}

auto PresentationError::ToDiagnostic() const -> Diagnostic {
  return Diagnostic::Presentation(Message());
}

auto FrameBridge::CurrentView(const GuestMemory& memory, uint64_t generation)
    -> std::span<const uint8_t> {
  uint64_t identity = memory.Identity();
  uint64_t size = memory.Size();
  if (!view_ || view_->generation != generation ||
      view_->identity != identity || view_->bytes.size() != size) {
    view_ = CachedView{
        .bytes = memory.Acquire(),
        .identity = identity,
        .generation = generation,
    };
    ++acquisitions_;
  }
  return view_->bytes;
}

auto FrameBridge::Present(
    const GuestMemory& memory, const FrameDescriptor& descriptor)
    -> PresentResult {
  if (descriptor.pointer == 0 || descriptor.width == 0 ||
      descriptor.height == 0) {
    return std::optional<Image>{};
  }

  auto byte_length = FrameByteLength(descriptor);
  auto view = CurrentView(memory, descriptor.generation);

  if (!byte_length || descriptor.pointer > view.size() ||
      *byte_length > view.size() - descriptor.pointer) {
    return std::unexpected(
        PresentationError{
            .descriptor = descriptor,
            .byte_length = byte_length,
            .memory_size = view.size(),
        });
  }

  auto region = view.subspan(descriptor.pointer, *byte_length);
  return std::optional<Image>(
      Image(
          descriptor.width, descriptor.height,
          std::vector<uint8_t>(region.begin(), region.end())));
}

}  // namespace wapps::runtime
