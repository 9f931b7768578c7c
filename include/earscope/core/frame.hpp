#pragma once

#include <earscope/core/geometry.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace earscope::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. data() is a read-only std::span view; pixels
/// are fixed at construction.
/// Thread-safety: distinct Frame instances are independent; sharing one Frame
/// across threads for reading is safe.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Decoded image: dimensions, format, and tightly packed row-major buffer.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] Shape shape() const noexcept { return Shape{height_, width_}; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept {
    return buffer_.empty() || width_ == 0 || height_ == 0;
  }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  [[nodiscard]] static std::size_t bytes_per_pixel(PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

/// Copy the region of box (clipped to the frame) into a new Frame.
/// Returns an empty Frame when the clipped region is empty or the format is unknown.
[[nodiscard]] Frame crop_frame(const Frame& frame, const CropBox& box);

}  // namespace earscope::core
