#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace earscope::core {

/// Point in pixel coordinates of one frame (crop-space or original-space).
struct Point {
  float x{0.f};
  float y{0.f};
};

/// Axis-aligned box in pixel coordinates: (x1, y1) top-left, (x2, y2) bottom-right.
struct BBox {
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};

  [[nodiscard]] float width() const noexcept { return x2 - x1; }
  [[nodiscard]] float height() const noexcept { return y2 - y1; }
  [[nodiscard]] float area() const noexcept {
    return (x2 > x1 && y2 > y1) ? (x2 - x1) * (y2 - y1) : 0.f;
  }
};

/// Image extent as (height, width), matching the wire order of shapes.
struct Shape {
  std::uint32_t height{0};
  std::uint32_t width{0};
};

/// Integer crop rectangle inside the original image; x2/y2 are exclusive.
struct CropBox {
  int x1{0};
  int y1{0};
  int x2{0};
  int y2{0};

  [[nodiscard]] int width() const noexcept { return x2 - x1; }
  [[nodiscard]] int height() const noexcept { return y2 - y1; }

  /// Crop box covering the whole image (the "no crop" box).
  [[nodiscard]] static CropBox full(Shape shape) noexcept {
    return CropBox{0, 0, static_cast<int>(shape.width),
                   static_cast<int>(shape.height)};
  }
};

/// Binary per-pixel grid (0 or 1), row-major.
struct Mask {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::vector<std::uint8_t> data;

  Mask() = default;
  Mask(std::uint32_t w, std::uint32_t h)
      : width(w), height(h), data(static_cast<std::size_t>(w) * h, 0) {}

  [[nodiscard]] bool empty() const noexcept { return data.empty(); }
  [[nodiscard]] std::uint8_t at(std::uint32_t x, std::uint32_t y) const {
    return data[static_cast<std::size_t>(y) * width + x];
  }
  [[nodiscard]] std::uint8_t& at(std::uint32_t x, std::uint32_t y) {
    return data[static_cast<std::size_t>(y) * width + x];
  }
};

[[nodiscard]] bool is_full_extent(const CropBox& box, Shape shape) noexcept;

/// Crop-space -> original-space: adds the crop offset.
[[nodiscard]] Point to_original(Point p, const CropBox& crop) noexcept;
[[nodiscard]] BBox to_original(const BBox& b, const CropBox& crop) noexcept;

/// Original-space -> crop-space: subtracts the crop offset and clamps the result
/// to [0, crop.width()] x [0, crop.height()].
[[nodiscard]] Point to_cropped(Point p, const CropBox& crop) noexcept;
[[nodiscard]] BBox to_cropped(const BBox& b, const CropBox& crop) noexcept;

/// Clamp a box to [0, width] x [0, height].
[[nodiscard]] BBox clip_box(const BBox& b, float width, float height) noexcept;

/// Clamp a crop box so it lies inside the image; may become empty.
[[nodiscard]] CropBox clip_crop_box(const CropBox& box, Shape shape) noexcept;

/// Intersection over union; 0 when the union is empty.
[[nodiscard]] float box_iou(const BBox& a, const BBox& b) noexcept;

/// Place a crop-resolution mask into a zero grid of the original shape at the crop
/// offset. Pixels are copied one to one; the part falling outside the crop box or
/// the original image is dropped.
[[nodiscard]] Mask place_mask(const Mask& cropped, const CropBox& crop,
                              Shape original);

}  // namespace earscope::core
