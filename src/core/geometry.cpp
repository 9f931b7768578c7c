#include <earscope/core/geometry.hpp>
#include <algorithm>
#include <cstring>

namespace earscope::core {

bool is_full_extent(const CropBox& box, Shape shape) noexcept {
  return box.x1 == 0 && box.y1 == 0 &&
         box.x2 == static_cast<int>(shape.width) &&
         box.y2 == static_cast<int>(shape.height);
}

Point to_original(Point p, const CropBox& crop) noexcept {
  return Point{p.x + static_cast<float>(crop.x1),
               p.y + static_cast<float>(crop.y1)};
}

BBox to_original(const BBox& b, const CropBox& crop) noexcept {
  const auto dx = static_cast<float>(crop.x1);
  const auto dy = static_cast<float>(crop.y1);
  return BBox{b.x1 + dx, b.y1 + dy, b.x2 + dx, b.y2 + dy};
}

Point to_cropped(Point p, const CropBox& crop) noexcept {
  const auto w = static_cast<float>(std::max(crop.width(), 0));
  const auto h = static_cast<float>(std::max(crop.height(), 0));
  return Point{std::clamp(p.x - static_cast<float>(crop.x1), 0.f, w),
               std::clamp(p.y - static_cast<float>(crop.y1), 0.f, h)};
}

BBox to_cropped(const BBox& b, const CropBox& crop) noexcept {
  const Point tl = to_cropped(Point{b.x1, b.y1}, crop);
  const Point br = to_cropped(Point{b.x2, b.y2}, crop);
  return BBox{tl.x, tl.y, br.x, br.y};
}

BBox clip_box(const BBox& b, float width, float height) noexcept {
  const float w = std::max(width, 0.f);
  const float h = std::max(height, 0.f);
  return BBox{std::clamp(b.x1, 0.f, w), std::clamp(b.y1, 0.f, h),
              std::clamp(b.x2, 0.f, w), std::clamp(b.y2, 0.f, h)};
}

CropBox clip_crop_box(const CropBox& box, Shape shape) noexcept {
  const int w = static_cast<int>(shape.width);
  const int h = static_cast<int>(shape.height);
  CropBox out;
  out.x1 = std::clamp(box.x1, 0, w);
  out.y1 = std::clamp(box.y1, 0, h);
  out.x2 = std::clamp(box.x2, out.x1, w);
  out.y2 = std::clamp(box.y2, out.y1, h);
  return out;
}

float box_iou(const BBox& a, const BBox& b) noexcept {
  const float ix1 = std::max(a.x1, b.x1);
  const float iy1 = std::max(a.y1, b.y1);
  const float ix2 = std::min(a.x2, b.x2);
  const float iy2 = std::min(a.y2, b.y2);
  const float inter = std::max(0.f, ix2 - ix1) * std::max(0.f, iy2 - iy1);
  const float uni = a.area() + b.area() - inter;
  return uni > 0.f ? inter / uni : 0.f;
}

Mask place_mask(const Mask& cropped, const CropBox& crop, Shape original) {
  Mask out(original.width, original.height);
  if (cropped.empty()) return out;

  const CropBox dst = clip_crop_box(crop, original);
  // Rows/cols of the source that land inside both the crop box and the image.
  const int src_x0 = dst.x1 - crop.x1;
  const int src_y0 = dst.y1 - crop.y1;
  const int cols = std::min(dst.width(), static_cast<int>(cropped.width) - src_x0);
  const int rows = std::min(dst.height(), static_cast<int>(cropped.height) - src_y0);
  if (cols <= 0 || rows <= 0) return out;

  for (int r = 0; r < rows; ++r) {
    const std::size_t src =
        static_cast<std::size_t>(src_y0 + r) * cropped.width + static_cast<std::size_t>(src_x0);
    const std::size_t dst_off =
        static_cast<std::size_t>(dst.y1 + r) * original.width + static_cast<std::size_t>(dst.x1);
    std::memcpy(out.data.data() + dst_off, cropped.data.data() + src,
                static_cast<std::size_t>(cols));
  }
  return out;
}

}  // namespace earscope::core
