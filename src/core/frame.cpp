#include <earscope/core/frame.hpp>
#include <algorithm>
#include <cstddef>
#include <cstring>

namespace earscope::core {

std::size_t Frame::bytes_per_pixel(PixelFormat format) {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
}

Frame crop_frame(const Frame& frame, const CropBox& box) {
  const std::size_t bpp = Frame::bytes_per_pixel(frame.format());
  if (frame.empty() || bpp == 0) {
    return Frame();
  }
  if (frame.size_bytes() < Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return Frame();
  }

  const CropBox clipped = clip_crop_box(box, frame.shape());
  if (clipped.width() <= 0 || clipped.height() <= 0) {
    return Frame();
  }

  const auto out_w = static_cast<std::uint32_t>(clipped.width());
  const auto out_h = static_cast<std::uint32_t>(clipped.height());
  const std::size_t src_stride = static_cast<std::size_t>(frame.width()) * bpp;
  const std::size_t row_bytes = static_cast<std::size_t>(out_w) * bpp;

  std::vector<std::byte> buffer(row_bytes * out_h);
  const std::byte* src = frame.data().data();
  for (std::uint32_t r = 0; r < out_h; ++r) {
    const std::size_t src_off =
        (static_cast<std::size_t>(clipped.y1) + r) * src_stride +
        static_cast<std::size_t>(clipped.x1) * bpp;
    std::memcpy(buffer.data() + r * row_bytes, src + src_off, row_bytes);
  }
  return Frame(out_w, out_h, frame.format(), std::move(buffer));
}

}  // namespace earscope::core
