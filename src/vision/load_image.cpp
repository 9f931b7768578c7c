#include <earscope/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <earscope/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>
#include <limits>

namespace earscope::vision {

std::optional<earscope::core::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
  if (mat.empty()) return std::nullopt;

  return detail::mat_to_frame(mat, earscope::core::PixelFormat::BGR8);
}

std::optional<earscope::core::Frame> decode_frame(std::span<const std::uint8_t> bytes) {
  if (bytes.empty() ||
      bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::uint8_t*>(bytes.data()));
  cv::Mat mat;
  try {
    mat = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
  if (mat.empty()) return std::nullopt;

  return detail::mat_to_frame(mat, earscope::core::PixelFormat::BGR8);
}

}  // namespace earscope::vision
