#include <earscope/vision/circle_cropper.hpp>
#include "frame_cv_utils.hpp"
#include <earscope/core/geometry.hpp>
#include <earscope/core/log.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace earscope::vision {

namespace ec = earscope::core;

CircleCropper::CircleCropper(double min_radius_ratio)
    : min_radius_ratio_(min_radius_ratio) {}

std::expected<ec::CropResult, ec::PipelineError>
CircleCropper::detect(const ec::Frame& image) const {
  if (image.empty()) {
    return std::unexpected(ec::PipelineError::InvalidFrame);
  }
  auto mat = detail::frame_to_mat(image);
  if (!mat) {
    return std::unexpected(ec::PipelineError::InvalidFrame);
  }

  ec::CropResult result;
  result.original_shape = image.shape();
  result.crop_box = ec::CropBox::full(result.original_shape);

  const cv::Mat gray = detail::to_gray(*mat, image.format());
  cv::Mat binary;
  result.threshold =
      cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
  if (contours.empty()) {
    EARSCOPE_LOG_DEBUG << "circle crop: no bright component (otsu=" << result.threshold << ")";
    return result;
  }

  const auto largest = std::max_element(
      contours.begin(), contours.end(),
      [](const std::vector<cv::Point>& a, const std::vector<cv::Point>& b) {
        return cv::contourArea(a) < cv::contourArea(b);
      });

  cv::Point2f center;
  float radius = 0.f;
  cv::minEnclosingCircle(*largest, center, radius);
  if (!std::isfinite(center.x) || !std::isfinite(center.y) || !std::isfinite(radius)) {
    return result;
  }

  const int cx = static_cast<int>(std::lround(center.x));
  const int cy = static_cast<int>(std::lround(center.y));
  // The enclosing circle of a rasterized disc overshoots the drawn radius by up to
  // half a pixel, so the radius is truncated, not rounded.
  const int r = static_cast<int>(std::floor(radius));
  result.center = ec::Point{static_cast<float>(cx), static_cast<float>(cy)};
  result.radius = r;

  const double min_radius =
      min_radius_ratio_ * static_cast<double>(std::min(image.width(), image.height()));
  if (r <= 0 || static_cast<double>(r) < min_radius) {
    EARSCOPE_LOG_DEBUG << "circle crop: radius " << r << " below minimum " << min_radius;
    return result;
  }

  const ec::CropBox box =
      ec::clip_crop_box(ec::CropBox{cx - r, cy - r, cx + r, cy + r}, result.original_shape);
  if (box.width() <= 0 || box.height() <= 0) {
    return result;
  }

  result.success = true;
  result.crop_box = box;
  result.cropped_shape = ec::Shape{static_cast<std::uint32_t>(box.height()),
                                   static_cast<std::uint32_t>(box.width())};
  return result;
}

}  // namespace earscope::vision
