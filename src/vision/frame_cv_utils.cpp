#include "frame_cv_utils.hpp"
#include <earscope/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace earscope::vision::detail {

namespace ec = earscope::core;

std::optional<cv::Mat> frame_to_mat(const ec::Frame& frame) {
  if (frame.empty()) return std::nullopt;
  if (frame.size_bytes() <
      ec::Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* data = const_cast<std::byte*>(frame.data().data());
  const std::size_t step = frame.width() * ec::Frame::bytes_per_pixel(frame.format());

  switch (frame.format()) {
    case ec::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case ec::PixelFormat::RGB8:
    case ec::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case ec::PixelFormat::RGBA8:
    case ec::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case ec::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

ec::Frame mat_to_frame(const cv::Mat& mat, ec::PixelFormat format) {
  if (mat.empty()) return ec::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return ec::Frame(w, h, format, std::move(buffer));
}

cv::Mat to_gray(const cv::Mat& mat, ec::PixelFormat format) {
  cv::Mat gray;
  switch (format) {
    case ec::PixelFormat::Grayscale8:
      return mat;
    case ec::PixelFormat::RGB8:
      cv::cvtColor(mat, gray, cv::COLOR_RGB2GRAY);
      break;
    case ec::PixelFormat::BGR8:
      cv::cvtColor(mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case ec::PixelFormat::RGBA8:
      cv::cvtColor(mat, gray, cv::COLOR_RGBA2GRAY);
      break;
    case ec::PixelFormat::BGRA8:
      cv::cvtColor(mat, gray, cv::COLOR_BGRA2GRAY);
      break;
    default:
      break;
  }
  return gray;
}

cv::Mat to_bgr(const cv::Mat& mat, ec::PixelFormat format) {
  cv::Mat bgr;
  switch (format) {
    case ec::PixelFormat::BGR8:
      return mat;
    case ec::PixelFormat::Grayscale8:
      cv::cvtColor(mat, bgr, cv::COLOR_GRAY2BGR);
      break;
    case ec::PixelFormat::RGB8:
      cv::cvtColor(mat, bgr, cv::COLOR_RGB2BGR);
      break;
    case ec::PixelFormat::RGBA8:
      cv::cvtColor(mat, bgr, cv::COLOR_RGBA2BGR);
      break;
    case ec::PixelFormat::BGRA8:
      cv::cvtColor(mat, bgr, cv::COLOR_BGRA2BGR);
      break;
    default:
      break;
  }
  return bgr;
}

}  // namespace earscope::vision::detail
