#pragma once

#include <earscope/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace earscope::vision::detail {

/// Convert Frame to cv::Mat (non-owning view). Returns nullopt if format unsupported
/// or the buffer is too small for the declared dimensions.
std::optional<cv::Mat> frame_to_mat(const earscope::core::Frame& frame);

/// Convert cv::Mat to Frame (copy). Non-continuous mats (ROI views) are packed.
earscope::core::Frame mat_to_frame(const cv::Mat& mat,
                                   earscope::core::PixelFormat format);

/// Single-channel 8-bit intensity image of a frame view.
cv::Mat to_gray(const cv::Mat& mat, earscope::core::PixelFormat format);

/// 3-channel BGR image of a frame view (shares data when already BGR).
cv::Mat to_bgr(const cv::Mat& mat, earscope::core::PixelFormat format);

}  // namespace earscope::vision::detail
