#pragma once

#include <earscope/core/crop_result.hpp>
#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <expected>

namespace earscope::vision {

/// Locates the endoscope's circular field of view and derives a square crop.
///
/// Steps: intensity image -> Otsu binarization -> largest external contour ->
/// minimal enclosing circle -> bounding square clipped to the image.
/// A circle whose radius is below min_radius_ratio * min(width, height) is
/// rejected. Rejection is reported as CropResult::success == false with the full
/// image as crop_box, never as an error; only empty frames fail.
class CircleCropper {
 public:
  static constexpr double kDefaultMinRadiusRatio = 0.18;

  explicit CircleCropper(double min_radius_ratio = kDefaultMinRadiusRatio);

  [[nodiscard]] std::expected<earscope::core::CropResult,
                              earscope::core::PipelineError>
  detect(const earscope::core::Frame& image) const;

  [[nodiscard]] double min_radius_ratio() const noexcept {
    return min_radius_ratio_;
  }

 private:
  double min_radius_ratio_;
};

}  // namespace earscope::vision
