#pragma once

#include <earscope/core/geometry.hpp>
#include <optional>

namespace earscope::core {

/// Outcome of circular region-of-interest detection.
/// When success is false, crop_box is the full original extent and every remap is
/// the identity.
struct CropResult {
  bool success{false};
  std::optional<Point> center;   // fitted circle, also reported when rejected
  std::optional<int> radius;
  CropBox crop_box{};
  Shape original_shape{};
  std::optional<Shape> cropped_shape;
  double threshold{0.0};  // Otsu binarization level
};

}  // namespace earscope::core
