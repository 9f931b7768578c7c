#pragma once

#include <earscope/core/crop_result.hpp>
#include <earscope/core/detection.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace earscope::core {

/// Coordinate frame of the geometry returned to the caller.
enum class CoordinateType : std::uint8_t {
  Original,
  Cropped,
};

[[nodiscard]] constexpr std::string_view to_string(CoordinateType t) noexcept {
  return t == CoordinateType::Cropped ? "cropped" : "original";
}

[[nodiscard]] std::optional<CoordinateType> parse_coordinate_type(
    std::string_view s) noexcept;

/// Effective analysis parameters (after defaulting).
struct AnalysisParams {
  float conf_thres{0.25f};
  float iou_thres{0.45f};
  bool include_crop_coords{true};
  CoordinateType coordinate_type{CoordinateType::Original};
};

/// Result of one analysis request. detections keep engine output order.
struct AnalysisResponse {
  std::vector<Detection> detections;
  CoordinateType coordinate_type{CoordinateType::Original};  // resolved frame
  AnalysisParams parameters{};
  std::optional<CropResult> crop_info;
};

}  // namespace earscope::core
