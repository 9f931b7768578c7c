#pragma once

#include <earscope/core/geometry.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace earscope::vision {

/// Segmentation prototypes of a YOLO-seg style model plus the letterbox transform
/// that maps the network input back to the source image:
/// input = image * scale + (pad_x, pad_y).
struct MaskPrototypes {
  std::vector<float> data;  // [channels, height, width]
  std::uint32_t channels{0};
  std::uint32_t height{0};
  std::uint32_t width{0};
  std::uint32_t input_width{0};
  std::uint32_t input_height{0};
  float scale{1.f};
  float pad_x{0.f};
  float pad_y{0.f};

  [[nodiscard]] bool empty() const noexcept { return data.empty() || channels == 0; }
};

/// Raw model output (candidate boxes, scores, classes and mask data) before
/// confidence filtering and suppression. Boxes are [x1,y1,x2,y2] per candidate,
/// in pixels of the image given to the backend.
struct InferenceResult {
  std::vector<float> boxes;
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};

  std::uint32_t image_width{0};
  std::uint32_t image_height{0};

  /// num_mask_coeffs values per candidate, combined with prototypes.
  std::vector<float> mask_coeffs;
  std::uint32_t num_mask_coeffs{0};
  MaskPrototypes prototypes;

  /// Already decoded masks at image resolution, one slot per candidate.
  /// Either empty or num_detections long; takes precedence over prototypes.
  std::vector<std::optional<earscope::core::Mask>> masks;
};

}  // namespace earscope::vision
