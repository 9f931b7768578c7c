#pragma once

#include <earscope/core/error.hpp>
#include <earscope/vision/inference_result.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

namespace earscope::vision::detail {

/// Candidates scoring below this (objectness * best class score) are not reported.
inline constexpr float kCandidateFloor = 0.001f;

/// Aspect-preserving resize plus centered padding of a source image into the
/// network input: input = source * scale + (left, top).
struct LetterboxGeometry {
  float scale{1.f};
  int resized_width{0};
  int resized_height{0};
  int left{0};
  int top{0};
  int right{0};
  int bottom{0};
};

LetterboxGeometry compute_letterbox(std::uint32_t src_width, std::uint32_t src_height,
                                    std::uint32_t net_width, std::uint32_t net_height);

/// Decode a YOLO prediction tensor of shape [1, N, C] or [1, C, N], where
/// C = 5 + num_classes + num_mask_coeffs (cx, cy, w, h, objectness, class scores,
/// mask coefficients). Boxes are mapped back through the letterbox and clamped to
/// result.image_width x result.image_height. Candidates are appended to result.
/// InferenceFailed when the shape matches neither layout or data is too short.
std::expected<void, earscope::core::PipelineError> decode_predictions(
    std::span<const float> data, std::span<const std::int64_t> shape,
    std::size_t num_classes, std::size_t num_mask_coeffs,
    const LetterboxGeometry& letterbox, InferenceResult& result);

}  // namespace earscope::vision::detail
