#include "yolo_output.hpp"
#include <earscope/core/log.hpp>
#include <algorithm>
#include <cmath>

namespace earscope::vision::detail {

namespace ec = earscope::core;

namespace {

constexpr std::int64_t kBoxFields = 5;  // cx, cy, w, h, objectness

}  // namespace

LetterboxGeometry compute_letterbox(std::uint32_t src_width, std::uint32_t src_height,
                                    std::uint32_t net_width, std::uint32_t net_height) {
  LetterboxGeometry g;
  if (src_width == 0 || src_height == 0) return g;
  g.scale = std::min(static_cast<float>(net_width) / static_cast<float>(src_width),
                     static_cast<float>(net_height) / static_cast<float>(src_height));
  g.resized_width = std::max(1, static_cast<int>(std::lround(src_width * g.scale)));
  g.resized_height = std::max(1, static_cast<int>(std::lround(src_height * g.scale)));
  g.left = (static_cast<int>(net_width) - g.resized_width) / 2;
  g.top = (static_cast<int>(net_height) - g.resized_height) / 2;
  g.right = static_cast<int>(net_width) - g.resized_width - g.left;
  g.bottom = static_cast<int>(net_height) - g.resized_height - g.top;
  return g;
}

std::expected<void, ec::PipelineError> decode_predictions(
    std::span<const float> data, std::span<const std::int64_t> shape,
    std::size_t num_classes, std::size_t num_mask_coeffs,
    const LetterboxGeometry& letterbox, InferenceResult& result) {
  const std::int64_t nc = static_cast<std::int64_t>(num_classes);
  const std::int64_t nm = static_cast<std::int64_t>(num_mask_coeffs);
  const std::int64_t c = kBoxFields + nc + nm;
  if (shape.size() != 3u || shape[0] != 1) {
    return std::unexpected(ec::PipelineError::InferenceFailed);
  }
  std::int64_t n = 0;
  bool rows_are_candidates = true;  // true: [1, N, C]; false: [1, C, N]
  if (shape[2] == c) {
    n = shape[1];
  } else if (shape[1] == c) {
    n = shape[2];
    rows_are_candidates = false;
  } else {
    EARSCOPE_LOG_ERROR << "prediction output has " << shape[1] << "x" << shape[2]
                       << " values, expected " << c << " per candidate";
    return std::unexpected(ec::PipelineError::InferenceFailed);
  }
  if (n < 0 || data.size() < static_cast<std::size_t>(n * c)) {
    return std::unexpected(ec::PipelineError::InferenceFailed);
  }

  auto at = [&](std::int64_t i, std::int64_t field) {
    return rows_are_candidates ? data[i * c + field] : data[field * n + i];
  };

  const float img_w = static_cast<float>(result.image_width);
  const float img_h = static_cast<float>(result.image_height);
  const float pad_x = static_cast<float>(letterbox.left);
  const float pad_y = static_cast<float>(letterbox.top);
  for (std::int64_t i = 0; i < n; ++i) {
    const float obj = at(i, 4);
    std::int64_t best_cls = 0;
    float best_score = 0.f;
    for (std::int64_t k = 0; k < nc; ++k) {
      const float s = at(i, kBoxFields + k);
      if (s > best_score) {
        best_score = s;
        best_cls = k;
      }
    }
    const float conf = nc > 0 ? obj * best_score : obj;
    if (conf < kCandidateFloor) continue;

    const float cx = at(i, 0);
    const float cy = at(i, 1);
    const float bw = at(i, 2);
    const float bh = at(i, 3);
    const float x1 = (cx - bw / 2.f - pad_x) / letterbox.scale;
    const float y1 = (cy - bh / 2.f - pad_y) / letterbox.scale;
    const float x2 = (cx + bw / 2.f - pad_x) / letterbox.scale;
    const float y2 = (cy + bh / 2.f - pad_y) / letterbox.scale;
    result.boxes.push_back(std::clamp(x1, 0.f, img_w));
    result.boxes.push_back(std::clamp(y1, 0.f, img_h));
    result.boxes.push_back(std::clamp(x2, 0.f, img_w));
    result.boxes.push_back(std::clamp(y2, 0.f, img_h));
    result.scores.push_back(conf);
    result.class_ids.push_back(best_cls);
    for (std::int64_t m = 0; m < nm; ++m) {
      result.mask_coeffs.push_back(at(i, kBoxFields + nc + m));
    }
  }
  result.num_detections = static_cast<std::uint32_t>(result.scores.size());
  return {};
}

}  // namespace earscope::vision::detail
