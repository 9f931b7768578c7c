#include <earscope/vision/mock_inference_backend.hpp>
#include <earscope/core/detection.hpp>
#include <earscope/core/error.hpp>
#include <cstdint>
#include <vector>

namespace earscope::vision {

void MockInferenceBackend::set_detections(
    std::vector<earscope::core::Detection> detections) {
  detections_to_return_ = std::move(detections);
}

static InferenceResult mock_to_result(
    const std::vector<earscope::core::Detection>& detections,
    const earscope::core::Frame& input) {
  InferenceResult r;
  r.num_detections = static_cast<std::uint32_t>(detections.size());
  r.image_width = input.width();
  r.image_height = input.height();
  bool any_mask = false;
  for (const auto& d : detections) {
    r.boxes.push_back(d.bbox.x1);
    r.boxes.push_back(d.bbox.y1);
    r.boxes.push_back(d.bbox.x2);
    r.boxes.push_back(d.bbox.y2);
    r.scores.push_back(d.confidence);
    r.class_ids.push_back(static_cast<std::int64_t>(d.class_id));
    any_mask = any_mask || d.mask.has_value();
  }
  if (any_mask) {
    r.masks.reserve(detections.size());
    for (const auto& d : detections) {
      r.masks.push_back(d.mask);
    }
  }
  return r;
}

std::expected<InferenceResult, earscope::core::PipelineError>
MockInferenceBackend::infer(const earscope::core::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  return mock_to_result(detections_to_return_, input);
}

std::expected<void, earscope::core::PipelineError>
MockInferenceBackend::validate_input(const earscope::core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(earscope::core::PipelineError::InvalidFrame);
  }
  return {};
}

}  // namespace earscope::vision
