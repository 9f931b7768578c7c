#pragma once

#include <earscope/core/detection.hpp>
#include <earscope/core/error.hpp>
#include <earscope/core/geometry.hpp>
#include <earscope/vision/inference_result.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace earscope::vision {

/// Ordered class labels; index = model class id.
using ClassVocabulary = std::vector<std::string>;

/// The 18 ear pathology labels in model output order.
[[nodiscard]] const ClassVocabulary& ear_pathology_classes();

/// Label for a class id; "class_<id>" when the id is outside the vocabulary.
[[nodiscard]] std::string class_name_for(const ClassVocabulary& classes,
                                         std::int64_t class_id);

/// Greedy per-class non-maximum suppression over the given candidate indices.
/// Candidates are visited by descending score (ties keep input order); a box
/// suppresses later boxes of the same class whose IoU exceeds iou_threshold.
/// Returns surviving indices in ascending (model output) order.
[[nodiscard]] std::vector<std::size_t> non_max_suppression(
    const std::vector<earscope::core::BBox>& boxes,
    const std::vector<float>& scores,
    const std::vector<std::int64_t>& class_ids,
    std::vector<std::size_t> candidates,
    float iou_threshold);

/// Decodes InferenceResult -> vector<Detection>: confidence filter, per-class NMS,
/// then mask decoding for the survivors only.
class DetectionDecoder {
 public:
  explicit DetectionDecoder(ClassVocabulary classes, float mask_threshold = 0.5f);

  [[nodiscard]] std::expected<std::vector<earscope::core::Detection>,
                              earscope::core::PipelineError>
  decode(const InferenceResult& result, float conf_thres, float iou_thres) const;

  [[nodiscard]] const ClassVocabulary& classes() const noexcept { return classes_; }
  [[nodiscard]] float mask_threshold() const noexcept { return mask_threshold_; }

 private:
  [[nodiscard]] std::optional<earscope::core::Mask> decode_mask(
      const InferenceResult& result, std::size_t index,
      const earscope::core::BBox& box) const;

  ClassVocabulary classes_;
  float mask_threshold_;
};

}  // namespace earscope::vision
