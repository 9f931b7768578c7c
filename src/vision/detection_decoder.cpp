#include <earscope/vision/detection_decoder.hpp>
#include <earscope/core/detection.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace earscope::vision {

namespace ec = earscope::core;

const ClassVocabulary& ear_pathology_classes() {
  static const ClassVocabulary kClasses = {
      "eardrum_perforation", "atresia",          "atrophic_scar",
      "blood_clot",          "cerumen",          "foreign_body",
      "middle_ear_effusion", "middle_ear_tumor", "otitis_externa",
      "otomycosis",          "retraction",       "tympanosclerosis",
      "ventilation_tube",    "otitis_media",     "tympanoplasty",
      "EAC_tumor",           "myringitis",       "normal",
  };
  return kClasses;
}

std::string class_name_for(const ClassVocabulary& classes, std::int64_t class_id) {
  if (class_id >= 0 && static_cast<std::size_t>(class_id) < classes.size()) {
    return classes[static_cast<std::size_t>(class_id)];
  }
  return "class_" + std::to_string(class_id);
}

std::vector<std::size_t> non_max_suppression(
    const std::vector<ec::BBox>& boxes,
    const std::vector<float>& scores,
    const std::vector<std::int64_t>& class_ids,
    std::vector<std::size_t> candidates,
    float iou_threshold) {
  std::stable_sort(candidates.begin(), candidates.end(),
                   [&](std::size_t a, std::size_t b) { return scores[a] > scores[b]; });

  std::vector<std::size_t> kept;
  std::vector<bool> suppressed(candidates.size(), false);
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (suppressed[i]) continue;
    const std::size_t best = candidates[i];
    kept.push_back(best);
    for (std::size_t j = i + 1; j < candidates.size(); ++j) {
      if (suppressed[j]) continue;
      const std::size_t other = candidates[j];
      if (class_ids[other] != class_ids[best]) continue;
      if (ec::box_iou(boxes[best], boxes[other]) > iou_threshold) {
        suppressed[j] = true;
      }
    }
  }
  std::sort(kept.begin(), kept.end());
  return kept;
}

DetectionDecoder::DetectionDecoder(ClassVocabulary classes, float mask_threshold)
    : classes_(std::move(classes)), mask_threshold_(mask_threshold) {}

std::expected<std::vector<ec::Detection>, ec::PipelineError>
DetectionDecoder::decode(const InferenceResult& result,
                         float conf_thres,
                         float iou_thres) const {
  const std::size_t n = static_cast<std::size_t>(result.num_detections);
  if (result.boxes.size() < n * 4 || result.scores.size() < n ||
      result.class_ids.size() < n) {
    return std::unexpected(ec::PipelineError::DecoderError);
  }
  if (!result.masks.empty() && result.masks.size() != n) {
    return std::unexpected(ec::PipelineError::DecoderError);
  }
  if (result.num_mask_coeffs > 0 &&
      result.mask_coeffs.size() < n * result.num_mask_coeffs) {
    return std::unexpected(ec::PipelineError::DecoderError);
  }

  const bool clip = result.image_width > 0 && result.image_height > 0;
  std::vector<ec::BBox> boxes(n);
  std::vector<std::size_t> candidates;
  for (std::size_t i = 0; i < n; ++i) {
    ec::BBox b{result.boxes[i * 4 + 0], result.boxes[i * 4 + 1],
               result.boxes[i * 4 + 2], result.boxes[i * 4 + 3]};
    if (clip) {
      b = ec::clip_box(b, static_cast<float>(result.image_width),
                       static_cast<float>(result.image_height));
    }
    boxes[i] = b;
    // Confidence filter before suppression.
    if (result.scores[i] >= conf_thres) {
      candidates.push_back(i);
    }
  }

  const auto kept = non_max_suppression(boxes, result.scores, result.class_ids,
                                        std::move(candidates), iou_thres);

  std::vector<ec::Detection> out;
  out.reserve(kept.size());
  for (const std::size_t i : kept) {
    ec::Detection d;
    d.bbox = boxes[i];
    d.confidence = result.scores[i];
    d.class_id = static_cast<std::int32_t>(result.class_ids[i]);
    d.class_name = class_name_for(classes_, result.class_ids[i]);
    d.mask = decode_mask(result, i, boxes[i]);
    out.push_back(std::move(d));
  }
  return out;
}

std::optional<ec::Mask> DetectionDecoder::decode_mask(const InferenceResult& result,
                                                      std::size_t index,
                                                      const ec::BBox& box) const {
  if (!result.masks.empty()) {
    return result.masks[index];
  }

  const MaskPrototypes& proto = result.prototypes;
  const std::uint32_t nm = result.num_mask_coeffs;
  if (nm == 0 || proto.empty() || proto.channels != nm || result.image_width == 0 ||
      result.image_height == 0 || proto.input_width == 0 || proto.input_height == 0) {
    return std::nullopt;
  }

  const int ph = static_cast<int>(proto.height);
  const int pw = static_cast<int>(proto.width);
  const cv::Mat protos(static_cast<int>(nm), ph * pw, CV_32F,
                       const_cast<float*>(proto.data.data()));
  const cv::Mat coeffs(1, static_cast<int>(nm), CV_32F,
                       const_cast<float*>(result.mask_coeffs.data() + index * nm));

  // sigmoid(coeffs . protos) at prototype resolution
  cv::Mat logits = cv::Mat(coeffs * protos).reshape(1, ph);
  cv::Mat prob;
  cv::exp(-logits, prob);
  cv::Mat denom = prob + 1.0;
  cv::divide(1.0, denom, prob);

  cv::Mat net_prob;
  cv::resize(prob, net_prob,
             cv::Size(static_cast<int>(proto.input_width), static_cast<int>(proto.input_height)),
             0, 0, cv::INTER_LINEAR);

  // Strip letterbox padding, then scale to the source image.
  const int content_w = static_cast<int>(std::lround(result.image_width * proto.scale));
  const int content_h = static_cast<int>(std::lround(result.image_height * proto.scale));
  const cv::Rect content =
      cv::Rect(static_cast<int>(std::lround(proto.pad_x)),
               static_cast<int>(std::lround(proto.pad_y)), content_w, content_h) &
      cv::Rect(0, 0, net_prob.cols, net_prob.rows);
  if (content.empty()) {
    return std::nullopt;
  }
  cv::Mat image_prob;
  cv::resize(net_prob(content), image_prob,
             cv::Size(static_cast<int>(result.image_width),
                      static_cast<int>(result.image_height)),
             0, 0, cv::INTER_LINEAR);

  ec::Mask mask(result.image_width, result.image_height);
  const auto x0 = static_cast<std::uint32_t>(std::max(0.f, std::floor(box.x1)));
  const auto y0 = static_cast<std::uint32_t>(std::max(0.f, std::floor(box.y1)));
  const auto x1 = std::min(result.image_width,
                           static_cast<std::uint32_t>(std::max(0.f, std::ceil(box.x2))));
  const auto y1 = std::min(result.image_height,
                           static_cast<std::uint32_t>(std::max(0.f, std::ceil(box.y2))));
  for (std::uint32_t y = y0; y < y1; ++y) {
    const float* row = image_prob.ptr<float>(static_cast<int>(y));
    for (std::uint32_t x = x0; x < x1; ++x) {
      mask.at(x, y) = row[x] > mask_threshold_ ? 1 : 0;
    }
  }
  return mask;
}

}  // namespace earscope::vision
