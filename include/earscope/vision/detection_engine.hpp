#pragma once

#include <earscope/core/detection.hpp>
#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <earscope/vision/detection_decoder.hpp>
#include <earscope/vision/inference_backend.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace earscope::vision {

/// Detection engine adapter: runs the backend on one image and turns its raw
/// candidates into crop-space detections.
///
/// Thread-safety: infer() may be called concurrently. When the backend is not
/// reentrant, backend calls pass a single-slot gate (one inference in flight);
/// validation and decoding run outside the gate.
class DetectionEngine {
 public:
  DetectionEngine(std::unique_ptr<IInferenceBackend> backend,
                  DetectionDecoder decoder);

  DetectionEngine(const DetectionEngine&) = delete;
  DetectionEngine& operator=(const DetectionEngine&) = delete;

  [[nodiscard]] std::expected<std::vector<earscope::core::Detection>,
                              earscope::core::PipelineError>
  infer(const earscope::core::Frame& image, float conf_thres, float iou_thres) const;

  /// Run one backend warmup pass through the gate.
  void warmup();

  [[nodiscard]] const ClassVocabulary& classes() const noexcept {
    return decoder_.classes();
  }
  [[nodiscard]] std::string device() const { return backend_->device(); }
  [[nodiscard]] std::uint32_t input_size() const noexcept {
    return backend_->input_size();
  }
  [[nodiscard]] bool serializes_inference() const noexcept { return serialize_; }

 private:
  std::unique_ptr<IInferenceBackend> backend_;
  DetectionDecoder decoder_;
  bool serialize_;
  mutable std::mutex gate_;
};

}  // namespace earscope::vision
