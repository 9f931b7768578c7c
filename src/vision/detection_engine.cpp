#include <earscope/vision/detection_engine.hpp>
#include <cmath>
#include <stdexcept>

namespace earscope::vision {

namespace ec = earscope::core;

namespace {

bool valid_threshold(float t) {
  return std::isfinite(t) && t >= 0.f && t <= 1.f;
}

}  // namespace

DetectionEngine::DetectionEngine(std::unique_ptr<IInferenceBackend> backend,
                                 DetectionDecoder decoder)
    : backend_(std::move(backend)),
      decoder_(std::move(decoder)),
      serialize_(backend_ ? !backend_->is_reentrant() : true) {
  if (!backend_) {
    throw std::invalid_argument("DetectionEngine: backend is null");
  }
}

std::expected<std::vector<ec::Detection>, ec::PipelineError>
DetectionEngine::infer(const ec::Frame& image, float conf_thres, float iou_thres) const {
  if (!valid_threshold(conf_thres) || !valid_threshold(iou_thres)) {
    return std::unexpected(ec::PipelineError::InvalidParameter);
  }
  auto valid = backend_->validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  std::expected<InferenceResult, ec::PipelineError> raw;
  if (serialize_) {
    std::lock_guard lock(gate_);
    raw = backend_->infer(image);
  } else {
    raw = backend_->infer(image);
  }
  if (!raw) {
    return std::unexpected(raw.error());
  }
  return decoder_.decode(*raw, conf_thres, iou_thres);
}

void DetectionEngine::warmup() {
  std::lock_guard lock(gate_);
  backend_->warmup();
}

}  // namespace earscope::vision
