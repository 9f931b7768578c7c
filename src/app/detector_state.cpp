#include <earscope/app/detector_state.hpp>
#include <earscope/core/detection.hpp>
#include <earscope/core/log.hpp>
#include <earscope/vision/detection_decoder.hpp>
#include <earscope/vision/mock_inference_backend.hpp>
#include <earscope/vision/onnx_inference_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <stdexcept>

namespace earscope::app {

namespace ev = earscope::vision;

std::unique_ptr<ev::DetectionEngine> make_detection_engine(const ServiceConfig& config) {
  const ev::ClassVocabulary& classes = ev::ear_pathology_classes();

  std::unique_ptr<ev::IInferenceBackend> backend;
  if (config.backend_type == InferenceBackendType::Onnx) {
    if (config.model_path.empty()) {
      throw std::runtime_error("backend_type=onnx requires model_path to be set in config");
    }
    auto onnx = std::make_unique<ev::OnnxInferenceBackend>(
        config.model_path, classes.size(), config.img_size, config.device);
    onnx->warmup();
    backend = std::move(onnx);
  } else {
    auto mock = std::make_unique<ev::MockInferenceBackend>(config.img_size);
    earscope::core::Detection demo;
    demo.bbox = {100.f, 100.f, 300.f, 300.f};
    demo.confidence = 0.9f;
    demo.class_id = static_cast<std::int32_t>(classes.size() - 1);  // "normal"
    mock->set_detections({demo});
    backend = std::move(mock);
  }

  return std::make_unique<ev::DetectionEngine>(
      std::move(backend), ev::DetectionDecoder(classes, config.mask_threshold));
}

void DetectorState::set_ready(std::shared_ptr<const ev::DetectionEngine> engine) {
  if (!engine) return;
  std::lock_guard lock(mutex_);
  if (!engine_) {
    engine_ = std::move(engine);
  }
}

bool DetectorState::initialize(const ServiceConfig& config) {
  try {
    set_ready(make_detection_engine(config));
  } catch (const Ort::Exception& e) {
    EARSCOPE_LOG_ERROR << "detector initialization failed (ONNX Runtime): " << e.what();
    return false;
  } catch (const std::exception& e) {
    EARSCOPE_LOG_ERROR << "detector initialization failed: " << e.what();
    return false;
  }
  const auto engine = this->engine();
  EARSCOPE_LOG_INFO << "detector ready (device " << engine->device() << ", img_size "
                    << engine->input_size() << ", "
                    << (engine->serializes_inference() ? "serialized" : "concurrent")
                    << " inference)";
  return true;
}

bool DetectorState::ready() const {
  std::lock_guard lock(mutex_);
  return engine_ != nullptr;
}

std::shared_ptr<const ev::DetectionEngine> DetectorState::engine() const {
  std::lock_guard lock(mutex_);
  return engine_;
}

}  // namespace earscope::app
