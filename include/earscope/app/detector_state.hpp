#pragma once

#include <earscope/app/config.hpp>
#include <earscope/vision/detection_engine.hpp>
#include <memory>
#include <mutex>

namespace earscope::app {

/// Build the detection engine described by config (mock or ONNX backend with
/// the ear pathology vocabulary). Throws when the model cannot be loaded.
[[nodiscard]] std::unique_ptr<earscope::vision::DetectionEngine> make_detection_engine(
    const ServiceConfig& config);

/// Process-wide detector readiness: uninitialized -> ready, never back.
/// Owned by main and shared with request handlers; engine() is safe to call from
/// any thread.
class DetectorState {
 public:
  DetectorState() = default;

  DetectorState(const DetectorState&) = delete;
  DetectorState& operator=(const DetectorState&) = delete;

  /// Move to the ready phase with the given engine. Ignored once ready.
  void set_ready(std::shared_ptr<const earscope::vision::DetectionEngine> engine);

  /// Build the engine from config and move to ready. On failure logs the cause,
  /// stays uninitialized and returns false.
  bool initialize(const ServiceConfig& config);

  [[nodiscard]] bool ready() const;

  /// Null while uninitialized.
  [[nodiscard]] std::shared_ptr<const earscope::vision::DetectionEngine> engine() const;

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const earscope::vision::DetectionEngine> engine_;
};

}  // namespace earscope::app
