#pragma once

#include <earscope/core/analysis.hpp>
#include <earscope/core/crop_result.hpp>
#include <earscope/core/detection.hpp>
#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <earscope/vision/circle_cropper.hpp>
#include <earscope/vision/detection_engine.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace earscope::app {

/// Optional per-stage timing: (stage_index, duration_ms).
/// Stages: 0 = crop, 1 = infer, 2 = remap.
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

enum AnalysisStage : std::size_t {
  kCropStage = 0,
  kInferStage = 1,
  kRemapStage = 2,
};

/// Remap crop-space detections into the requested frame. Original: boxes get the
/// crop offset added and masks are placed into an original-sized grid. Cropped:
/// returned unchanged. A failed crop is the identity either way.
[[nodiscard]] std::vector<earscope::core::Detection> remap_detections(
    std::vector<earscope::core::Detection> detections,
    const earscope::core::CropResult& crop,
    earscope::core::CoordinateType target);

/// Crop -> infer -> remap for one image. Stateless apart from the shared engine;
/// analyze() is safe to call from many threads.
class AnalysisService {
 public:
  /// Throws std::invalid_argument when engine is null.
  explicit AnalysisService(std::shared_ptr<const earscope::vision::DetectionEngine> engine,
                           earscope::vision::CircleCropper cropper = earscope::vision::CircleCropper{});

  [[nodiscard]] std::expected<earscope::core::AnalysisResponse,
                              earscope::core::PipelineError>
  analyze(const earscope::core::Frame& image,
          const earscope::core::AnalysisParams& params,
          StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const earscope::vision::DetectionEngine& engine() const noexcept {
    return *engine_;
  }

 private:
  std::shared_ptr<const earscope::vision::DetectionEngine> engine_;
  earscope::vision::CircleCropper cropper_;
};

}  // namespace earscope::app
