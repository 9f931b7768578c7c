#include <earscope/app/analysis_service.hpp>
#include <earscope/core/geometry.hpp>
#include <earscope/core/log.hpp>
#include <chrono>
#include <stdexcept>

namespace earscope::app {

namespace ec = earscope::core;

namespace {

using Clock = std::chrono::steady_clock;

void report(StageTimingCallback* timing_cb, std::size_t stage, Clock::time_point start) {
  if (!timing_cb) return;
  const double ms = 1e-6 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count());
  (*timing_cb)(stage, ms);
}

}  // namespace

std::vector<ec::Detection> remap_detections(std::vector<ec::Detection> detections,
                                            const ec::CropResult& crop,
                                            ec::CoordinateType target) {
  if (!crop.success || target == ec::CoordinateType::Cropped) {
    return detections;
  }
  if (is_full_extent(crop.crop_box, crop.original_shape)) {
    return detections;
  }
  for (auto& det : detections) {
    det.bbox = to_original(det.bbox, crop.crop_box);
    if (det.mask) {
      det.mask = place_mask(*det.mask, crop.crop_box, crop.original_shape);
    }
  }
  return detections;
}

AnalysisService::AnalysisService(std::shared_ptr<const earscope::vision::DetectionEngine> engine,
                                 earscope::vision::CircleCropper cropper)
    : engine_(std::move(engine)), cropper_(cropper) {
  if (!engine_) {
    throw std::invalid_argument("AnalysisService: engine must not be null");
  }
}

std::expected<ec::AnalysisResponse, ec::PipelineError> AnalysisService::analyze(
    const ec::Frame& image,
    const ec::AnalysisParams& params,
    StageTimingCallback* timing_cb) const {
  auto start = Clock::now();
  auto crop = cropper_.detect(image);
  report(timing_cb, kCropStage, start);
  if (!crop) {
    return std::unexpected(crop.error());
  }
  EARSCOPE_LOG_DEBUG << "crop " << (crop->success ? "found" : "not found") << " ["
                     << crop->crop_box.x1 << "," << crop->crop_box.y1 << ","
                     << crop->crop_box.x2 << "," << crop->crop_box.y2
                     << "] otsu=" << crop->threshold;

  start = Clock::now();
  std::expected<std::vector<ec::Detection>, ec::PipelineError> detections;
  if (crop->success) {
    const ec::Frame region = ec::crop_frame(image, crop->crop_box);
    if (region.empty()) {
      return std::unexpected(ec::PipelineError::InvalidFrame);
    }
    detections = engine_->infer(region, params.conf_thres, params.iou_thres);
  } else {
    detections = engine_->infer(image, params.conf_thres, params.iou_thres);
  }
  report(timing_cb, kInferStage, start);
  if (!detections) {
    return std::unexpected(detections.error());
  }

  start = Clock::now();
  ec::AnalysisResponse response;
  response.coordinate_type = crop->success ? params.coordinate_type
                                           : ec::CoordinateType::Original;
  response.detections =
      remap_detections(std::move(*detections), *crop, response.coordinate_type);
  response.parameters = params;
  if (params.include_crop_coords) {
    response.crop_info = std::move(*crop);
  }
  report(timing_cb, kRemapStage, start);
  return response;
}

}  // namespace earscope::app
