#include <earscope/app/api_handler.hpp>
#include <earscope/app/analysis_service.hpp>
#include <earscope/app/image_payload.hpp>
#include <earscope/app/json_codec.hpp>
#include <earscope/core/log.hpp>
#include <earscope/vision/detection_decoder.hpp>
#include <exception>

namespace earscope::app {

namespace ec = earscope::core;
using nlohmann::json;

namespace {

HttpResponse json_response(int status, const json& body) {
  return HttpResponse{status, body.dump(), "application/json"};
}

HttpResponse input_error(std::string_view message) {
  return json_response(400, error_body(message, "InputError"));
}

HttpResponse internal_error() {
  return json_response(500, error_body("internal error", "InternalError"));
}

HttpResponse not_ready() {
  return json_response(500, error_body("detector not loaded", "EngineNotReady"));
}

std::string_view strip_query(std::string_view path) {
  const auto q = path.find('?');
  return q == std::string_view::npos ? path : path.substr(0, q);
}

}  // namespace

ApiHandler::ApiHandler(const DetectorState& detector,
                       ec::AnalysisParams defaults,
                       earscope::vision::CircleCropper cropper)
    : detector_(detector), defaults_(defaults), cropper_(cropper) {}

HttpResponse ApiHandler::handle(std::string_view method,
                                std::string_view path,
                                std::string_view body) const {
  const std::string_view route = strip_query(path);
  std::string_view allowed;
  if (route == "/api/health" || route == "/api/info") {
    allowed = "GET";
  } else if (route == "/api/analyze") {
    allowed = "POST";
  } else {
    return json_response(404, error_body("not found", "NotFound"));
  }

  if (method == "OPTIONS") {
    return HttpResponse{204, "", "text/plain"};
  }
  if (method != allowed) {
    return json_response(405, error_body("method not allowed", "MethodNotAllowed"));
  }
  if (route == "/api/health") return health();
  if (route == "/api/info") return info();
  return analyze(body);
}

HttpResponse ApiHandler::health() const {
  return json_response(200, json{{"status", "healthy"},
                                 {"detector_loaded", detector_.ready()}});
}

HttpResponse ApiHandler::info() const {
  const auto engine = detector_.engine();
  const auto& vocabulary =
      engine ? engine->classes() : earscope::vision::ear_pathology_classes();
  json classes = json::array();
  for (const auto& name : vocabulary) classes.push_back(name);
  json out = {
      {"name", std::string(kServiceName)},
      {"version", std::string(kServiceVersion)},
      {"features", json::array({"circle_crop", "detection", "segmentation",
                                "coordinate_remap"})},
      {"detector_loaded", engine != nullptr},
      {"classes", std::move(classes)},
  };
  if (engine) {
    out["device"] = engine->device();
    out["img_size"] = engine->input_size();
  }
  return json_response(200, out);
}

HttpResponse ApiHandler::analyze(std::string_view body) const {
  const auto engine = detector_.engine();
  if (!engine) {
    return not_ready();
  }

  auto request = parse_analysis_request(body, defaults_);
  if (!request) {
    return input_error(request.error().message);
  }

  auto frame = decode_image_payload(request->image);
  if (!frame) {
    return input_error(frame.error() == ec::PipelineError::InvalidParameter
                           ? "image is not valid base64"
                           : "image could not be decoded");
  }

  const auto& params = request->params;
  try {
    const AnalysisService service(engine, cropper_);
    auto response = service.analyze(*frame, params);
    if (!response) {
      const ec::PipelineError error = response.error();
      if (ec::is_input_error(error)) {
        return input_error("invalid input: " + std::string(ec::to_string(error)));
      }
      EARSCOPE_LOG_ERROR << "analysis failed (" << ec::to_string(error) << ") image "
                         << frame->width() << "x" << frame->height() << " conf_thres="
                         << params.conf_thres << " iou_thres=" << params.iou_thres
                         << " coordinate_type=" << ec::to_string(params.coordinate_type);
      return internal_error();
    }
    EARSCOPE_LOG_INFO << "analyzed " << frame->width() << "x" << frame->height() << ": "
                      << response->detections.size() << " detection(s), crop "
                      << (response->crop_info && response->crop_info->success ? "found"
                                                                             : "not reported");
    return json_response(200, to_json(*response));
  } catch (const std::exception& e) {
    EARSCOPE_LOG_ERROR << "analysis threw: " << e.what() << " image " << frame->width()
                       << "x" << frame->height() << " conf_thres=" << params.conf_thres
                       << " iou_thres=" << params.iou_thres
                       << " coordinate_type=" << ec::to_string(params.coordinate_type);
    return internal_error();
  }
}

}  // namespace earscope::app
