#include <earscope/app/json_codec.hpp>
#include <cmath>

namespace earscope::app {

namespace ec = earscope::core;
using nlohmann::json;

namespace {

// Shortest decimal for a float: 0.45f goes out as 0.45, not 0.44999998807907104.
double wire(float v) {
  return std::round(static_cast<double>(v) * 1e6) / 1e6;
}

std::unexpected<RequestError> reject(std::string field, std::string message) {
  return std::unexpected(
      RequestError{ec::PipelineError::InvalidParameter, std::move(field), std::move(message)});
}

bool absent(const json& doc, const char* key) {
  const auto it = doc.find(key);
  return it == doc.end() || it->is_null();
}

std::expected<float, RequestError> read_threshold(const json& doc, const char* key,
                                                  float fallback) {
  if (absent(doc, key)) return fallback;
  const json& value = doc.at(key);
  if (!value.is_number()) {
    return reject(key, std::string(key) + " must be a number");
  }
  const double v = value.get<double>();
  if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
    return reject(key, std::string(key) + " must be within [0, 1]");
  }
  return static_cast<float>(v);
}

json shape_json(const ec::Shape& s) {
  return json::array({s.height, s.width});
}

}  // namespace

std::expected<AnalysisRequest, RequestError> parse_analysis_request(
    std::string_view body, const ec::AnalysisParams& defaults) {
  if (body.empty()) {
    return reject("body", "request body is empty");
  }
  const json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) {
    return reject("body", "request body must be a JSON object");
  }

  AnalysisRequest request;
  request.params = defaults;

  const auto image = doc.find("image");
  if (image == doc.end() || !image->is_string() || image->get_ref<const std::string&>().empty()) {
    return reject("image", "image must be a non-empty base64 string");
  }
  request.image = image->get<std::string>();

  auto conf = read_threshold(doc, "conf_thres", defaults.conf_thres);
  if (!conf) return std::unexpected(conf.error());
  request.params.conf_thres = *conf;

  auto iou = read_threshold(doc, "iou_thres", defaults.iou_thres);
  if (!iou) return std::unexpected(iou.error());
  request.params.iou_thres = *iou;

  if (!absent(doc, "include_crop_coords")) {
    const json& value = doc.at("include_crop_coords");
    if (!value.is_boolean()) {
      return reject("include_crop_coords", "include_crop_coords must be a boolean");
    }
    request.params.include_crop_coords = value.get<bool>();
  }

  if (!absent(doc, "coordinate_type")) {
    const json& value = doc.at("coordinate_type");
    const auto parsed = value.is_string()
                            ? ec::parse_coordinate_type(value.get_ref<const std::string&>())
                            : std::nullopt;
    if (!parsed) {
      return reject("coordinate_type", "coordinate_type must be \"original\" or \"cropped\"");
    }
    request.params.coordinate_type = *parsed;
  }
  return request;
}

json to_json(const ec::Detection& detection) {
  json out = {
      {"bbox", json::array({wire(detection.bbox.x1), wire(detection.bbox.y1),
                            wire(detection.bbox.x2), wire(detection.bbox.y2)})},
      {"confidence", wire(detection.confidence)},
      {"class_id", detection.class_id},
      {"class_name", detection.class_name},
  };
  if (detection.mask) {
    const ec::Mask& mask = *detection.mask;
    json rows = json::array();
    for (std::uint32_t y = 0; y < mask.height; ++y) {
      json row = json::array();
      for (std::uint32_t x = 0; x < mask.width; ++x) {
        row.push_back(mask.at(x, y) ? 1 : 0);
      }
      rows.push_back(std::move(row));
    }
    out["mask"] = std::move(rows);
  }
  return out;
}

json to_json(const ec::CropResult& crop) {
  json out = {
      {"success", crop.success},
      {"center", nullptr},
      {"radius", nullptr},
      {"crop_box", json::array({crop.crop_box.x1, crop.crop_box.y1, crop.crop_box.x2,
                                crop.crop_box.y2})},
      {"original_shape", shape_json(crop.original_shape)},
      {"cropped_shape", nullptr},
      {"threshold", crop.threshold},
  };
  if (crop.center) out["center"] = json::array({wire(crop.center->x), wire(crop.center->y)});
  if (crop.radius) out["radius"] = *crop.radius;
  if (crop.cropped_shape) out["cropped_shape"] = shape_json(*crop.cropped_shape);
  return out;
}

json to_json(const ec::AnalysisParams& params) {
  return json{
      {"conf_thres", wire(params.conf_thres)},
      {"iou_thres", wire(params.iou_thres)},
      {"include_crop_coords", params.include_crop_coords},
      {"coordinate_type", std::string(ec::to_string(params.coordinate_type))},
  };
}

json to_json(const ec::AnalysisResponse& response) {
  json detections = json::array();
  for (const auto& d : response.detections) {
    detections.push_back(to_json(d));
  }
  json out = {
      {"detections", std::move(detections)},
      {"coordinate_type", std::string(ec::to_string(response.coordinate_type))},
      {"parameters", to_json(response.parameters)},
  };
  if (response.crop_info) {
    out["crop_info"] = to_json(*response.crop_info);
  }
  return out;
}

json error_body(std::string_view message, std::string_view type) {
  return json{{"error", std::string(message)}, {"type", std::string(type)}};
}

}  // namespace earscope::app
