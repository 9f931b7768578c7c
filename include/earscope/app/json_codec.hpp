#pragma once

#include <earscope/core/analysis.hpp>
#include <earscope/core/crop_result.hpp>
#include <earscope/core/detection.hpp>
#include <earscope/core/error.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace earscope::app {

/// Decoded body of POST /api/analyze. image is still the raw (base64) text.
struct AnalysisRequest {
  std::string image;
  earscope::core::AnalysisParams params{};
};

/// Why a request body was rejected; field names the offending key ("body" for
/// the document itself).
struct RequestError {
  earscope::core::PipelineError code{earscope::core::PipelineError::InvalidParameter};
  std::string field;
  std::string message;
};

/// Parse and validate an analyze request. Missing or null optional keys take the
/// values from defaults; present keys must have the right JSON type and range.
[[nodiscard]] std::expected<AnalysisRequest, RequestError> parse_analysis_request(
    std::string_view body, const earscope::core::AnalysisParams& defaults = {});

[[nodiscard]] nlohmann::json to_json(const earscope::core::Detection& detection);
[[nodiscard]] nlohmann::json to_json(const earscope::core::CropResult& crop);
[[nodiscard]] nlohmann::json to_json(const earscope::core::AnalysisParams& params);
[[nodiscard]] nlohmann::json to_json(const earscope::core::AnalysisResponse& response);

/// Error body: {"error": message, "type": type}.
[[nodiscard]] nlohmann::json error_body(std::string_view message, std::string_view type);

}  // namespace earscope::app
