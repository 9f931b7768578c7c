#pragma once

#include <earscope/core/log.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace earscope::app {

/// Inference backend type: mock (synthetic) or onnx (real model).
enum class InferenceBackendType {
  Mock,
  Onnx,
};

/// Service configuration: model, server, default thresholds, cropper tuning.
struct ServiceConfig {
  std::string model_path;
  InferenceBackendType backend_type{InferenceBackendType::Mock};
  std::string device{"cpu"};
  std::uint32_t img_size{640};

  std::string host{"0.0.0.0"};
  std::uint16_t port{5000};
  std::size_t server_threads{2};
  std::size_t max_body_bytes{64u * 1024u * 1024u};

  float conf_thres{0.25f};
  float iou_thres{0.45f};
  double min_radius_ratio{0.18};
  float mask_threshold{0.5f};

  earscope::core::LogLevel log_level{earscope::core::LogLevel::Info};
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Unknown keys are ignored; malformed values keep the default and log a warning.
ServiceConfig load_config(const std::string& path);

/// Apply one key=value setting (file line or command-line override). Returns false
/// and keeps the previous value when the value does not parse or is out of range
/// (thresholds outside [0, 1], min_radius_ratio outside (0, 1], sizes <= 0).
bool set_config_value(ServiceConfig& config, const std::string& key, const std::string& value);

/// Default config when no file is provided.
ServiceConfig default_config();

/// Parses "mock" / "onnx"; returns false for anything else.
bool parse_backend_type(const std::string& value, InferenceBackendType& out);

}  // namespace earscope::app
