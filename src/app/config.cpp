#include <earscope/app/config.hpp>
#include <earscope/core/log.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace earscope::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

// std::stoul accepts a leading '-' and wraps it, so the sign is checked first.
unsigned long parse_positive(const std::string& value, const char* key) {
  if (value.find('-') != std::string::npos) throw std::out_of_range(key);
  const unsigned long n = std::stoul(value);
  if (n == 0) throw std::out_of_range(key);
  return n;
}

float parse_unit_interval(const std::string& value, const char* key) {
  const float v = std::stof(value);
  if (!std::isfinite(v) || v < 0.0f || v > 1.0f) throw std::out_of_range(key);
  return v;
}

void apply(ServiceConfig& c, const std::string& key, const std::string& value) {
  if (key == "model_path") c.model_path = value;
  else if (key == "backend_type") {
    if (!parse_backend_type(value, c.backend_type)) {
      EARSCOPE_LOG_WARN << "config: unknown backend_type '" << value << "'";
    }
  }
  else if (key == "device") c.device = value;
  else if (key == "img_size") {
    const unsigned long size = parse_positive(value, "img_size");
    if (size > std::numeric_limits<std::uint32_t>::max()) throw std::out_of_range("img_size");
    c.img_size = static_cast<std::uint32_t>(size);
  }
  else if (key == "host") c.host = value;
  else if (key == "port") {
    const unsigned long port = std::stoul(value);
    if (port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
      throw std::out_of_range("port");
    }
    c.port = static_cast<std::uint16_t>(port);
  }
  else if (key == "server_threads") c.server_threads = parse_positive(value, "server_threads");
  else if (key == "max_body_bytes") c.max_body_bytes = parse_positive(value, "max_body_bytes");
  else if (key == "conf_thres") c.conf_thres = parse_unit_interval(value, "conf_thres");
  else if (key == "iou_thres") c.iou_thres = parse_unit_interval(value, "iou_thres");
  else if (key == "min_radius_ratio") {
    const double ratio = std::stod(value);
    if (!std::isfinite(ratio) || ratio <= 0.0 || ratio > 1.0) {
      throw std::out_of_range("min_radius_ratio");
    }
    c.min_radius_ratio = ratio;
  }
  else if (key == "mask_threshold") c.mask_threshold = parse_unit_interval(value, "mask_threshold");
  else if (key == "log_level") c.log_level = earscope::core::parse_log_level(value, c.log_level);
}

}  // namespace

bool parse_backend_type(const std::string& value, InferenceBackendType& out) {
  if (value == "onnx") {
    out = InferenceBackendType::Onnx;
    return true;
  }
  if (value == "mock") {
    out = InferenceBackendType::Mock;
    return true;
  }
  return false;
}

ServiceConfig default_config() {
  return ServiceConfig{};
}

ServiceConfig load_config(const std::string& path) {
  ServiceConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    EARSCOPE_LOG_WARN << "config file " << path << " not readable, using defaults";
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    set_config_value(c, key, value);
  }
  return c;
}

bool set_config_value(ServiceConfig& config, const std::string& key, const std::string& value) {
  try {
    apply(config, key, value);
  } catch (const std::logic_error&) {
    // Parse failures are invalid_argument; rejected ranges are out_of_range.
    EARSCOPE_LOG_WARN << "config: invalid value for " << key << ": '" << value
                      << "', keeping default";
    return false;
  }
  return true;
}

}  // namespace earscope::app
