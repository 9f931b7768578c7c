/**
 * earscope-server: HTTP API for ear endoscopy analysis (circle crop, detection, remap).
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/earscope_server [--config path] [--backend mock|onnx] [--model path]
 *                                [--device cpu|cuda] [--host addr] [--port n]
 * Routes: GET /api/health, GET /api/info, POST /api/analyze
 */

#include <earscope/app/api_handler.hpp>
#include <earscope/app/config.hpp>
#include <earscope/app/detector_state.hpp>
#include <earscope/app/http_server.hpp>
#include <earscope/core/analysis.hpp>
#include <earscope/core/log.hpp>
#include <earscope/vision/circle_cropper.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char *argv[]) {
  std::string config_path;
  std::vector<std::pair<std::string, std::string>> overrides;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      overrides.emplace_back("backend_type", argv[++i]);
    } else if (arg == "--model" && i + 1 < argc) {
      overrides.emplace_back("model_path", argv[++i]);
    } else if (arg == "--device" && i + 1 < argc) {
      overrides.emplace_back("device", argv[++i]);
    } else if (arg == "--host" && i + 1 < argc) {
      overrides.emplace_back("host", argv[++i]);
    } else if (arg == "--port" && i + 1 < argc) {
      overrides.emplace_back("port", argv[++i]);
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: earscope_server [options]\n"
                << "  --config <path>   Service config (key=value file); default: built-in (mock)\n"
                << "  --backend <type>  Override backend: mock | onnx (default from config)\n"
                << "  --model <path>    Override model path (required for --backend onnx)\n"
                << "  --device <name>   cpu | cuda\n"
                << "  --host <addr>     Bind address (default 0.0.0.0)\n"
                << "  --port <n>        Listen port (default 5000)\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  earscope::app::ServiceConfig cfg = config_path.empty() ? earscope::app::default_config()
                                                         : earscope::app::load_config(config_path);
  for (const auto &[key, value] : overrides) {
    if (key == "backend_type") {
      if (!earscope::app::parse_backend_type(value, cfg.backend_type)) {
        std::cerr << "Unknown --backend " << value << " (use mock or onnx)\n";
        return 1;
      }
    } else if (!earscope::app::set_config_value(cfg, key, value)) {
      std::cerr << "Invalid value for --" << key << ": " << value << "\n";
      return 1;
    }
  }
  earscope::core::set_log_level(cfg.log_level);

  // The server comes up even when the model fails to load; /api/health then
  // reports detector_loaded=false and /api/analyze answers 500.
  earscope::app::DetectorState detector;
  if (!detector.initialize(cfg)) {
    EARSCOPE_LOG_WARN << "serving without a detector";
  }

  earscope::core::AnalysisParams defaults;
  defaults.conf_thres = cfg.conf_thres;
  defaults.iou_thres = cfg.iou_thres;
  const earscope::app::ApiHandler handler(detector, defaults,
                                          earscope::vision::CircleCropper(cfg.min_radius_ratio));

  earscope::app::HttpServerOptions options;
  options.host = cfg.host;
  options.port = cfg.port;
  options.threads = cfg.server_threads;
  options.max_body_bytes = cfg.max_body_bytes;

  try {
    earscope::app::HttpServer server(handler, options);
    server.run();
  } catch (const std::exception &e) {
    EARSCOPE_LOG_ERROR << "server failed: " << e.what();
    return 1;
  }
  return 0;
}
