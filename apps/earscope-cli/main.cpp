/**
 * earscope-cli: Run the ear analysis pipeline on image(s); print the JSON response.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/earscope_cli [--config path] [--input path]...
 * With --input: also writes each response to output/<basename>.json (same content as terminal).
 * Several --input images are analyzed in parallel on one shared engine.
 */

#include <earscope/app/analysis_service.hpp>
#include <earscope/app/config.hpp>
#include <earscope/app/detector_state.hpp>
#include <earscope/app/json_codec.hpp>
#include <earscope/app/pipeline_runner.hpp>
#include <earscope/core/analysis.hpp>
#include <earscope/core/frame.hpp>
#include <earscope/core/log.hpp>
#include <earscope/vision/circle_cropper.hpp>
#include <earscope/vision/load_image.hpp>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

earscope::core::Frame make_dummy_frame(std::uint32_t w, std::uint32_t h) {
  const std::size_t bytes = static_cast<std::size_t>(w) * h * 3;
  std::vector<std::byte> buffer(bytes, std::byte{0});
  return earscope::core::Frame(w, h, earscope::core::PixelFormat::BGR8, std::move(buffer));
}

void write_output(const std::string &input_path, const std::string &text) {
  std::filesystem::path p(input_path);
  std::filesystem::path out_dir("output");
  std::filesystem::create_directories(out_dir);
  std::filesystem::path out_file = out_dir / (p.stem().string() + ".json");
  std::ofstream f(out_file);
  if (f) {
    f << text << "\n";
  } else {
    std::cerr << "Warning: could not write " << out_file << "\n";
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::vector<std::pair<std::string, std::string>> overrides;
  std::string coords;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--backend" && i + 1 < argc) {
      overrides.emplace_back("backend_type", argv[++i]);
    } else if (arg == "--model" && i + 1 < argc) {
      overrides.emplace_back("model_path", argv[++i]);
    } else if (arg == "--device" && i + 1 < argc) {
      overrides.emplace_back("device", argv[++i]);
    } else if (arg == "--conf" && i + 1 < argc) {
      overrides.emplace_back("conf_thres", argv[++i]);
    } else if (arg == "--iou" && i + 1 < argc) {
      overrides.emplace_back("iou_thres", argv[++i]);
    } else if (arg == "--coords" && i + 1 < argc) {
      coords = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: earscope_cli [options] [--input <path>]...\n"
                << "  --config <path>   Service config (key=value file); default: built-in (mock)\n"
                << "  --backend <type>  Override backend: mock | onnx (default from config)\n"
                << "  --model <path>    Override model path (required for --backend onnx)\n"
                << "  --device <name>   cpu | cuda\n"
                << "  --conf <value>    Confidence threshold in [0, 1]\n"
                << "  --iou <value>     NMS IoU threshold in [0, 1]\n"
                << "  --coords <frame>  original | cropped (default original)\n"
                << "  --input <path>    Image path, repeatable (optional; demo uses synthetic frame)\n";
      return 0;
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
      std::cerr << "Invalid value for " << key << ": " << value << "\n";
      return 1;
    }
  }
  earscope::core::set_log_level(cfg.log_level);

  earscope::core::AnalysisParams params;
  params.conf_thres = cfg.conf_thres;
  params.iou_thres = cfg.iou_thres;
  if (!coords.empty()) {
    const auto parsed = earscope::core::parse_coordinate_type(coords);
    if (!parsed) {
      std::cerr << "Unknown --coords " << coords << " (use original or cropped)\n";
      return 1;
    }
    params.coordinate_type = *parsed;
  }

  std::shared_ptr<const earscope::vision::DetectionEngine> engine;
  try {
    engine = earscope::app::make_detection_engine(cfg);
  } catch (const std::exception &e) {
    std::cerr << "Failed to load detector: " << e.what() << "\n";
    return 1;
  }
  const earscope::app::AnalysisService service(
      engine, earscope::vision::CircleCropper(cfg.min_radius_ratio));

  std::vector<earscope::core::Frame> frames;
  if (input_paths.empty()) {
    frames.push_back(make_dummy_frame(640, 480));
  }
  for (const auto &path : input_paths) {
    auto loaded = earscope::vision::load_frame_from_image(path);
    if (!loaded) {
      std::cerr << "Failed to load image: " << path << "\n";
      return 1;
    }
    frames.push_back(std::move(*loaded));
  }

  std::vector<std::optional<earscope::app::AnalysisOutcome>> outcomes(frames.size());
  std::mutex outcomes_mutex;
  auto collect = [&](std::size_t index, const earscope::app::AnalysisOutcome &outcome) {
    std::lock_guard lock(outcomes_mutex);
    outcomes[index] = outcome;
  };
  if (frames.size() > 1) {
    earscope::app::analyze_batch_parallel(service, frames, params, collect);
  } else {
    earscope::app::analyze_batch(service, frames, params, collect);
  }

  int status = 0;
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    const std::string label = input_paths.empty() ? "synthetic frame" : input_paths[i];
    const auto &outcome = outcomes[i];
    if (!outcome || !*outcome) {
      std::cerr << "Analysis error for " << label << ": "
                << (outcome ? earscope::core::to_string(outcome->error()) : "no result") << "\n";
      status = 1;
      continue;
    }
    const std::string text = earscope::app::to_json(**outcome).dump(2);
    if (outcomes.size() > 1) std::cout << "# " << label << "\n";
    std::cout << text << "\n";
    if (!input_paths.empty()) {
      write_output(input_paths[i], text);
    }
  }
  return status;
}
