// Unit tests for OnnxInferenceBackend.
// One test runs without a model (constructor with missing file). The rest require a
// YOLOv7-seg style .onnx export trained on the 18 ear pathology classes: set
// EARSCOPE_TEST_ONNX_MODEL to its path. They are skipped if the env var is unset or the
// file is missing, so CI without a model still passes.
#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <earscope/vision/detection_decoder.hpp>
#include <earscope/vision/onnx_inference_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace nv = earscope::vision;
namespace nc = earscope::core;

// Model path for tests that require a real ONNX model. If unset or file missing, those tests are skipped.
static std::string get_test_model_path() {
  const char* env = std::getenv("EARSCOPE_TEST_ONNX_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

static std::size_t num_classes() { return nv::ear_pathology_classes().size(); }

static nc::Frame make_bgr_frame(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buffer(nc::Frame::min_bytes(w, h, nc::PixelFormat::BGR8), std::byte{40});
  return nc::Frame(w, h, nc::PixelFormat::BGR8, std::move(buffer));
}

// --- Tests that run without a model ---

TEST(OnnxInferenceBackend, ConstructorThrowsWhenFileMissing) {
  // ONNX Runtime throws Ort::Exception when the model file does not exist.
  EXPECT_THROW(
      {
        nv::OnnxInferenceBackend backend(
            "nonexistent_onnx_model_12345_should_not_exist.onnx", num_classes());
      },
      Ort::Exception);
}

// --- Tests that require a real ONNX model (skip if EARSCOPE_TEST_ONNX_MODEL not set or missing) ---

TEST(OnnxInferenceBackend, ValidateInputRejectsEmptyFrame) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set EARSCOPE_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxInferenceBackend backend(path, num_classes());
  auto valid = backend.validate_input(nc::Frame{});
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), nc::PipelineError::InvalidFrame);
}

TEST(OnnxInferenceBackend, ValidateInputRejectsUnknownFormat) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set EARSCOPE_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxInferenceBackend backend(path, num_classes());
  std::vector<std::byte> buf(64 * 64 * 3);
  nc::Frame f(64, 64, nc::PixelFormat::Unknown, std::move(buf));
  auto valid = backend.validate_input(f);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), nc::PipelineError::InvalidFrame);
}

TEST(OnnxInferenceBackend, AcceptsAnyImageSize) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set EARSCOPE_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxInferenceBackend backend(path, num_classes());
  EXPECT_TRUE(backend.validate_input(make_bgr_frame(320, 240)).has_value());
  EXPECT_TRUE(backend.validate_input(make_bgr_frame(900, 900)).has_value());
}

TEST(OnnxInferenceBackend, InferReturnsSaneResult) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set EARSCOPE_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxInferenceBackend backend(path, num_classes());
  backend.warmup();
  const nc::Frame f = make_bgr_frame(480, 360);
  auto result = backend.infer(f);
  ASSERT_TRUE(result.has_value()) << "infer() should succeed with valid frame";
  EXPECT_EQ(result->boxes.size(), result->num_detections * 4u);
  EXPECT_EQ(result->scores.size(), result->num_detections);
  EXPECT_EQ(result->class_ids.size(), result->num_detections);
  EXPECT_EQ(result->image_width, 480u);
  EXPECT_EQ(result->image_height, 360u);
  for (std::uint32_t i = 0; i < result->num_detections; ++i) {
    EXPECT_GE(result->scores[i], 0.f);
    EXPECT_LE(result->scores[i], 1.f);
    EXPECT_GE(result->boxes[i * 4 + 0], 0.f);
    EXPECT_LE(result->boxes[i * 4 + 2], 480.f);
  }
  if (result->num_mask_coeffs > 0) {
    EXPECT_EQ(result->mask_coeffs.size(),
              static_cast<std::size_t>(result->num_detections) * result->num_mask_coeffs);
    EXPECT_EQ(result->prototypes.channels, result->num_mask_coeffs);
  }
}

TEST(OnnxInferenceBackend, WarmupDoesNotThrow) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set EARSCOPE_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxInferenceBackend backend(path, num_classes());
  EXPECT_NO_THROW(backend.warmup());
  EXPECT_EQ(backend.device(), "cpu");
  EXPECT_GT(backend.input_size(), 0u);
}
