#pragma once

#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <earscope/vision/inference_backend.hpp>
#include <earscope/vision/inference_result.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace earscope::vision {

/// ONNX Runtime inference backend for YOLOv7-seg style exports.
///
/// Expected model: one float image input [1, 3, H, W] (dynamic H/W fall back to
/// img_size) and
/// - **pred** (rank 3): [1, N, 5 + nc + nm] or [1, 5 + nc + nm, N] with
///   (cx, cy, w, h, objectness, class scores..., mask coefficients...);
/// - **proto** (rank 4, optional): [1, nm, mh, mw] segmentation prototypes.
/// Without a proto output the model is treated as detection-only (nm = 0).
///
/// Input contract: any 8-bit Frame (gray, RGB, BGR, with or without alpha).
/// The backend letterboxes to the network size (pad value 114), converts to RGB
/// scaled to [0, 1] and copies HWC to NCHW. Boxes come back in source-image pixels.
/// Not reentrant: the NCHW scratch buffer is shared across calls.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param num_classes Number of class score channels (nc) in pred.
  /// \param img_size Network input size used when the model input is dynamic.
  /// \param device "cpu" or "cuda"; CUDA falls back to CPU if unavailable.
  OnnxInferenceBackend(std::string model_path,
                       std::size_t num_classes,
                       std::uint32_t img_size = 640,
                       std::string device = "cpu");

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<InferenceResult, earscope::core::PipelineError>
  infer(const earscope::core::Frame& input) override;

  [[nodiscard]] std::expected<void, earscope::core::PipelineError>
  validate_input(const earscope::core::Frame& input) const override;

  void warmup() override;

  [[nodiscard]] std::string device() const override;
  [[nodiscard]] std::uint32_t input_size() const noexcept override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace earscope::vision
