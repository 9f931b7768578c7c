#pragma once

#include <earscope/core/detection.hpp>
#include <earscope/vision/inference_backend.hpp>
#include <cstdint>
#include <vector>

namespace earscope::vision {

/// Mock backend that returns configurable candidates (for tests/demo).
/// Candidate boxes and masks are returned as given, whatever the input frame.
class MockInferenceBackend : public IInferenceBackend {
 public:
  explicit MockInferenceBackend(std::uint32_t input_size = 640)
      : input_size_(input_size) {}

  /// Set candidates to return on subsequent infer() calls.
  void set_detections(std::vector<earscope::core::Detection> detections);

  [[nodiscard]] std::expected<InferenceResult, earscope::core::PipelineError>
  infer(const earscope::core::Frame& input) override;

  [[nodiscard]] std::expected<void, earscope::core::PipelineError>
  validate_input(const earscope::core::Frame& input) const override;

  [[nodiscard]] bool is_reentrant() const noexcept override { return true; }

  [[nodiscard]] std::uint32_t input_size() const noexcept override {
    return input_size_;
  }

 private:
  std::vector<earscope::core::Detection> detections_to_return_;
  std::uint32_t input_size_;
};

}  // namespace earscope::vision
