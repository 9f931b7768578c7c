#pragma once

#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <earscope/vision/inference_result.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace earscope::vision {

/// Abstract inference backend: Frame -> InferenceResult (raw candidates).
/// Implement infer(); optionally override validate_input, warmup and the
/// descriptive accessors.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-frame inference. Must be implemented.
  [[nodiscard]] virtual std::expected<InferenceResult, earscope::core::PipelineError>
  infer(const earscope::core::Frame& input) = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, earscope::core::PipelineError>
  validate_input(const earscope::core::Frame& /*input*/) const {
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}

  /// True if infer() may be called from several threads at once. Backends that
  /// keep per-call scratch state return false and are serialized by the engine.
  [[nodiscard]] virtual bool is_reentrant() const noexcept { return false; }

  /// Execution device, e.g. "cpu" or "cuda".
  [[nodiscard]] virtual std::string device() const { return "cpu"; }

  /// Square network input size in pixels; 0 if the backend has none.
  [[nodiscard]] virtual std::uint32_t input_size() const noexcept { return 0; }
};

}  // namespace earscope::vision
