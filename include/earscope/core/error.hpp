#pragma once

#include <string_view>

namespace earscope::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  DecodeFailed,
  InvalidParameter,
  InferenceFailed,
  EngineNotReady,
  InvalidConfig,
  DecoderError,
};

/// Input errors are the caller's fault (HTTP 400); the rest are server side.
[[nodiscard]] constexpr bool is_input_error(PipelineError e) noexcept {
  return e == PipelineError::InvalidFrame || e == PipelineError::DecodeFailed ||
         e == PipelineError::InvalidParameter;
}

[[nodiscard]] constexpr std::string_view to_string(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::DecodeFailed:
      return "DecodeFailed";
    case PipelineError::InvalidParameter:
      return "InvalidParameter";
    case PipelineError::InferenceFailed:
      return "InferenceFailed";
    case PipelineError::EngineNotReady:
      return "EngineNotReady";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::DecoderError:
      return "DecoderError";
  }
  return "Unknown";
}

}  // namespace earscope::core
