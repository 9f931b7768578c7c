#pragma once

#include <earscope/core/geometry.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace earscope::core {

/// Single detected finding. bbox and mask are expressed in one coordinate frame
/// at a time (crop-space inside the engine).
struct Detection {
  BBox bbox{};
  float confidence{0.f};
  std::int32_t class_id{0};
  std::string class_name;
  std::optional<Mask> mask;  // absent when the model emits no masks
};

}  // namespace earscope::core
