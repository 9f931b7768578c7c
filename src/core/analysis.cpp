#include <earscope/core/analysis.hpp>

namespace earscope::core {

std::optional<CoordinateType> parse_coordinate_type(std::string_view s) noexcept {
  if (s == "original") return CoordinateType::Original;
  if (s == "cropped") return CoordinateType::Cropped;
  return std::nullopt;
}

}  // namespace earscope::core
