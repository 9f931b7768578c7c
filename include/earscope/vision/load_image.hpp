#pragma once

#include <earscope/core/frame.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace earscope::vision {

/// Load an image file into a Frame (BGR8). Returns nullopt on failure.
std::optional<earscope::core::Frame> load_frame_from_image(const std::string& path);

/// Decode encoded image bytes (JPEG, PNG, ...) into a BGR8 Frame. Returns nullopt
/// when the bytes are not a decodable image.
std::optional<earscope::core::Frame> decode_frame(std::span<const std::uint8_t> bytes);

}  // namespace earscope::vision
