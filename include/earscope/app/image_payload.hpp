#pragma once

#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace earscope::app {

/// Drop a data-URL header ("data:image/png;base64,"): everything up to and
/// including the first comma. Payloads without a comma are returned unchanged.
[[nodiscard]] std::string_view strip_data_url_prefix(std::string_view payload) noexcept;

/// True when payload is canonical base64: alphabet A-Z a-z 0-9 + /, length a
/// multiple of 4, and at most two trailing '=' with nothing after them.
[[nodiscard]] bool is_valid_base64(std::string_view payload) noexcept;

/// Copy of payload without spaces, tabs and line breaks (MIME-wrapped base64).
[[nodiscard]] std::string remove_ascii_whitespace(std::string_view payload);

/// Base64 decode after removing ASCII whitespace; the remaining text must pass
/// is_valid_base64. InvalidParameter otherwise.
[[nodiscard]] std::expected<std::vector<std::uint8_t>, earscope::core::PipelineError>
decode_base64(std::string_view payload);

/// Image field of a request -> BGR8 Frame. InvalidParameter for malformed base64,
/// DecodeFailed when the bytes are not an image.
[[nodiscard]] std::expected<earscope::core::Frame, earscope::core::PipelineError>
decode_image_payload(std::string_view payload);

}  // namespace earscope::app
