#include <earscope/app/image_payload.hpp>
#include <earscope/vision/load_image.hpp>
#include <websocketpp/base64/base64.hpp>
#include <span>

namespace earscope::app {

namespace ec = earscope::core;

namespace {

bool is_base64_char(char c) noexcept {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

bool is_ascii_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

}  // namespace

std::string_view strip_data_url_prefix(std::string_view payload) noexcept {
  const auto comma = payload.find(',');
  if (comma == std::string_view::npos) return payload;
  return payload.substr(comma + 1);
}

bool is_valid_base64(std::string_view payload) noexcept {
  if (payload.empty() || payload.size() % 4 != 0) return false;
  std::size_t padding = 0;
  for (std::size_t i = 0; i < payload.size(); ++i) {
    const char c = payload[i];
    if (c == '=') {
      ++padding;
      continue;
    }
    if (padding > 0 || !is_base64_char(c)) return false;
  }
  return padding <= 2;
}

std::string remove_ascii_whitespace(std::string_view payload) {
  std::string out;
  out.reserve(payload.size());
  for (const char c : payload) {
    if (!is_ascii_space(c)) out.push_back(c);
  }
  return out;
}

std::expected<std::vector<std::uint8_t>, ec::PipelineError> decode_base64(
    std::string_view payload) {
  const std::string compact = remove_ascii_whitespace(payload);
  if (!is_valid_base64(compact)) {
    return std::unexpected(ec::PipelineError::InvalidParameter);
  }
  const std::string raw = websocketpp::base64_decode(compact);
  return std::vector<std::uint8_t>(raw.begin(), raw.end());
}

std::expected<ec::Frame, ec::PipelineError> decode_image_payload(std::string_view payload) {
  auto bytes = decode_base64(strip_data_url_prefix(payload));
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  auto frame = earscope::vision::decode_frame(std::span<const std::uint8_t>(*bytes));
  if (!frame) {
    return std::unexpected(ec::PipelineError::DecodeFailed);
  }
  return std::move(*frame);
}

}  // namespace earscope::app
