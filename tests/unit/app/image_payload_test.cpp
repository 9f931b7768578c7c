#include <earscope/app/image_payload.hpp>
#include <earscope/core/error.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <string>
#include "support/test_images.hpp"

namespace na = earscope::app;
namespace nc = earscope::core;
namespace et = earscope::test;

TEST(ImagePayload, StripsDataUrlPrefix) {
  EXPECT_EQ(na::strip_data_url_prefix("data:image/png;base64,QUJD"), "QUJD");
  EXPECT_EQ(na::strip_data_url_prefix("QUJD"), "QUJD");
}

TEST(ImagePayload, ValidBase64) {
  EXPECT_TRUE(na::is_valid_base64("QUJD"));
  EXPECT_TRUE(na::is_valid_base64("QUI="));
  EXPECT_TRUE(na::is_valid_base64("QQ=="));
  EXPECT_TRUE(na::is_valid_base64("ab+/"));
}

TEST(ImagePayload, InvalidBase64) {
  EXPECT_FALSE(na::is_valid_base64(""));
  EXPECT_FALSE(na::is_valid_base64("not base64!"));
  EXPECT_FALSE(na::is_valid_base64("QUJ"));      // length not a multiple of 4
  EXPECT_FALSE(na::is_valid_base64("Q==="));     // three padding characters
  EXPECT_FALSE(na::is_valid_base64("Q=JD"));     // data after padding
  EXPECT_FALSE(na::is_valid_base64("QU\nJD"));
}

TEST(ImagePayload, DecodesBase64) {
  auto bytes = na::decode_base64("QUJD");
  ASSERT_TRUE(bytes.has_value());
  ASSERT_EQ(bytes->size(), 3u);
  EXPECT_EQ((*bytes)[0], 'A');
  EXPECT_EQ((*bytes)[2], 'C');
}

TEST(ImagePayload, DecodeSkipsLineBreaksAndSpaces) {
  EXPECT_EQ(na::remove_ascii_whitespace(" QU\tJ\r\nD "), "QUJD");
  auto wrapped = na::decode_base64("QU\nJD");
  ASSERT_TRUE(wrapped.has_value());
  EXPECT_EQ(wrapped->size(), 3u);
  auto spaced = na::decode_base64("QUJD QUI=\r\n");
  ASSERT_TRUE(spaced.has_value());
  EXPECT_EQ(spaced->size(), 5u);

  auto only_space = na::decode_base64(" \n ");
  ASSERT_FALSE(only_space.has_value());
  EXPECT_EQ(only_space.error(), nc::PipelineError::InvalidParameter);
  auto bad_char = na::decode_base64("QU*JD");
  ASSERT_FALSE(bad_char.has_value());
}

TEST(ImagePayload, DecodesLineWrappedPng) {
  const std::string encoded = et::png_base64(et::circle_mat(64, 48, 32, 24, 20));
  std::string wrapped;
  for (std::size_t i = 0; i < encoded.size(); i += 76) {
    wrapped += encoded.substr(i, 76);
    wrapped += "\r\n";
  }
  auto frame = na::decode_image_payload("data:image/png;base64," + wrapped);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->width(), 64u);
  EXPECT_EQ(frame->height(), 48u);
}

TEST(ImagePayload, MalformedBase64IsInvalidParameter) {
  auto frame = na::decode_image_payload("%%%not-base64%%%");
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error(), nc::PipelineError::InvalidParameter);
}

TEST(ImagePayload, NonImageBytesAreDecodeFailed) {
  auto frame = na::decode_image_payload("aGVsbG8gd29ybGQh");  // "hello world!"
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error(), nc::PipelineError::DecodeFailed);
}

TEST(ImagePayload, DecodesPngWithPrefix) {
  const std::string payload =
      "data:image/png;base64," + et::png_base64(et::circle_mat(64, 48, 32, 24, 20));
  auto frame = na::decode_image_payload(payload);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->width(), 64u);
  EXPECT_EQ(frame->height(), 48u);
  EXPECT_EQ(frame->format(), nc::PixelFormat::BGR8);
}
