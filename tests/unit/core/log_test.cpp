#include <earscope/core/log.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace nc = earscope::core;

namespace {

class LogCapture : public ::testing::Test {
 protected:
  void SetUp() override {
    saved_level_ = nc::log_level();
    nc::set_log_sink([this](nc::LogLevel level, std::string_view line) {
      levels_.push_back(level);
      lines_.emplace_back(line);
    });
  }
  void TearDown() override {
    nc::set_log_sink(nullptr);
    nc::set_log_level(saved_level_);
  }

  nc::LogLevel saved_level_{nc::LogLevel::Info};
  std::vector<nc::LogLevel> levels_;
  std::vector<std::string> lines_;
};

}  // namespace

TEST_F(LogCapture, WritesEnabledLevels) {
  nc::set_log_level(nc::LogLevel::Info);
  EARSCOPE_LOG_INFO << "loaded " << 18 << " classes";
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(levels_[0], nc::LogLevel::Info);
  EXPECT_NE(lines_[0].find("[INFO ]"), std::string::npos);
  EXPECT_NE(lines_[0].find("loaded 18 classes"), std::string::npos);
}

TEST_F(LogCapture, DropsLevelsAboveThreshold) {
  nc::set_log_level(nc::LogLevel::Warning);
  EARSCOPE_LOG_DEBUG << "hidden";
  EARSCOPE_LOG_INFO << "hidden";
  EARSCOPE_LOG_WARN << "shown";
  EARSCOPE_LOG_ERROR << "shown";
  EXPECT_EQ(lines_.size(), 2u);
}

TEST_F(LogCapture, ThrowingSinkFallsBackToStderr) {
  nc::set_log_level(nc::LogLevel::Info);
  nc::set_log_sink([](nc::LogLevel, std::string_view) {
    throw std::runtime_error("sink closed");
  });
  testing::internal::CaptureStderr();
  EXPECT_NO_THROW({ EARSCOPE_LOG_ERROR << "model load failed"; });
  const std::string err = testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("sink closed"), std::string::npos);
  EXPECT_NE(err.find("model load failed"), std::string::npos);
}

TEST(LogLevel, Parse) {
  EXPECT_EQ(nc::parse_log_level("debug", nc::LogLevel::Info), nc::LogLevel::Debug);
  EXPECT_EQ(nc::parse_log_level("warning", nc::LogLevel::Info), nc::LogLevel::Warning);
  EXPECT_EQ(nc::parse_log_level("error", nc::LogLevel::Info), nc::LogLevel::Error);
  EXPECT_EQ(nc::parse_log_level("loud", nc::LogLevel::Info), nc::LogLevel::Info);
}
