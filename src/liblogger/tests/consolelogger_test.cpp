#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

#include "ifx/consolelogger.hpp"

// Перехватывает std::clog на время теста
class CaptureStream {
 public:
  explicit CaptureStream(std::ostream& target)
      : target_(target), oldBuf_(target.rdbuf()) {
    target.rdbuf(buffer_.rdbuf());
  }
  ~CaptureStream() { target_.rdbuf(oldBuf_); }
  std::string getOutput() const { return buffer_.str(); }

 private:
  std::ostream& target_;
  std::streambuf* oldBuf_;
  std::ostringstream buffer_;
};

class ConsoleLoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logger_ = &ifx::ConsoleLogger::instance();
    logger_->setColorsEnabled(false);
    logger_->setLogLevel(ifx::LogLevel::LOG_DEBUG);
  }
  ifx::ConsoleLogger* logger_;
};

TEST_F(ConsoleLoggerTest, WritesToDiagnosticStream) {
  CaptureStream cap(std::clog);
  logger_->info("Template store loaded");
  EXPECT_NE(cap.getOutput().find("Template store loaded"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, DoesNotTouchStdout) {
  CaptureStream out(std::cout);
  CaptureStream err(std::clog);
  logger_->error("pattern compile failed");
  EXPECT_TRUE(out.getOutput().empty());
  EXPECT_NE(err.getOutput().find("pattern compile failed"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, SkipsLowerLevel) {
  logger_->setLogLevel(ifx::LogLevel::LOG_WARNING);
  CaptureStream cap(std::clog);
  logger_->info("This should not appear");
  logger_->debug("Neither should this");
  EXPECT_TRUE(cap.getOutput().empty());
}

TEST_F(ConsoleLoggerTest, FormatsLevelTag) {
  CaptureStream cap(std::clog);
  logger_->warning("Unknown key ignored");
  const std::string output = cap.getOutput();
  EXPECT_NE(output.find("[WARNING]"), std::string::npos);
  EXPECT_EQ(output.find("\033["), std::string::npos);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitive) {
  EXPECT_EQ(ifx::stringToLogLevel("DEBUG"), ifx::LogLevel::LOG_DEBUG);
  EXPECT_EQ(ifx::stringToLogLevel("warning"), ifx::LogLevel::LOG_WARNING);
  EXPECT_EQ(ifx::leveltoString(ifx::LogLevel::LOG_CRITICAL), "CRITICAL");
  EXPECT_THROW(ifx::stringToLogLevel("verbose"), std::invalid_argument);
}
