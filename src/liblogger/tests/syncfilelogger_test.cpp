#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "ifx/syncfilelogger.hpp"

namespace fs = std::filesystem;

namespace {

std::string readAll(const std::string& path) {
  std::ifstream file(path);
  return std::string((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
}

class TempFile {
 public:
  explicit TempFile(const std::string& prefix) {
    path_ = (fs::temp_directory_path() /
             (prefix + "_" +
              std::to_string(std::chrono::steady_clock::now()
                                 .time_since_epoch()
                                 .count()) +
              ".log"))
                .string();
  }
  ~TempFile() {
    std::error_code ec;
    fs::remove(path_, ec);
    fs::remove(path_ + ".1", ec);
  }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace

class SyncFileLoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mainLog_ = std::make_unique<TempFile>("ifx_main");
    fallbackLog_ = std::make_unique<TempFile>("ifx_fallback");
    logger_ = &ifx::SyncFileLogger::instance();
    logger_->setRotationConfig(ifx::RotationConfig{});
    logger_->setMainLogPath(mainLog_->path());
    logger_->setFallbackLogPath(fallbackLog_->path());
    logger_->init(ifx::LogLevel::LOG_INFO);
  }
  void TearDown() override { logger_->flush(); }

  std::unique_ptr<TempFile> mainLog_;
  std::unique_ptr<TempFile> fallbackLog_;
  ifx::SyncFileLogger* logger_;
};

TEST_F(SyncFileLoggerTest, WritesToMainFile) {
  logger_->info("Loaded 3 templates");
  logger_->flush();
  EXPECT_NE(readAll(mainLog_->path()).find("Loaded 3 templates"),
            std::string::npos);
}

TEST_F(SyncFileLoggerTest, RespectsLevel) {
  logger_->debug("hidden debug line");
  logger_->flush();
  EXPECT_EQ(readAll(mainLog_->path()).find("hidden debug line"),
            std::string::npos);
}

TEST_F(SyncFileLoggerTest, FallsBackWhenMainPathUnwritable) {
  logger_->setMainLogPath("/nonexistent_dir_ifx/main.log");
  logger_->error("written to fallback");
  logger_->flush();
  EXPECT_NE(readAll(fallbackLog_->path()).find("written to fallback"),
            std::string::npos);
  logger_->setMainLogPath(mainLog_->path());
}

TEST_F(SyncFileLoggerTest, RotatesBySize) {
  ifx::RotationConfig rotation;
  rotation.enabled = true;
  rotation.maxFileSizeBytes = 128;
  logger_->setRotationConfig(rotation);

  for (int i = 0; i < 10; ++i) {
    logger_->info("rotation line number " + std::to_string(i));
  }
  logger_->flush();

  EXPECT_TRUE(fs::exists(mainLog_->path() + ".1"));
  EXPECT_LE(fs::file_size(mainLog_->path()), 128u);
}
