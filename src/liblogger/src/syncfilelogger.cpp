#include "ifx/syncfilelogger.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

namespace ifx {

SyncFileLogger& SyncFileLogger::instance() {
  static SyncFileLogger instance;
  return instance;
}

void SyncFileLogger::init(const LogLevel level) {
  setLogLevel(level);
  std::lock_guard<std::mutex> lock(mutex_);
  reopenFilesLocked();
}

void SyncFileLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogFile_.is_open()) mainLogFile_.flush();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void SyncFileLogger::setMainLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogPath_ == path && mainLogFile_.is_open()) return;
  mainLogPath_ = path;
  reopenFilesLocked();
}

void SyncFileLogger::setFallbackLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fallbackLogPath_ == path) return;
  fallbackLogPath_ = path;
  reopenFilesLocked();
}

std::string SyncFileLogger::getMainLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mainLogPath_;
}

std::string SyncFileLogger::getFallbackLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fallbackLogPath_;
}

void SyncFileLogger::setRotationConfig(const RotationConfig& config) {
  std::lock_guard<std::mutex> lock(mutex_);
  rotationConfig_ = config;
}

RotationConfig SyncFileLogger::getRotationConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rotationConfig_;
}

void SyncFileLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message << "\n";
  const std::string line = formatted.str();

  std::lock_guard<std::mutex> lock(mutex_);
  if (!mainLogFile_.is_open() && !fallbackLogFile_.is_open()) {
    reopenFilesLocked();
  }
  rotateIfNeededLocked(line.size());

  if (mainLogFile_.is_open()) {
    mainLogFile_ << line;
    mainLogFile_.flush();
    warnedAboutFallback_ = false;
  } else if (fallbackLogFile_.is_open()) {
    if (!warnedAboutFallback_) {
      std::cerr << "[LOGGER WARNING] Main log file unavailable, writing to "
                << fallbackLogPath_ << std::endl;
      warnedAboutFallback_ = true;
    }
    fallbackLogFile_ << line;
    fallbackLogFile_.flush();
  } else {
    std::cerr << "[LOGGER ERROR] No log file is open: " << line;
  }
}

void SyncFileLogger::reopenFilesLocked() {
  if (mainLogFile_.is_open()) mainLogFile_.close();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.close();

  mainLogFile_.open(mainLogPath_, std::ios::app);
  if (mainLogFile_.is_open()) return;

  std::cerr << "[LOGGER ERROR] Cannot open main log file: " << mainLogPath_
            << std::endl;
  fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
  if (!fallbackLogFile_.is_open()) {
    std::cerr << "[LOGGER ERROR] Cannot open fallback log file: "
              << fallbackLogPath_ << std::endl;
  }
}

void SyncFileLogger::rotateIfNeededLocked(std::size_t incomingBytes) {
  namespace fs = std::filesystem;

  if (!rotationConfig_.enabled || rotationConfig_.maxFileSizeBytes == 0 ||
      !mainLogFile_.is_open()) {
    return;
  }

  std::error_code ec;
  const auto currentSize = fs::file_size(mainLogPath_, ec);
  if (ec || currentSize + incomingBytes <= rotationConfig_.maxFileSizeBytes) {
    return;
  }

  mainLogFile_.close();
  fs::rename(mainLogPath_, mainLogPath_ + ".1", ec);
  if (ec) {
    std::cerr << "[LOGGER ERROR] Log rotation failed: " << ec.message()
              << std::endl;
  }
  mainLogFile_.open(mainLogPath_, std::ios::app);
}

}  // namespace ifx
