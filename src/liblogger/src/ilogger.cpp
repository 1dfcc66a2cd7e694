#include "ifx/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

bool ifx::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(formatMutex_);
  globalFormat_ = fmt;
  return true;
}

std::string ifx::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  auto timeValue = std::chrono::system_clock::to_time_t(tp);
  std::tm localTm{};

#ifdef _WIN32
  localtime_s(&localTm, &timeValue);
#else
  localtime_r(&timeValue, &localTm);
#endif

  std::string pattern;
  {
    std::lock_guard<std::mutex> lock(formatMutex_);
    pattern = globalFormat_;
  }

  std::ostringstream oss;
  oss << std::put_time(&localTm, pattern.c_str());
  if (oss.fail()) {
    return "[INVALID_TIME]";
  }
  return oss.str();
}

void ifx::ILogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

ifx::LogLevel ifx::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

bool ifx::ILogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

void ifx::ILogger::debug(const std::string& message) {
  log(ifx::LogLevel::LOG_DEBUG, message);
}

void ifx::ILogger::info(const std::string& message) {
  log(ifx::LogLevel::LOG_INFO, message);
}

void ifx::ILogger::warning(const std::string& message) {
  log(ifx::LogLevel::LOG_WARNING, message);
}

void ifx::ILogger::error(const std::string& message) {
  log(ifx::LogLevel::LOG_ERROR, message);
}

void ifx::ILogger::critical(const std::string& message) {
  log(ifx::LogLevel::LOG_CRITICAL, message);
}

std::string ifx::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

ifx::LogLevel ifx::stringToLogLevel(const std::string& level) {
  std::string lowered = level;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "debug") return LogLevel::LOG_DEBUG;
  if (lowered == "info") return LogLevel::LOG_INFO;
  if (lowered == "warning") return LogLevel::LOG_WARNING;
  if (lowered == "error") return LogLevel::LOG_ERROR;
  if (lowered == "critical") return LogLevel::LOG_CRITICAL;

  throw std::invalid_argument("Unknown log level: " + level);
}
