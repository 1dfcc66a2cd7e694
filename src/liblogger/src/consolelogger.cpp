#include "ifx/consolelogger.hpp"

#include <unistd.h>

#include <iostream>
#include <sstream>

ifx::ConsoleLogger& ifx::ConsoleLogger::instance() {
  static ifx::ConsoleLogger instance;
  return instance;
}

ifx::ConsoleLogger::ConsoleLogger()
    : colorsEnabled_(isatty(STDERR_FILENO) != 0) {}

void ifx::ConsoleLogger::init(const LogLevel level) { setLogLevel(level); }

void ifx::ConsoleLogger::setColorsEnabled(bool enabled) {
  colorsEnabled_.store(enabled, std::memory_order_release);
}

void ifx::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::clog.flush();
}

void ifx::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message;

  std::lock_guard<std::mutex> lock(mutex_);
  if (colorsEnabled_.load(std::memory_order_acquire)) {
    std::clog << colorFor(level) << formatted.str() << IFX_ANSI_COLOR_RESET
              << '\n';
  } else {
    std::clog << formatted.str() << '\n';
  }
  if (level >= LogLevel::LOG_ERROR) {
    std::clog.flush();
  }
}

const char* ifx::ConsoleLogger::colorFor(LogLevel level) const {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return IFX_ANSI_COLOR_CYAN;
    case LogLevel::LOG_INFO:
      return IFX_ANSI_COLOR_GREEN;
    case LogLevel::LOG_WARNING:
      return IFX_ANSI_COLOR_YELLOW;
    case LogLevel::LOG_ERROR:
      return IFX_ANSI_COLOR_RED;
    case LogLevel::LOG_CRITICAL:
      return IFX_ANSI_COLOR_WHITE_ON_RED;
  }
  return IFX_ANSI_COLOR_RESET;
}
