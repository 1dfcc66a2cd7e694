#pragma once

#include <ostream>

#include "ifx/ilogger.hpp"

#define IFX_ANSI_COLOR_RESET "\033[0m"
#define IFX_ANSI_COLOR_RED "\033[31m"
#define IFX_ANSI_COLOR_GREEN "\033[32m"
#define IFX_ANSI_COLOR_YELLOW "\033[33m"
#define IFX_ANSI_COLOR_CYAN "\033[36m"
#define IFX_ANSI_COLOR_WHITE_ON_RED "\033[41m\033[37m"

namespace ifx {

/**
 * @class ConsoleLogger
 * @brief Логгер диагностического потока (std::clog)
 *
 * @details stdout занят результатами извлечения, поэтому записи лога
 * всегда идут в std::clog. Цвета включаются только для терминала.
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(const LogLevel level) override;
  void flush() override;

  /// Принудительно включает или отключает ANSI-цвета
  void setColorsEnabled(bool enabled);

 protected:
  ConsoleLogger();
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;

 private:
  const char* colorFor(LogLevel level) const;

  mutable std::mutex mutex_;
  std::atomic<bool> colorsEnabled_{false};
};

}  // namespace ifx
