/**
 * @file ilogger.hpp
 * @brief Базовый интерфейс логгеров ifx и вспомогательные компоненты.
 *
 * @details
 * Содержит перечисление уровней логирования, форматтер временных меток
 * и абстрактный класс ILogger, от которого наследуются консольный,
 * файловый и композитный логгеры.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace ifx {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @class TimeFormatter
 * @brief Форматирует временные метки записей по глобальному шаблону strftime
 */
class TimeFormatter {
 public:
  /**
   * @brief Устанавливает глобальный формат временных меток
   * @param fmt Шаблон в синтаксисе std::put_time
   * @return false если шаблон пустой
   */
  static bool setGlobalFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

 private:
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
  inline static std::mutex formatMutex_;
};

/**
 * @class ILogger
 * @brief Абстрактный логгер с фильтрацией по уровню
 *
 * @note Экземпляры-синглтоны передаются в CompositeLogger через shared_ptr
 *       с пустым deleter, поэтому деструктор защищённый.
 */
class ILogger {
 public:
  virtual void init(const LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level);
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual ~ILogger() = default;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Преобразует строковое имя уровня ("debug", "info", ...) в LogLevel
 * @throw std::invalid_argument для неизвестного имени
 */
LogLevel stringToLogLevel(const std::string& level);

}  // namespace ifx
