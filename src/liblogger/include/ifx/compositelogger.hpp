#pragma once

#include <initializer_list>
#include <memory>
#include <vector>

#include "ifx/ilogger.hpp"

namespace ifx {

/**
 * @class CompositeLogger
 * @brief Раздаёт записи всем зарегистрированным логгерам
 *
 * @details Единая точка логирования для библиотек и сервиса. Фильтрация
 * по уровню выполняется вложенными логгерами. Без вложенных логгеров
 * записи отбрасываются.
 */
class CompositeLogger : public ILogger {
 public:
  static CompositeLogger& instance();

  CompositeLogger() = default;
  CompositeLogger(std::initializer_list<std::shared_ptr<ILogger>> loggers)
      : loggers_(loggers) {}
  ~CompositeLogger() override = default;

  void addLogger(const std::shared_ptr<ILogger>& logger);

  /// Удаляет все вложенные логгеры (перед переконфигурацией)
  void clear();

  std::size_t size() const;

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  void debug(const std::string& message) override;
  void info(const std::string& message) override;
  void warning(const std::string& message) override;
  void error(const std::string& message) override;
  void critical(const std::string& message) override;

 protected:
  bool shouldSkipLog(LogLevel) const override { return false; }
  void log(LogLevel level, const std::string& message) override;

 private:
  std::vector<std::shared_ptr<ILogger>> snapshot() const;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace ifx
