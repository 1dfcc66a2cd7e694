#pragma once

#include <cstddef>
#include <fstream>

#include "ifx/ilogger.hpp"

namespace ifx {

/**
 * @struct RotationConfig
 * @brief Параметры ротации лог-файла по размеру
 */
struct RotationConfig {
  bool enabled = false;
  std::size_t maxFileSizeBytes = 0;  ///< Порог размера основного файла
};

/**
 * @class SyncFileLogger
 * @brief Синхронный файловый логгер с резервным файлом
 *
 * @details Каждая запись немедленно сбрасывается на диск. Если основной
 * файл открыть не удалось, записи идут в резервный. При включённой
 * ротации основной файл переименовывается в `<path>.1` по достижении
 * порога размера.
 */
class SyncFileLogger : public ILogger {
 public:
  static SyncFileLogger& instance();

  void init(const LogLevel level) override;
  void flush() override;

  void setMainLogPath(const std::string& path);
  void setFallbackLogPath(const std::string& path);
  std::string getMainLogPath() const;
  std::string getFallbackLogPath() const;

  void setRotationConfig(const RotationConfig& config);
  RotationConfig getRotationConfig() const;

 protected:
  SyncFileLogger() = default;
  ~SyncFileLogger() override = default;
  void log(LogLevel level, const std::string& message) override;

 private:
  // Вызываются под захваченным mutex_
  void reopenFilesLocked();
  void rotateIfNeededLocked(std::size_t incomingBytes);

  mutable std::mutex mutex_;
  std::ofstream mainLogFile_;
  std::ofstream fallbackLogFile_;
  std::string mainLogPath_ = "ifx.log";
  std::string fallbackLogPath_ = "ifx_fallback.log";
  RotationConfig rotationConfig_;
  bool warnedAboutFallback_ = false;
};

}  // namespace ifx
