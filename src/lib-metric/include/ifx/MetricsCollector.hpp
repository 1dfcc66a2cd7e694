/**
 * @file MetricsCollector.hpp
 * @brief Сбор метрик обработки документов в формате Prometheus
 *
 * @details Реализует потокобезопасный сбор:
 * - счётчиков (Counter): документы, совпадения шаблонов, дубликаты, перезагрузки
 * - времени выполнения операций (Summary: сумма и количество наблюдений)
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace ifx {

/**
 * @class MetricsCollector
 * @brief Потокобезопасный сборщик метрик (Singleton)
 *
 * @warning Метрики живут только в памяти процесса, сериализации на диск нет
 */
class MetricsCollector {
 public:
  /**
   * @brief Получить экземпляр MetricsCollector
   *
   * @code
   * auto& metrics = ifx::MetricsCollector::instance();
   * metrics.incrementCounter("documents_total");
   * @endcode
   */
  static MetricsCollector& instance();

  /**
   * @brief Зарегистрировать новый счётчик
   * @param name Уникальное имя, соответствующее [a-zA-Z_][a-zA-Z0-9_]*
   * @param help Описание метрики для Prometheus
   * @throw std::runtime_error Если имя пустое, некорректное или уже занято
   */
  void registerCounter(const std::string& name, const std::string& help = "");

  /// Регистрирует счётчик, если его ещё нет; повторный вызов безопасен
  void ensureCounter(const std::string& name, const std::string& help = "");

  /**
   * @brief Увеличить значение счётчика
   * @note Незарегистрированные счётчики молча игнорируются
   */
  void incrementCounter(const std::string& name, std::uint64_t value = 1);

  /// Текущее значение счётчика, 0 для неизвестного имени
  std::uint64_t counterValue(const std::string& name) const;

  /**
   * @brief Записать длительность операции
   * @param name Имя summary-метрики (создаётся при первом наблюдении)
   */
  void recordTaskTime(const std::string& name,
                      std::chrono::milliseconds duration);

  /**
   * @brief Экспорт метрик в текстовом формате Prometheus
   *
   * @code
   * # TYPE ifx_documents_total counter
   * ifx_documents_total 42
   * @endcode
   */
  std::string exportPrometheus() const;

  /// Сбрасывает все метрики (используется в тестах)
  void reset();

 private:
  MetricsCollector() = default;

  struct Counter {
    std::uint64_t value = 0;
    std::string help;
  };

  struct Summary {
    std::uint64_t sumMs = 0;
    std::uint64_t count = 0;
  };

  mutable std::mutex mutex_;
  std::map<std::string, Counter> counters_;
  std::map<std::string, Summary> summaries_;
};

}  // namespace ifx
