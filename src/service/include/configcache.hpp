#pragma once
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * @class ConfigCache
 * @brief Кэш объединённых (defaults + environment) конфигураций по окружениям
 *
 * @details Потокобезопасен: getMergedConfig вызывается и из главного потока,
 * и из потока SignalRouter при перезагрузке.
 */
class ConfigCache {
 public:
  /**
   * @brief Получает закешированную конфигурацию для указанного окружения
   * @param env Идентификатор окружения (например "production")
   * @return Конфигурация или nullopt, если окружение ещё не объединялось
   */
  std::optional<nlohmann::json> getCached(const std::string &env) const;

  /**
   * @brief Обновляет кеш для указанного окружения
   * @throw std::invalid_argument Если config не является объектом
   */
  void updateCache(const std::string &env, const nlohmann::json &config);

  /// Очищает весь кеш (после reload и CLI-переопределений)
  void clearAll();

  std::size_t size() const;

 private:
  mutable std::mutex cacheMutex_;
  nlohmann::json cachedConfig_ = nlohmann::json::object();
};
