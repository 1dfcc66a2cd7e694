/**
 * @file configmanager.hpp
 * @brief Центральный менеджер конфигурации ifx-extract
 *
 * @details
 * Объединяет ConfigLoader, EnvironmentProcessor, ConfigValidator и
 * ConfigCache. Объединённая конфигурация окружения строится как
 * `defaults` + merge-patch секции окружения + CLI-переопределения.
 * Переопределения хранятся отдельно и переживают reload().
 */
#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "../include/configcache.hpp"
#include "../include/configloader.hpp"
#include "../include/configvalidator.hpp"
#include "../include/enviromentprocessor.hpp"

/**
 * @class ConfigManager
 * @brief Singleton-хранилище конфигурации сервиса
 * @ingroup Configuration
 *
 * @note Все публичные методы потокобезопасны
 */
class ConfigManager {
 public:
  friend class ConfigReloadTransaction;

  /**
   * @brief Получить единственный экземпляр
   * @code
   * auto &mgr = ConfigManager::instance();
   * @endcode
   */
  static ConfigManager &instance();

  /**
   * @brief Загрузить и проверить конфигурацию
   * @details Сбрасывает ранее применённые CLI-переопределения.
   * @param filename Путь к JSON-файлу
   * @throw std::runtime_error "Config initialization failed: ..." при ошибке
   * чтения, разбора или валидации любого окружения
   */
  void initialize(const std::string &filename);

  /**
   * @brief Перечитать файл конфигурации
   * @details При ошибке прежняя конфигурация остаётся активной.
   * @throw std::runtime_error "Config reload failed: ..."
   */
  void reload();

  /**
   * @brief Конфигурация окружения (defaults + environment + overrides)
   * @throw std::runtime_error Если окружение не найдено
   *
   * @code
   * auto cfg = ConfigManager::instance().getMergedConfig("production");
   * @endcode
   */
  nlohmann::json getMergedConfig(const std::string &env) const;

  /**
   * @brief Применить CLI-переопределения вида `scoring.min_score:10`
   *
   * @details Ключ задаёт путь через точку внутри объединённой конфигурации.
   * Значение разбирается как JSON (`10`, `true`, `[...]`), иначе остаётся
   * строкой. Каждое окружение проверяется заново; при ошибке
   * переопределения отбрасываются.
   *
   * @throw std::runtime_error Некорректный ключ или конфигурация после
   * переопределения не проходит валидацию
   */
  void applyCliOverrides(
      const std::unordered_map<std::string, std::string> &overrides);

  /// Имена окружений в порядке файла
  std::vector<std::string> environments() const;

  std::string configFilePath() const;

  bool isInitialized() const;

  /// Исходный документ конфигурации (после подстановки переменных)
  nlohmann::json getCurrentConfig() const;

  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

 private:
  ConfigManager() = default;
  ~ConfigManager() = default;

  // Вызываются под захваченным configMutex_
  nlohmann::json mergeLocked(const nlohmann::json &base,
                             const nlohmann::json &overrides,
                             const std::string &env) const;
  void validateLocked(const nlohmann::json &base,
                      const nlohmann::json &overrides) const;

  ConfigLoader loader_;
  ConfigValidator validator_;
  EnvironmentProcessor envProcessor_;
  mutable ConfigCache cache_;

  nlohmann::json baseConfig_;
  nlohmann::json overrides_ = nlohmann::json::object();
  std::string configFilePath_;

  mutable std::mutex configMutex_;
};
