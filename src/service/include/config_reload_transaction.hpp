#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "../include/configmanager.hpp"
#include "../include/engine_settings.hpp"
#include "ifx/TemplateRegistry.hpp"

/**
 * @file config_reload_transaction.hpp
 * @brief Транзакционная перезагрузка конфигурации и шаблонов с откатом
 */

/// Результат успешной перезагрузки
struct ReloadOutcome {
  EngineSettings settings;
  ifx::LoadReport report;
};

class ConfigReloadTransaction {
 public:
  /**
   * @brief Конструктор
   * @param configMgr Менеджер конфигурации
   * @param environment Активное окружение
   * @param registry Реестр шаблонов, хранилище которого заменяется
   */
  ConfigReloadTransaction(ConfigManager &configMgr, std::string environment,
                          ifx::TemplateRegistry &registry);

  /**
   * @brief Деструктор.
   * Если транзакция активна, выполняет откат.
   */
  ~ConfigReloadTransaction();

  /**
   * @brief Начало транзакции: сохраняет текущую конфигурацию.
   * @throws std::runtime_error если транзакция уже активна.
   */
  void begin();

  /**
   * @brief Фиксация изменений.
   * @throws std::runtime_error если транзакция не активна.
   */
  void commit();

  /**
   * @brief Откат: восстанавливает конфигурацию из резервной копии.
   * @details Хранилище шаблонов не трогается: реестр заменяет его только
   * при успешной загрузке.
   * @throws std::runtime_error если транзакция не активна.
   */
  void rollback();

  /**
   * @brief Полная перезагрузка: конфигурация, настройки, шаблоны.
   * @throws std::runtime_error, ifx::StoreEmptyError при ошибке любого шага
   * (после отката)
   */
  ReloadOutcome reload();

  ConfigReloadTransaction(const ConfigReloadTransaction &) = delete;
  ConfigReloadTransaction &operator=(const ConfigReloadTransaction &) = delete;

 private:
  ConfigManager &configMgr_;
  std::string environment_;
  ifx::TemplateRegistry &registry_;
  nlohmann::json backup_;
  bool active_ = false;
};
