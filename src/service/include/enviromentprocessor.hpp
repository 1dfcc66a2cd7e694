/**
 * @file enviromentprocessor.hpp
 * @brief Подстановка значений переменных окружения в JSON-конфигурацию
 *
 * @details
 * Рекурсивно заменяет `$ENV{VAR}` и `$ENV{VAR:-default}` в каждом строковом
 * узле конфигурации. Используется для путей к шаблонам вида
 * `$ENV{HOME}/.ifx/templates`.
 *
 * @warning Шаблон `$ENV{VAR}` без значения по умолчанию остаётся
 * неизменным, если переменная не установлена
 */

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @class EnvironmentProcessor
 * @brief Обработка шаблонов переменных окружения в конфиге
 * @ingroup Configuration
 */
class EnvironmentProcessor {
 public:
  /**
   * @brief Выполняет подстановку во всех строковых узлах
   * @param[in,out] config Обрабатываемый документ
   */
  void process(nlohmann::json &config) const;

  /// Подстановка в одной строке
  std::string resolve(const std::string &value) const;

 private:
  void walkJson(nlohmann::json &node,
                const std::function<void(std::string &)> &func) const;
};
