/**
 * @file configvalidator.hpp
 * @brief Валидация структуры JSON-конфигурации ifx-extract
 *
 * @details
 * Класс **ConfigValidator** проверяет конфигурацию до её применения:
 * - корневые секции `"defaults"` и `"environments"`
 * - массив `"template_sources"`
 * - секции `"scoring"`, `"validation"`, `"fingerprint"`
 * - массив `"logging"`
 *
 * Все методы выбрасывают std::runtime_error с префиксом `ConfigValidator:`.
 */
#pragma once
#include <nlohmann/json.hpp>

/**
 * @defgroup ValidationMethods Методы валидации данных
 */

/**
 * @class ConfigValidator
 * @brief Предоставляет методы валидации JSON-конфига сервиса
 * @ingroup Configuration
 *
 * @see ConfigLoader, ConfigManager, EngineSettings
 */
class ConfigValidator {
 public:
  /**
   * @brief Проверяет наличие обязательных корневых секций
   * @ingroup ValidationMethods
   *
   * @param[in] config JSON-объект конфигурации
   * @return true Если обе секции присутствуют и корректны
   * @throw std::runtime_error При отсутствии или некорректном типе секции
   *
   * @note Секция `"defaults"` не может быть пустой
   */
  bool validateRoot(const nlohmann::json &config) const;

  /**
   * @brief Проверяет объединённую конфигурацию одного окружения
   * @ingroup ValidationMethods
   *
   * @details `"template_sources"` обязательна, остальные секции
   * проверяются, если заданы.
   */
  bool validateMerged(const nlohmann::json &merged) const;

  /**
   * @brief Проверяет массив источников шаблонов
   * @ingroup ValidationMethods
   *
   * @details Каждый элемент: объект с непустой строкой `"path"`,
   * необязательными `"locale"` (строка) и `"optional"` (bool).
   *
   * @code
   * ConfigValidator v;
   * v.validateTemplateSources(merged["template_sources"]);
   * @endcode
   */
  bool validateTemplateSources(const nlohmann::json &sources) const;

  /**
   * @brief Проверяет веса оценки шаблонов
   * @ingroup ValidationMethods
   * @throw std::runtime_error Нецелые значения или нарушен порядок
   * fiscal_id_weight > keyword_weight > priority_weight * 100
   */
  bool validateScoring(const nlohmann::json &scoring) const;

  /// Границы правдоподобия дат и сумм
  bool validateValidation(const nlohmann::json &validation) const;

  /// Имена полей ключа дубликата
  bool validateFingerprint(const nlohmann::json &fingerprint) const;

  /**
   * @brief Проверяет секцию логирования конфигурации
   * @ingroup ValidationMethods
   *
   * @details
   * `"logging"` должен быть массивом объектов: `"type"` из {console,
   * sync_file}, `"level"` (строка из debug..critical), для sync_file
   * обязателен `"file"`.
   */
  bool validateLogging(const nlohmann::json &logging) const;
};
