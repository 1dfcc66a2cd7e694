/**
 * @file engine_settings.hpp
 * @brief Типизированные настройки движка извлечения
 *
 * @details Преобразует объединённую конфигурацию окружения в структуры
 * библиотеки ifx_template_engine: источники шаблонов, веса оценки,
 * политику проверки значений и имена полей ключа дубликата.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "ifx/DuplicateFingerprinter.hpp"
#include "ifx/FieldValidators.hpp"
#include "ifx/TemplateLoader.hpp"
#include "ifx/TemplateMatcher.hpp"

struct EngineSettings {
  std::string locale;  ///< Локаль документов по умолчанию, пусто если не задана
  std::vector<ifx::TemplateSource> templateSources;
  ifx::ScoringWeights weights;
  ifx::ValidationPolicy policy;
  ifx::FingerprintFields fingerprint;

  /**
   * @brief Построить настройки из объединённой конфигурации
   * @throw std::runtime_error "EngineSettings: ..." при некорректных значениях
   *
   * @code
   * auto settings = EngineSettings::fromConfig(
   *     ConfigManager::instance().getMergedConfig("production"));
   * @endcode
   */
  static EngineSettings fromConfig(const nlohmann::json &merged);

  /// Локаль документа: явная подсказка, иначе локаль конфигурации
  std::optional<std::string> effectiveLocale(
      const std::optional<std::string> &hint) const;
};
