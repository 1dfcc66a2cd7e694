/**
 * @file TemplateParser.hpp
 * @brief Разбор JSON-документа шаблона в ifx::Template
 *
 * @details Формат документа:
 * @code
 * {
 *   "template": {"name": "orange_polska", "locale": "pl", "priority": 80},
 *   "issuer":   {"keywords": ["Orange Polska"], "fiscal_id": "526-025-09-95"},
 *   "fields":   {"invoice_id": {"patterns": ["Faktura nr\\s*(\\S+)"], "required": true}},
 *   "tables":   {"line_items": {"start": "...", "end": "...", "columns": [...]}}
 * }
 * @endcode
 * Неизвестные ключи игнорируются. Порядок полей сохраняется.
 */
#pragma once

#include <string>

#include "ifx/Errors.hpp"
#include "ifx/Template.hpp"

namespace ifx {

/// Содержимое документа шаблона вместе с контекстом источника
struct TemplateDocument {
  std::string path;
  std::string locale;     ///< Локаль источника, если документ не задаёт свою
  std::string derivedId;  ///< Идентификатор по пути, если нет template.name
  std::string content;
};

class TemplateParser {
 public:
  static constexpr std::size_t MAX_PATTERN_LENGTH = 2000;
  static constexpr int MIN_PRIORITY = 0;
  static constexpr int MAX_PRIORITY = 100;

  /**
   * @brief Разобрать документ
   * @throw TemplateParseError При любом нарушении формата
   */
  static Template parse(const TemplateDocument& document);

  /**
   * @brief Отклоняет выражения с вложенными неограниченными квантификаторами
   *
   * @details Квантифицированная группа, тело которой уже содержит '*', '+'
   * или '{n,}', например "(a+)+" или "(\\s*\\d+)*", приводит к
   * экспоненциальному перебору в std::regex.
   *
   * @throw TemplateParseError Для слишком длинных или вложенных выражений
   */
  static void checkPatternComplexity(const std::string& pattern);
};

}  // namespace ifx
