#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "../include/documentprocessor.hpp"
#include "ifx/TemplateLoader.hpp"

/**
 * @class ResultSerializer
 * @brief JSON-представление результатов для stdout
 *
 * @details Порядок ключей фиксирован (ordered_json), поля идут в порядке
 * объявления в шаблоне. Суммы выводятся строкой "1234.56", даты ISO,
 * целые числом.
 *
 * @code
 * std::cout << ResultSerializer::toLine(report) << '\n';
 * @endcode
 *
 * @note Текст документа кодировку не проходит: байты, не образующие
 * корректный UTF-8 (например ISO-8859-2 после OCR), заменяются на U+FFFD.
 */
class ResultSerializer {
 public:
  static nlohmann::ordered_json toJson(const DocumentReport &report);
  static nlohmann::ordered_json toJson(const ifx::ExtractionResult &result);
  static nlohmann::ordered_json toJson(const ifx::ExtractedField &field);
  static nlohmann::ordered_json toJson(const ifx::MatchCandidate &candidate);
  static nlohmann::ordered_json toJson(const ifx::LoadReport &report);

  static nlohmann::ordered_json valueToJson(const ifx::FieldValue &value);

  /// dump() с заменой некорректных UTF-8 последовательностей
  static std::string dump(const nlohmann::ordered_json &json, int indent = -1);

  /**
   * @brief Одна строка JSON на документ
   * @note Не бросает исключений nlohmann: при ошибке сериализации
   * возвращается отчёт с полем error
   */
  static std::string toLine(const DocumentReport &report);
};
