/**
 * @file Template.hpp
 * @brief Модель шаблона извлечения полей
 *
 * @details Шаблон является неизменяемыми данными: после загрузки
 * TemplateParser'ом он только читается (в том числе из нескольких потоков).
 * Скомпилированные регулярные выражения хранятся рядом с исходным текстом.
 */
#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace ifx {

/// Тип значения поля
enum class ValueType { Text, Date, Amount, Integer };

/// Проверка значения поля после приведения типа
enum class FieldValidator { None, Nip, Cui, Iban, Email };

std::string toString(ValueType type);
std::string toString(FieldValidator validator);

/// @throw std::invalid_argument Для неизвестного имени
ValueType valueTypeFromString(const std::string& name);
FieldValidator fieldValidatorFromString(const std::string& name);

/**
 * @struct CompiledPattern
 * @brief Регулярное выражение шаблона (ECMAScript, без учёта регистра)
 *
 * @note Выражения, начинающиеся с '^' или заканчивающиеся на '$',
 * применяются к каждой строке текста по отдельности (lineAnchored).
 */
struct CompiledPattern {
  std::string source;
  std::regex regex;
  bool lineAnchored = false;
};

/**
 * @brief Компилирует выражение шаблона
 * @throw std::regex_error При синтаксической ошибке
 */
CompiledPattern compilePattern(const std::string& source);

/**
 * @brief Ищет первое совпадение в диапазоне [first, last)
 * @return true, если совпадение найдено; результат в match
 */
bool searchPattern(const CompiledPattern& pattern,
                   std::string::const_iterator first,
                   std::string::const_iterator last, std::smatch& match);

inline bool searchPattern(const CompiledPattern& pattern,
                          const std::string& text, std::smatch& match) {
  return searchPattern(pattern, text.begin(), text.end(), match);
}

/**
 * @brief Все непересекающиеся совпадения в диапазоне [first, last)
 * @note Для lineAnchored выражений не более одного совпадения на строку
 */
std::vector<std::smatch> searchAllPatterns(const CompiledPattern& pattern,
                                           std::string::const_iterator first,
                                           std::string::const_iterator last);

/// Ключевое слово и значение, которое оно означает ("EUR" -> "EUR")
struct KeywordMapping {
  std::string keyword;
  std::string value;
};

/**
 * @struct DateFallback
 * @brief Производная дата для ненайденного поля
 *
 * "use_issue_date" даёт days == 0, "add_days:14" даёт days == 14.
 */
struct DateFallback {
  std::string sourceField = "issue_date";
  int days = 0;
};

/**
 * @struct FieldRule
 * @brief Правило извлечения одного поля
 *
 * @details Значение берётся из совпадения выражения (patterns) либо из
 * первого ключевого слова, найденного в тексте (mapping). Если поле не
 * найдено, используется defaultValue или fallback.
 */
struct FieldRule {
  std::string name;
  std::vector<CompiledPattern> patterns;  ///< Пробуются по порядку
  std::vector<KeywordMapping> mapping;    ///< В порядке объявления
  std::optional<std::string> defaultValue;  ///< Только для type text
  std::optional<DateFallback> fallback;     ///< Только для type date
  bool multiple = false;  ///< Собирать все различные значения
  bool required = false;
  ValueType type = ValueType::Text;
  std::string formatHint;
  std::size_t group = 1;
  FieldValidator validator = FieldValidator::None;
  bool total = false;  ///< Итоговая сумма документа (должна быть > 0)
  std::vector<std::string> contextKeywords;
  std::size_t contextRange = 200;
};

struct TableColumn {
  std::string name;
  CompiledPattern pattern;
};

/// Правило извлечения табличной части (позиций документа)
struct TableRule {
  std::string name;
  CompiledPattern start;
  std::optional<CompiledPattern> end;  ///< Без end область идёт до конца текста
  std::vector<TableColumn> columns;
  std::vector<CompiledPattern> skipPatterns;
};

/// Признаки эмитента документа
struct IssuerSignature {
  std::vector<std::string> keywords;
  std::string fiscalId;  ///< Компактная форма: только буквы и цифры
  std::vector<std::string> excludeKeywords;

  /// Шаблон без ключевых слов и налогового номера считается общим
  bool empty() const noexcept { return keywords.empty() && fiscalId.empty(); }
};

struct Template {
  std::string id;
  std::string description;
  std::string locale;  ///< Пустая строка: без ограничения по локали
  int priority = 50;
  IssuerSignature issuer;
  std::vector<FieldRule> fields;  ///< В порядке объявления в документе
  std::vector<TableRule> tables;
  std::string sourcePath;

  bool isGeneric() const noexcept { return issuer.empty(); }
};

}  // namespace ifx
