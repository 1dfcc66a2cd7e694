/**
 * @file ExtractionEngine.hpp
 * @brief Извлечение полей и табличных частей по выбранному шаблону
 *
 * @details Для каждого поля в порядке объявления выражения пробуются по
 * очереди; первое совпадение, успешно приведённое к типу поля, побеждает.
 * Проблемы отдельного поля (нет совпадения, ошибка проверки) отражаются в
 * его статусе и никогда не прерывают обработку остальных полей.
 *
 * Поля с default или fallback заполняются вторым проходом, после того как
 * все поля извлечены, поэтому порядок объявления для них не важен.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ifx/FieldValidators.hpp"
#include "ifx/Template.hpp"
#include "ifx/ValueCoercion.hpp"

namespace ifx {

/// Значение поля: text, date, amount или integer
using FieldValue = std::variant<std::string, Date, Amount, std::int64_t>;

/// Текстовое представление значения (даты ISO, суммы "1234.56")
std::string fieldValueToString(const FieldValue& value);

enum class FieldStatus { Found, Missing, Invalid };

std::string toString(FieldStatus status);

struct ExtractedField {
  std::string name;
  ValueType type = ValueType::Text;
  FieldStatus status = FieldStatus::Missing;
  std::optional<FieldValue> value;  ///< Для multiple: первое значение
  std::vector<FieldValue> values;   ///< Все различные значения (multiple)
  std::string raw;     ///< Последний захваченный текст
  std::string reason;  ///< Причина для Missing/Invalid
  bool required = false;
  bool multiple = false;
  bool derived = false;  ///< Значение из default/fallback, а не из текста

  bool operator==(const ExtractedField& other) const;
  bool operator!=(const ExtractedField& other) const {
    return !(*this == other);
  }
};

/// Строка табличной части: колонка -> текст
using TableRow = std::map<std::string, std::string>;

struct ExtractionResult {
  std::string templateId;
  std::vector<ExtractedField> fields;  ///< В порядке объявления в шаблоне
  std::map<std::string, std::vector<TableRow>> tables;
  bool complete = true;  ///< Все обязательные поля найдены и прошли проверку

  /// Поле по имени или nullptr
  const ExtractedField* field(const std::string& name) const;

  /// Значение найденного поля или nullopt
  std::optional<FieldValue> value(const std::string& name) const;

  bool operator==(const ExtractionResult& other) const;
  bool operator!=(const ExtractionResult& other) const {
    return !(*this == other);
  }
};

class ExtractionEngine {
 public:
  explicit ExtractionEngine(ValidationPolicy policy = {});

  /**
   * @brief Извлечь поля документа по шаблону
   * @throw EmptyDocumentError Если текст пуст или состоит из пробелов
   */
  ExtractionResult extract(const std::string& text, const Template& tpl) const;

  const ValidationPolicy& policy() const noexcept { return policy_; }

 private:
  ExtractedField extractField(const std::string& text, const FieldRule& rule,
                              DecimalConvention convention) const;

  /// Все различные значения поля с multiple
  void collectAll(const std::string& text, const FieldRule& rule,
                  DecimalConvention convention, ExtractedField& field) const;

  /// Значение первого найденного ключевого слова из mapping
  void detectKeyword(const std::string& text, const FieldRule& rule,
                     ExtractedField& field) const;

  /// default и fallback для ненайденных полей
  void applyDerivations(const Template& tpl, ExtractionResult& result) const;

  /// Приведение к типу; nullopt означает "нет захвата"
  std::optional<FieldValue> coerce(const std::string& raw,
                                   const FieldRule& rule,
                                   DecimalConvention convention) const;

  /// Проверка значения; пустая строка означает успех, иначе причина отказа
  std::string validate(FieldValue& value, const FieldRule& rule) const;

  std::vector<TableRow> extractTable(const std::string& text,
                                     const TableRule& rule) const;

  ValidationPolicy policy_;
};

}  // namespace ifx
