/**
 * @file FieldValidators.hpp
 * @brief Проверка и нормализация значений полей
 *
 * @details Все функции чистые и тотальные: на любом входе возвращают
 * ValidationOutcome и никогда не бросают исключений.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ifx/ValueCoercion.hpp"

namespace ifx {

struct ValidationOutcome {
  bool valid = false;
  std::string normalized;  ///< Нормализованная форма (или исходный текст при ошибке)
  std::string reason;      ///< Причина отказа, пусто при valid == true
};

/// Параметры проверки правдоподобия дат и сумм
struct ValidationPolicy {
  int earliestYear = 1990;
  int maxYearsAhead = 2;
  Amount amountCeiling{1'000'000'000};  ///< 10 000 000.00
  std::optional<Date> today;            ///< Опорная дата; по умолчанию текущая
};

/**
 * @brief Польский NIP: 10 цифр, веса 6,5,7,2,3,4,5,6,7, модуль 11
 * @note Нецифровые символы (префикс "PL", дефисы, пробелы) отбрасываются.
 * Контрольное значение 10 означает недействительный номер.
 */
ValidationOutcome validateFiscalId(std::string_view raw);

/// Румынский CUI: 2-10 цифр, ключ 753217532 с выравниванием вправо
ValidationOutcome validateRoFiscalId(std::string_view raw);

/**
 * @brief IBAN (ISO 13616): длина по стране и контроль по модулю 97
 * @note 26 цифр без префикса считаются польским NRB и дополняются "PL".
 */
ValidationOutcome validateBankAccount(std::string_view raw);

ValidationOutcome validateEmail(std::string_view raw);

/// Календарная корректность и попадание в [earliestYear, today + maxYearsAhead]
ValidationOutcome validateDate(const Date& date, const ValidationPolicy& policy);

/// Итоговая сумма должна быть положительной; модуль не больше amountCeiling
ValidationOutcome validateAmount(const Amount& amount,
                                 const ValidationPolicy& policy, bool isTotal);

/// Текущая локальная дата
Date currentDate();

}  // namespace ifx
