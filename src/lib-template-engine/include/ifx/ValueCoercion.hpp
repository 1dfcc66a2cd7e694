/**
 * @file ValueCoercion.hpp
 * @brief Приведение захваченного текста к типам полей
 *
 * @details Денежные суммы хранятся в минимальных единицах (int64, 2 знака
 * после запятой), без двоичной плавающей точки.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ifx {

/// Десятичный разделитель суммы
enum class DecimalConvention { Comma, Dot };

/// "dot" для английской локали, "comma" для остальных
DecimalConvention conventionForLocale(const std::string& locale);

/// Разбор подсказки формата ("comma" / "dot"); пустая подсказка: nullopt
std::optional<DecimalConvention> conventionFromHint(const std::string& hint);

class Amount {
 public:
  Amount() = default;
  explicit Amount(std::int64_t minorUnits) : minor_(minorUnits) {}

  /**
   * @brief Разбор суммы вида "1 234,56 zł", "PLN 1.234,56", "-12.5"
   *
   * @details Разделители тысяч (пробел, апостроф, неразрывный пробел и
   * "чужой" из пары '.'/',') удаляются с проверкой группировки по 3 цифры.
   * Если десятичного разделителя нет, а "чужой" встречается один раз и за
   * ним 1-2 цифры в конце, он считается десятичным.
   *
   * @return nullopt при некорректном формате или более чем 2 знаках дробной части
   */
  static std::optional<Amount> parse(std::string_view text,
                                     DecimalConvention convention);

  std::int64_t minorUnits() const noexcept { return minor_; }

  /// Каноническая форма "1234.56"
  std::string toString() const;

  /// Форматирование в заданной конвенции ("1 234,56" / "1,234.56")
  std::string format(DecimalConvention convention,
                     bool groupThousands = false) const;

  bool operator==(const Amount& other) const noexcept {
    return minor_ == other.minor_;
  }
  bool operator!=(const Amount& other) const noexcept {
    return minor_ != other.minor_;
  }
  bool operator<(const Amount& other) const noexcept {
    return minor_ < other.minor_;
  }

 private:
  std::int64_t minor_ = 0;
};

struct Date {
  int year = 0;
  int month = 0;
  int day = 0;

  /// YYYY-MM-DD
  std::string toIso() const;

  static bool isValidCalendarDate(int year, int month, int day) noexcept;

  /// Дата, сдвинутая на days дней (отрицательное значение: назад)
  Date addDays(int days) const;

  bool operator==(const Date& other) const noexcept {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const Date& other) const noexcept {
    return !(*this == other);
  }
  bool operator<(const Date& other) const noexcept;
};

/// Раскладки по умолчанию, если шаблон не задал format
inline constexpr const char* DEFAULT_DATE_FORMATS =
    "%Y-%m-%d|%d.%m.%Y|%d/%m/%Y|%d-%m-%Y";

/**
 * @brief Разбор даты по подсказке формата
 * @param hint Раскладки через '|': %d, %m, %Y, %y (две цифры, 20xx).
 *        Разделители '.', '/', '-' взаимозаменяемы.
 * @return nullopt, если ни одна раскладка не подошла или дата невозможна
 */
std::optional<Date> parseDate(std::string_view text, const std::string& hint);

/// Целое со знаком, с проверкой переполнения
std::optional<std::int64_t> parseInteger(std::string_view text);

/// Обрезка краёв и схлопывание внутренних пробельных последовательностей
std::string normalizeText(std::string_view text);

/// Нижний регистр для ASCII, остальные байты без изменений
std::string toLowerAscii(std::string_view text);

}  // namespace ifx
