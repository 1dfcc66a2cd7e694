#include "ifx/ValueCoercion.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <limits>
#include <tuple>
#include <vector>

namespace ifx {

namespace {

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)); }

bool isDateSeparator(char c) { return c == '.' || c == '/' || c == '-'; }

/// Читает от minDigits до maxDigits цифр начиная с pos
std::optional<int> readNumber(std::string_view text, std::size_t& pos,
                              std::size_t minDigits, std::size_t maxDigits) {
  std::size_t start = pos;
  int value = 0;
  while (pos < text.size() && pos - start < maxDigits && isDigit(text[pos])) {
    value = value * 10 + (text[pos] - '0');
    ++pos;
  }
  if (pos - start < minDigits) return std::nullopt;
  return value;
}

std::optional<Date> parseWithLayout(std::string_view text,
                                    std::string_view layout) {
  std::size_t pos = 0;
  std::optional<int> year, month, day;

  for (std::size_t i = 0; i < layout.size(); ++i) {
    const char c = layout[i];
    if (c == '%' && i + 1 < layout.size()) {
      const char spec = layout[++i];
      switch (spec) {
        case 'd':
          day = readNumber(text, pos, 1, 2);
          if (!day) return std::nullopt;
          break;
        case 'm':
          month = readNumber(text, pos, 1, 2);
          if (!month) return std::nullopt;
          break;
        case 'Y':
          year = readNumber(text, pos, 4, 4);
          if (!year) return std::nullopt;
          break;
        case 'y': {
          auto shortYear = readNumber(text, pos, 2, 2);
          if (!shortYear) return std::nullopt;
          year = 2000 + *shortYear;
          break;
        }
        default:
          return std::nullopt;
      }
    } else if (isDateSeparator(c)) {
      if (pos >= text.size() || !isDateSeparator(text[pos])) {
        return std::nullopt;
      }
      ++pos;
    } else if (isSpace(c)) {
      while (pos < text.size() && isSpace(text[pos])) ++pos;
    } else {
      if (pos >= text.size() ||
          std::tolower(static_cast<unsigned char>(text[pos])) !=
              std::tolower(static_cast<unsigned char>(c))) {
        return std::nullopt;
      }
      ++pos;
    }
  }

  if (pos != text.size() || !year || !month || !day) return std::nullopt;
  if (!Date::isValidCalendarDate(*year, *month, *day)) return std::nullopt;
  return Date{*year, *month, *day};
}

}  // namespace

DecimalConvention conventionForLocale(const std::string& locale) {
  const std::string lowered = toLowerAscii(locale);
  if (lowered == "en" || lowered.rfind("en-", 0) == 0 ||
      lowered.rfind("en_", 0) == 0) {
    return DecimalConvention::Dot;
  }
  return DecimalConvention::Comma;
}

std::optional<DecimalConvention> conventionFromHint(const std::string& hint) {
  const std::string lowered = toLowerAscii(hint);
  if (lowered == "comma") return DecimalConvention::Comma;
  if (lowered == "dot") return DecimalConvention::Dot;
  return std::nullopt;
}

std::optional<Amount> Amount::parse(std::string_view text,
                                    DecimalConvention convention) {
  std::size_t first = std::string_view::npos;
  std::size_t last = std::string_view::npos;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (isDigit(text[i])) {
      if (first == std::string_view::npos) first = i;
      last = i;
    }
  }
  if (first == std::string_view::npos) return std::nullopt;

  // Знак учитывается, только если '-' стоит непосредственно перед числом
  bool negative = false;
  for (std::size_t i = first; i > 0; --i) {
    const char c = text[i - 1];
    if (c == ' ') continue;
    negative = c == '-';
    break;
  }

  // Числовое ядро: цифры, '.', ',' и ' ' на месте любых пробельных разделителей
  std::string core;
  for (std::size_t i = first; i <= last; ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (isDigit(text[i]) || c == '.' || c == ',') {
      core.push_back(text[i]);
    } else if (c == ' ' || c == '\'' || c == '\t') {
      if (core.back() != ' ') core.push_back(' ');
    } else if (c == 0xC2 && i + 1 <= last &&
               static_cast<unsigned char>(text[i + 1]) == 0xA0) {
      if (core.back() != ' ') core.push_back(' ');
      i += 1;
    } else if (c == 0xE2 && i + 2 <= last &&
               static_cast<unsigned char>(text[i + 1]) == 0x80 &&
               static_cast<unsigned char>(text[i + 2]) == 0xAF) {
      if (core.back() != ' ') core.push_back(' ');
      i += 2;
    } else {
      return std::nullopt;
    }
  }

  char decimal = convention == DecimalConvention::Comma ? ',' : '.';
  char other = convention == DecimalConvention::Comma ? '.' : ',';

  std::size_t decimalCount = 0;
  std::size_t otherCount = 0;
  for (char c : core) {
    if (c == decimal) ++decimalCount;
    if (c == other) ++otherCount;
  }
  if (decimalCount == 0 && otherCount == 1) {
    const std::size_t tail = core.size() - core.find(other) - 1;
    if (tail >= 1 && tail <= 2) {
      std::swap(decimal, other);
      std::swap(decimalCount, otherCount);
      other = ' ';
    }
  }
  if (decimalCount > 1) return std::nullopt;

  std::string integerPart = core;
  std::string fraction;
  if (decimalCount == 1) {
    const std::size_t pos = core.find(decimal);
    integerPart = core.substr(0, pos);
    fraction = core.substr(pos + 1);
    if (fraction.empty() || fraction.size() > 2) return std::nullopt;
    for (char c : fraction) {
      if (!isDigit(c)) return std::nullopt;
    }
  }

  std::vector<std::string> groups(1);
  for (char c : integerPart) {
    if (isDigit(c)) {
      groups.back().push_back(c);
    } else if (c == ' ' || c == other) {
      groups.emplace_back();
    } else {
      return std::nullopt;
    }
  }
  if (groups.size() > 1) {
    if (groups.front().empty() || groups.front().size() > 3) {
      return std::nullopt;
    }
    for (std::size_t i = 1; i < groups.size(); ++i) {
      if (groups[i].size() != 3) return std::nullopt;
    }
  } else if (groups.front().empty()) {
    return std::nullopt;
  }

  constexpr std::int64_t kMaxUnits =
      (std::numeric_limits<std::int64_t>::max() - 99) / 100;
  std::int64_t units = 0;
  for (const auto& group : groups) {
    for (char c : group) {
      if (units > (kMaxUnits - (c - '0')) / 10) return std::nullopt;
      units = units * 10 + (c - '0');
    }
  }

  std::int64_t cents = 0;
  if (!fraction.empty()) {
    cents = (fraction[0] - '0') * 10;
    if (fraction.size() == 2) cents += fraction[1] - '0';
  }

  const std::int64_t minor = units * 100 + cents;
  return Amount(negative ? -minor : minor);
}

std::string Amount::toString() const {
  return format(DecimalConvention::Dot, false);
}

std::string Amount::format(DecimalConvention convention,
                           bool groupThousands) const {
  const bool negative = minor_ < 0;
  const std::uint64_t magnitude =
      negative ? static_cast<std::uint64_t>(-(minor_ + 1)) + 1
               : static_cast<std::uint64_t>(minor_);

  std::string units = std::to_string(magnitude / 100);
  if (groupThousands) {
    const char separator = convention == DecimalConvention::Comma ? ' ' : ',';
    for (int pos = static_cast<int>(units.size()) - 3; pos > 0; pos -= 3) {
      units.insert(static_cast<std::size_t>(pos), 1, separator);
    }
  }

  const std::uint64_t cents = magnitude % 100;
  std::string result = negative ? "-" : "";
  result += units;
  result.push_back(convention == DecimalConvention::Comma ? ',' : '.');
  result.push_back(static_cast<char>('0' + cents / 10));
  result.push_back(static_cast<char>('0' + cents % 10));
  return result;
}

std::string Date::toIso() const {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
  return buffer;
}

bool Date::isValidCalendarDate(int year, int month, int day) noexcept {
  if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
    return false;
  }
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30,
                                  31, 31, 30, 31, 30, 31};
  int maxDay = kDays[month - 1];
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) maxDay = 29;
  return day <= maxDay;
}

Date Date::addDays(int days) const {
  // Номер дня от 1970-01-01 (пролептический григорианский календарь)
  const int y = month <= 2 ? year - 1 : year;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const int yoe = y - era * 400;
  const int mp = (month + 9) % 12;
  const int doy = (153 * mp + 2) / 5 + day - 1;
  const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  const long serial = static_cast<long>(era) * 146097 + doe - 719468 + days;

  const long z = serial + 719468;
  const long shiftedEra = (z >= 0 ? z : z - 146096) / 146097;
  const long dayOfEra = z - shiftedEra * 146097;
  const long yearOfEra =
      (dayOfEra - dayOfEra / 1460 + dayOfEra / 36524 - dayOfEra / 146096) / 365;
  const long dayOfYear = dayOfEra - (365 * yearOfEra + yearOfEra / 4 - yearOfEra / 100);
  const long monthIndex = (5 * dayOfYear + 2) / 153;

  Date shifted;
  shifted.day = static_cast<int>(dayOfYear - (153 * monthIndex + 2) / 5 + 1);
  shifted.month = static_cast<int>(monthIndex < 10 ? monthIndex + 3 : monthIndex - 9);
  shifted.year = static_cast<int>(yearOfEra + shiftedEra * 400 +
                                  (shifted.month <= 2 ? 1 : 0));
  return shifted;
}

bool Date::operator<(const Date& other) const noexcept {
  return std::tie(year, month, day) <
         std::tie(other.year, other.month, other.day);
}

std::optional<Date> parseDate(std::string_view text, const std::string& hint) {
  const std::string normalized = normalizeText(text);
  if (normalized.empty()) return std::nullopt;

  const std::string layouts = hint.empty() ? DEFAULT_DATE_FORMATS : hint;
  std::size_t begin = 0;
  while (begin <= layouts.size()) {
    std::size_t end = layouts.find('|', begin);
    if (end == std::string::npos) end = layouts.size();
    const std::string_view layout(layouts.data() + begin, end - begin);
    if (!layout.empty()) {
      if (auto date = parseWithLayout(normalized, layout)) return date;
    }
    begin = end + 1;
  }
  return std::nullopt;
}

std::optional<std::int64_t> parseInteger(std::string_view text) {
  std::string compact;
  for (char c : normalizeText(text)) {
    if (c != ' ') compact.push_back(c);
  }
  if (!compact.empty() && compact.front() == '+') compact.erase(0, 1);
  if (compact.empty()) return std::nullopt;

  std::int64_t value = 0;
  const char* begin = compact.data();
  const char* end = compact.data() + compact.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  return value;
}

std::string normalizeText(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  bool pendingSpace = false;
  for (char c : text) {
    if (isSpace(c)) {
      pendingSpace = !result.empty();
      continue;
    }
    if (pendingSpace) {
      result.push_back(' ');
      pendingSpace = false;
    }
    result.push_back(c);
  }
  return result;
}

std::string toLowerAscii(std::string_view text) {
  std::string result(text);
  for (char& c : result) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x80) c = static_cast<char>(std::tolower(uc));
  }
  return result;
}

}  // namespace ifx
