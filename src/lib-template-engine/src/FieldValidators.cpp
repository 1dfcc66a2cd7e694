#include "ifx/FieldValidators.hpp"

#include <cctype>
#include <ctime>
#include <map>
#include <regex>

namespace ifx {

namespace {

std::string digitsOnly(std::string_view raw) {
  std::string digits;
  for (char c : raw) {
    if (std::isdigit(static_cast<unsigned char>(c))) digits.push_back(c);
  }
  return digits;
}

ValidationOutcome reject(std::string_view raw, std::string reason) {
  return ValidationOutcome{false, std::string(raw), std::move(reason)};
}

ValidationOutcome accept(std::string normalized) {
  return ValidationOutcome{true, std::move(normalized), {}};
}

const std::map<std::string, std::size_t>& ibanLengths() {
  static const std::map<std::string, std::size_t> lengths = {
      {"AT", 20}, {"BE", 16}, {"BG", 22}, {"CH", 21}, {"CZ", 24}, {"DE", 22},
      {"DK", 18}, {"EE", 20}, {"ES", 24}, {"FI", 18}, {"FR", 27}, {"GB", 22},
      {"HU", 28}, {"IE", 22}, {"IT", 27}, {"LT", 20}, {"LU", 20}, {"LV", 21},
      {"NL", 18}, {"PL", 28}, {"PT", 25}, {"RO", 24}, {"SE", 24}, {"SK", 24},
      {"UA", 29}};
  return lengths;
}

}  // namespace

ValidationOutcome validateFiscalId(std::string_view raw) {
  static constexpr int kWeights[] = {6, 5, 7, 2, 3, 4, 5, 6, 7};

  const std::string digits = digitsOnly(raw);
  if (digits.size() != 10) {
    return reject(raw, "NIP must have 10 digits, got " +
                           std::to_string(digits.size()));
  }

  int sum = 0;
  for (std::size_t i = 0; i < 9; ++i) {
    sum += kWeights[i] * (digits[i] - '0');
  }
  const int control = sum % 11;
  if (control == 10 || control != digits[9] - '0') {
    return reject(raw, "NIP checksum mismatch");
  }
  return accept(digits);
}

ValidationOutcome validateRoFiscalId(std::string_view raw) {
  static constexpr char kKey[] = "753217532";

  const std::string digits = digitsOnly(raw);
  if (digits.size() < 2 || digits.size() > 10) {
    return reject(raw, "CUI must have 2-10 digits, got " +
                           std::to_string(digits.size()));
  }

  const std::size_t bodyLength = digits.size() - 1;
  const std::size_t keyOffset = 9 - bodyLength;
  int sum = 0;
  for (std::size_t i = 0; i < bodyLength; ++i) {
    sum += (kKey[keyOffset + i] - '0') * (digits[i] - '0');
  }
  int control = sum * 10 % 11;
  if (control == 10) control = 0;
  if (control != digits.back() - '0') {
    return reject(raw, "CUI checksum mismatch");
  }
  return accept(digits);
}

ValidationOutcome validateBankAccount(std::string_view raw) {
  std::string compact;
  for (char c : raw) {
    const auto uc = static_cast<unsigned char>(c);
    if (c == ' ' || c == '-' || c == '\t') continue;
    if (!std::isalnum(uc)) {
      return reject(raw, "IBAN contains invalid character");
    }
    compact.push_back(static_cast<char>(std::toupper(uc)));
  }

  if (compact.size() == 26 && digitsOnly(compact).size() == 26) {
    compact = "PL" + compact;
  }

  if (compact.size() < 15 || compact.size() > 34) {
    return reject(raw, "IBAN length out of range");
  }
  if (!std::isalpha(static_cast<unsigned char>(compact[0])) ||
      !std::isalpha(static_cast<unsigned char>(compact[1])) ||
      !std::isdigit(static_cast<unsigned char>(compact[2])) ||
      !std::isdigit(static_cast<unsigned char>(compact[3]))) {
    return reject(raw, "IBAN must start with country code and check digits");
  }

  const auto& lengths = ibanLengths();
  if (auto it = lengths.find(compact.substr(0, 2)); it != lengths.end()) {
    if (compact.size() != it->second) {
      return reject(raw, "IBAN length " + std::to_string(compact.size()) +
                             " invalid for " + it->first);
    }
  }

  const std::string rearranged = compact.substr(4) + compact.substr(0, 4);
  int remainder = 0;
  for (char c : rearranged) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      remainder = (remainder * 10 + (c - '0')) % 97;
    } else {
      const int value = c - 'A' + 10;
      remainder = (remainder * 100 + value) % 97;
    }
  }
  if (remainder != 1) {
    return reject(raw, "IBAN checksum mismatch");
  }
  return accept(compact);
}

ValidationOutcome validateEmail(std::string_view raw) {
  static const std::regex kEmail(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})");

  const std::string candidate = normalizeText(raw);
  if (!std::regex_match(candidate, kEmail)) {
    return reject(raw, "malformed e-mail address");
  }
  return accept(toLowerAscii(candidate));
}

ValidationOutcome validateDate(const Date& date,
                               const ValidationPolicy& policy) {
  if (!Date::isValidCalendarDate(date.year, date.month, date.day)) {
    return reject(date.toIso(), "impossible calendar date");
  }
  if (date.year < policy.earliestYear) {
    return reject(date.toIso(), "date before " +
                                    std::to_string(policy.earliestYear));
  }

  const Date today = policy.today ? *policy.today : currentDate();
  const Date latest{today.year + policy.maxYearsAhead, today.month, today.day};
  if (latest < date) {
    return reject(date.toIso(), "date more than " +
                                    std::to_string(policy.maxYearsAhead) +
                                    " years ahead");
  }
  return accept(date.toIso());
}

ValidationOutcome validateAmount(const Amount& amount,
                                 const ValidationPolicy& policy,
                                 bool isTotal) {
  if (isTotal && amount.minorUnits() <= 0) {
    return reject(amount.toString(), "total amount must be positive");
  }
  const std::int64_t minor = amount.minorUnits();
  const std::int64_t magnitude = minor < 0 ? -minor : minor;
  if (magnitude > policy.amountCeiling.minorUnits()) {
    return reject(amount.toString(),
                  "amount exceeds " + policy.amountCeiling.toString());
  }
  return accept(amount.toString());
}

Date currentDate() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  return Date{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

}  // namespace ifx
