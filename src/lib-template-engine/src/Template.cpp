#include "ifx/Template.hpp"

#include <algorithm>
#include <stdexcept>

namespace ifx {

std::string toString(ValueType type) {
  switch (type) {
    case ValueType::Text:
      return "text";
    case ValueType::Date:
      return "date";
    case ValueType::Amount:
      return "amount";
    case ValueType::Integer:
      return "integer";
  }
  return "text";
}

std::string toString(FieldValidator validator) {
  switch (validator) {
    case FieldValidator::None:
      return "none";
    case FieldValidator::Nip:
      return "nip";
    case FieldValidator::Cui:
      return "cui";
    case FieldValidator::Iban:
      return "iban";
    case FieldValidator::Email:
      return "email";
  }
  return "none";
}

ValueType valueTypeFromString(const std::string& name) {
  if (name == "text") return ValueType::Text;
  if (name == "date") return ValueType::Date;
  if (name == "amount") return ValueType::Amount;
  if (name == "integer") return ValueType::Integer;
  throw std::invalid_argument("Unknown value type: '" + name + "'");
}

FieldValidator fieldValidatorFromString(const std::string& name) {
  if (name.empty() || name == "none") return FieldValidator::None;
  if (name == "nip") return FieldValidator::Nip;
  if (name == "cui") return FieldValidator::Cui;
  if (name == "iban") return FieldValidator::Iban;
  if (name == "email") return FieldValidator::Email;
  throw std::invalid_argument("Unknown validator: '" + name + "'");
}

CompiledPattern compilePattern(const std::string& source) {
  CompiledPattern pattern;
  pattern.source = source;
  pattern.regex = std::regex(
      source, std::regex::ECMAScript | std::regex::icase);

  const bool anchoredStart = !source.empty() && source.front() == '^';
  bool anchoredEnd = false;
  if (source.size() >= 1 && source.back() == '$') {
    // "\$" в конце означает литерал
    std::size_t backslashes = 0;
    for (std::size_t i = source.size() - 1; i > 0 && source[i - 1] == '\\';
         --i) {
      ++backslashes;
    }
    anchoredEnd = backslashes % 2 == 0;
  }
  pattern.lineAnchored = anchoredStart || anchoredEnd;
  return pattern;
}

bool searchPattern(const CompiledPattern& pattern,
                   std::string::const_iterator first,
                   std::string::const_iterator last, std::smatch& match) {
  if (!pattern.lineAnchored) {
    return std::regex_search(first, last, match, pattern.regex);
  }

  auto lineBegin = first;
  while (true) {
    auto lineEnd = std::find(lineBegin, last, '\n');
    auto contentEnd = lineEnd;
    if (contentEnd != lineBegin && *(contentEnd - 1) == '\r') --contentEnd;

    if (std::regex_search(lineBegin, contentEnd, match, pattern.regex)) {
      return true;
    }
    if (lineEnd == last) return false;
    lineBegin = lineEnd + 1;
  }
}

std::vector<std::smatch> searchAllPatterns(const CompiledPattern& pattern,
                                           std::string::const_iterator first,
                                           std::string::const_iterator last) {
  std::vector<std::smatch> matches;
  if (!pattern.lineAnchored) {
    std::sregex_iterator it(first, last, pattern.regex);
    for (; it != std::sregex_iterator(); ++it) matches.push_back(*it);
    return matches;
  }

  auto lineBegin = first;
  while (lineBegin != last) {
    std::smatch match;
    if (!searchPattern(pattern, lineBegin, last, match)) break;
    matches.push_back(match);
    auto lineEnd = std::find(match[0].second, last, '\n');
    if (lineEnd == last) break;
    lineBegin = lineEnd + 1;
  }
  return matches;
}

}  // namespace ifx
