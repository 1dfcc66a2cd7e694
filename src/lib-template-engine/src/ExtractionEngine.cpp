#include "ifx/ExtractionEngine.hpp"

#include <algorithm>
#include <utility>

#include "ifx/Errors.hpp"
#include "ifx/compositelogger.hpp"

namespace ifx {

namespace {

using Window = std::pair<std::size_t, std::size_t>;

constexpr std::size_t kContextLookBehind = 50;

/// Окна поиска вокруг ключевых слов контекста; без совпадений весь текст
std::vector<Window> searchWindows(const std::string& text,
                                  const FieldRule& rule) {
  std::vector<Window> windows;
  if (!rule.contextKeywords.empty()) {
    const std::string lowered = toLowerAscii(text);
    for (const auto& keyword : rule.contextKeywords) {
      const std::string needle = toLowerAscii(keyword);
      for (std::size_t pos = lowered.find(needle); pos != std::string::npos;
           pos = lowered.find(needle, pos + 1)) {
        std::size_t begin =
            pos > kContextLookBehind ? pos - kContextLookBehind : 0;
        // Окно начинается с начала строки: '^' не должен срабатывать
        // посреди строки или UTF-8 последовательности
        if (begin > 0) {
          const std::size_t newline = text.rfind('\n', begin - 1);
          begin = newline == std::string::npos ? 0 : newline + 1;
        }
        const std::size_t end = std::min(text.size(), pos + rule.contextRange);
        windows.emplace_back(begin, end);
      }
    }
  }
  if (windows.empty()) windows.emplace_back(0, text.size());
  return windows;
}

/// Текст группы group; выражение без групп отдаёт всё совпадение
std::optional<std::string> capturedText(const std::smatch& match,
                                        std::size_t group) {
  if (group < match.size() && match[group].matched) return match[group].str();
  if (match.size() == 1) return match[0].str();
  return std::nullopt;
}

}  // namespace

std::string fieldValueToString(const FieldValue& value) {
  struct Visitor {
    std::string operator()(const std::string& text) const { return text; }
    std::string operator()(const Date& date) const { return date.toIso(); }
    std::string operator()(const Amount& amount) const {
      return amount.toString();
    }
    std::string operator()(std::int64_t number) const {
      return std::to_string(number);
    }
  };
  return std::visit(Visitor{}, value);
}

std::string toString(FieldStatus status) {
  switch (status) {
    case FieldStatus::Found:
      return "found";
    case FieldStatus::Missing:
      return "missing";
    case FieldStatus::Invalid:
      return "invalid";
  }
  return "missing";
}

bool ExtractedField::operator==(const ExtractedField& other) const {
  return name == other.name && type == other.type && status == other.status &&
         value == other.value && values == other.values && raw == other.raw &&
         reason == other.reason && required == other.required &&
         multiple == other.multiple && derived == other.derived;
}

const ExtractedField* ExtractionResult::field(const std::string& name) const {
  auto it = std::find_if(fields.begin(), fields.end(),
                         [&](const ExtractedField& f) { return f.name == name; });
  return it == fields.end() ? nullptr : &*it;
}

std::optional<FieldValue> ExtractionResult::value(
    const std::string& name) const {
  const ExtractedField* found = field(name);
  if (!found || found->status != FieldStatus::Found) return std::nullopt;
  return found->value;
}

bool ExtractionResult::operator==(const ExtractionResult& other) const {
  return templateId == other.templateId && fields == other.fields &&
         tables == other.tables && complete == other.complete;
}

ExtractionEngine::ExtractionEngine(ValidationPolicy policy)
    : policy_(std::move(policy)) {}

ExtractionResult ExtractionEngine::extract(const std::string& text,
                                           const Template& tpl) const {
  if (normalizeText(text).empty()) {
    throw EmptyDocumentError("Document text is empty");
  }

  const DecimalConvention localeConvention = conventionForLocale(tpl.locale);

  ExtractionResult result;
  result.templateId = tpl.id;

  for (const auto& rule : tpl.fields) {
    const DecimalConvention convention =
        conventionFromHint(rule.formatHint).value_or(localeConvention);
    result.fields.push_back(extractField(text, rule, convention));
  }
  applyDerivations(tpl, result);

  for (const auto& field : result.fields) {
    if (field.required && field.status != FieldStatus::Found) {
      result.complete = false;
      CompositeLogger::instance().debug("Template '" + tpl.id +
                                        "': required field '" + field.name +
                                        "' " + toString(field.status) + ": " +
                                        field.reason);
    }
  }

  for (const auto& table : tpl.tables) {
    result.tables[table.name] = extractTable(text, table);
  }

  return result;
}

ExtractedField ExtractionEngine::extractField(
    const std::string& text, const FieldRule& rule,
    DecimalConvention convention) const {
  ExtractedField field;
  field.name = rule.name;
  field.type = rule.type;
  field.required = rule.required;
  field.multiple = rule.multiple;

  if (!rule.mapping.empty()) {
    detectKeyword(text, rule, field);
    return field;
  }
  if (rule.multiple) {
    collectAll(text, rule, convention, field);
    return field;
  }

  const auto windows = searchWindows(text, rule);

  for (const auto& pattern : rule.patterns) {
    for (const auto& [begin, end] : windows) {
      std::smatch match;
      if (!searchPattern(pattern, text.begin() + begin, text.begin() + end,
                         match)) {
        continue;
      }

      const auto captured = capturedText(match, rule.group);
      if (!captured) continue;
      const std::string& raw = *captured;
      field.raw = raw;

      auto value = coerce(raw, rule, convention);
      if (!value) {
        field.reason = "cannot read '" + normalizeText(raw) + "' as " +
                       toString(rule.type);
        break;
      }

      const std::string failure = validate(*value, rule);
      if (!failure.empty()) {
        field.status = FieldStatus::Invalid;
        field.reason = failure;
        return field;
      }

      field.status = FieldStatus::Found;
      field.value = std::move(value);
      field.reason.clear();
      return field;
    }
  }

  if (field.reason.empty()) field.reason = "no pattern matched";
  return field;
}

void ExtractionEngine::collectAll(const std::string& text,
                                  const FieldRule& rule,
                                  DecimalConvention convention,
                                  ExtractedField& field) const {
  const auto windows = searchWindows(text, rule);
  std::string failure;

  for (const auto& pattern : rule.patterns) {
    for (const auto& [begin, end] : windows) {
      for (const auto& match : searchAllPatterns(
               pattern, text.begin() + begin, text.begin() + end)) {
        const auto captured = capturedText(match, rule.group);
        if (!captured) continue;

        auto value = coerce(*captured, rule, convention);
        if (!value) {
          field.raw = *captured;
          field.reason = "cannot read '" + normalizeText(*captured) +
                         "' as " + toString(rule.type);
          continue;
        }
        const std::string rejected = validate(*value, rule);
        if (!rejected.empty()) {
          field.raw = *captured;
          failure = rejected;
          continue;
        }
        if (std::find(field.values.begin(), field.values.end(), *value) ==
            field.values.end()) {
          field.values.push_back(std::move(*value));
        }
      }
    }
  }

  if (!field.values.empty()) {
    field.status = FieldStatus::Found;
    field.value = field.values.front();
    field.reason.clear();
    return;
  }
  if (!failure.empty()) {
    field.status = FieldStatus::Invalid;
    field.reason = failure;
    return;
  }
  if (field.reason.empty()) field.reason = "no pattern matched";
}

void ExtractionEngine::detectKeyword(const std::string& text,
                                     const FieldRule& rule,
                                     ExtractedField& field) const {
  const std::string lowered = toLowerAscii(text);
  for (const auto& entry : rule.mapping) {
    if (lowered.find(toLowerAscii(entry.keyword)) == std::string::npos) {
      continue;
    }
    field.raw = entry.keyword;
    FieldValue value(entry.value);
    const std::string failure = validate(value, rule);
    if (!failure.empty()) {
      field.status = FieldStatus::Invalid;
      field.reason = failure;
      return;
    }
    field.status = FieldStatus::Found;
    field.value = std::move(value);
    return;
  }
  field.reason = "no keyword matched";
}

void ExtractionEngine::applyDerivations(const Template& tpl,
                                        ExtractionResult& result) const {
  for (std::size_t i = 0; i < tpl.fields.size(); ++i) {
    const FieldRule& rule = tpl.fields[i];
    ExtractedField& field = result.fields[i];
    if (field.status != FieldStatus::Missing) continue;

    if (rule.defaultValue) {
      field.status = FieldStatus::Found;
      field.value = FieldValue(*rule.defaultValue);
      field.derived = true;
      field.reason.clear();
      continue;
    }
    if (!rule.fallback) continue;

    const auto source = result.value(rule.fallback->sourceField);
    const Date* base = source ? std::get_if<Date>(&*source) : nullptr;
    if (!base) {
      field.reason += "; fallback source '" + rule.fallback->sourceField +
                      "' not found";
      continue;
    }

    FieldValue value(base->addDays(rule.fallback->days));
    const std::string failure = validate(value, rule);
    if (!failure.empty()) {
      field.status = FieldStatus::Invalid;
      field.reason = failure;
      continue;
    }
    field.status = FieldStatus::Found;
    field.value = std::move(value);
    field.derived = true;
    field.reason.clear();
    CompositeLogger::instance().debug(
        "Template '" + tpl.id + "': field '" + rule.name + "' derived from '" +
        rule.fallback->sourceField + "'");
  }
}

std::optional<FieldValue> ExtractionEngine::coerce(
    const std::string& raw, const FieldRule& rule,
    DecimalConvention convention) const {
  switch (rule.type) {
    case ValueType::Text: {
      std::string text = normalizeText(raw);
      if (text.empty()) return std::nullopt;
      return FieldValue(std::move(text));
    }
    case ValueType::Date:
      if (auto date = parseDate(raw, rule.formatHint)) return FieldValue(*date);
      return std::nullopt;
    case ValueType::Amount:
      if (auto amount = Amount::parse(raw, convention)) {
        return FieldValue(*amount);
      }
      return std::nullopt;
    case ValueType::Integer:
      if (auto number = parseInteger(raw)) return FieldValue(*number);
      return std::nullopt;
  }
  return std::nullopt;
}

std::string ExtractionEngine::validate(FieldValue& value,
                                       const FieldRule& rule) const {
  ValidationOutcome outcome{true, {}, {}};

  if (auto* text = std::get_if<std::string>(&value)) {
    switch (rule.validator) {
      case FieldValidator::None:
        return {};
      case FieldValidator::Nip:
        outcome = validateFiscalId(*text);
        break;
      case FieldValidator::Cui:
        outcome = validateRoFiscalId(*text);
        break;
      case FieldValidator::Iban:
        outcome = validateBankAccount(*text);
        break;
      case FieldValidator::Email:
        outcome = validateEmail(*text);
        break;
    }
    if (outcome.valid) *text = outcome.normalized;
  } else if (const auto* date = std::get_if<Date>(&value)) {
    outcome = validateDate(*date, policy_);
  } else if (const auto* amount = std::get_if<Amount>(&value)) {
    outcome = validateAmount(*amount, policy_, rule.total);
  }

  return outcome.valid ? std::string() : outcome.reason;
}

std::vector<TableRow> ExtractionEngine::extractTable(
    const std::string& text, const TableRule& rule) const {
  std::vector<TableRow> rows;

  std::smatch startMatch;
  if (!searchPattern(rule.start, text, startMatch)) {
    CompositeLogger::instance().debug("Table '" + rule.name +
                                      "': start pattern not found");
    return rows;
  }

  // Строка с заголовком таблицы в область не входит
  auto regionBegin = std::find(startMatch[0].second, text.cend(), '\n');
  if (regionBegin != text.cend()) ++regionBegin;
  auto regionEnd = text.cend();
  if (rule.end) {
    std::smatch endMatch;
    if (searchPattern(*rule.end, regionBegin, text.cend(), endMatch)) {
      regionEnd = endMatch[0].first;
    }
  }

  auto lineBegin = regionBegin;
  while (lineBegin < regionEnd) {
    auto lineEnd = std::find(lineBegin, regionEnd, '\n');
    std::string line(lineBegin, lineEnd);
    lineBegin = lineEnd == regionEnd ? regionEnd : lineEnd + 1;

    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (normalizeText(line).empty()) continue;

    const bool skipped = std::any_of(
        rule.skipPatterns.begin(), rule.skipPatterns.end(),
        [&](const CompiledPattern& skip) {
          std::smatch ignored;
          return std::regex_search(line, ignored, skip.regex);
        });
    if (skipped) continue;

    TableRow row;
    auto pos = line.cbegin();
    bool complete = true;
    for (const auto& column : rule.columns) {
      std::smatch match;
      const auto flags = pos == line.cbegin()
                             ? std::regex_constants::match_default
                             : std::regex_constants::match_prev_avail;
      if (!std::regex_search(pos, line.cend(), match, column.pattern.regex,
                             flags)) {
        complete = false;
        break;
      }
      const bool grouped = match.size() > 1 && match[1].matched;
      row[column.name] = normalizeText(grouped ? match[1].str() : match[0].str());
      pos = match[0].second;
    }
    if (complete) rows.push_back(std::move(row));
  }

  return rows;
}

}  // namespace ifx
