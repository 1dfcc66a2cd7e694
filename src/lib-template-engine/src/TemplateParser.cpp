#include "ifx/TemplateParser.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

#include "ifx/ValueCoercion.hpp"

namespace ifx {

using json = nlohmann::ordered_json;

namespace {

bool isUnboundedQuantifierAt(const std::string& pattern, std::size_t pos) {
  if (pos >= pattern.size()) return false;
  const char c = pattern[pos];
  if (c == '*' || c == '+') return true;
  if (c != '{') return false;

  std::size_t i = pos + 1;
  while (i < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[i]))) {
    ++i;
  }
  return i + 1 < pattern.size() && i > pos + 1 && pattern[i] == ',' &&
         pattern[i + 1] == '}';
}

std::string requireString(const json& node, const std::string& where) {
  if (!node.is_string()) {
    throw TemplateParseError(where + " must be a string");
  }
  return node.get<std::string>();
}

std::vector<std::string> stringList(const json& parent, const char* key,
                                    const std::string& where) {
  std::vector<std::string> values;
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) return values;
  if (!it->is_array()) {
    throw TemplateParseError(where + "." + key + " must be an array");
  }
  for (const auto& item : *it) {
    std::string value = normalizeText(requireString(item, where + "." + key));
    if (!value.empty()) values.push_back(std::move(value));
  }
  return values;
}

bool optionalBool(const json& parent, const char* key, bool fallback,
                  const std::string& where) {
  auto it = parent.find(key);
  if (it == parent.end()) return fallback;
  if (!it->is_boolean()) {
    throw TemplateParseError(where + "." + key + " must be a boolean");
  }
  return it->get<bool>();
}

std::int64_t optionalInteger(const json& parent, const char* key,
                             std::int64_t fallback, const std::string& where) {
  auto it = parent.find(key);
  if (it == parent.end()) return fallback;
  if (!it->is_number_integer()) {
    throw TemplateParseError(where + "." + key + " must be an integer");
  }
  return it->get<std::int64_t>();
}

CompiledPattern compileChecked(const std::string& source,
                               const std::string& where) {
  if (source.empty()) {
    throw TemplateParseError(where + " is an empty pattern");
  }
  try {
    TemplateParser::checkPatternComplexity(source);
  } catch (const TemplateParseError& e) {
    throw TemplateParseError(where + ": " + e.what());
  }
  try {
    return compilePattern(source);
  } catch (const std::regex_error& e) {
    throw TemplateParseError(where + ": invalid pattern '" + source +
                             "': " + e.what());
  }
}

/// Буквы и цифры в верхнем регистре
std::string compactFiscalId(const std::string& raw) {
  std::string compact;
  for (char c : raw) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) compact.push_back(static_cast<char>(std::toupper(uc)));
  }
  return compact;
}

constexpr int kMaxFallbackDays = 3650;

/// "use_issue_date" или "add_days:N"
DateFallback parseDateFallback(const std::string& text,
                               const std::string& where) {
  static const std::string kAddDays = "add_days:";
  DateFallback fallback;
  if (text == "use_issue_date") return fallback;
  if (text.compare(0, kAddDays.size(), kAddDays) == 0) {
    const auto days = parseInteger(text.substr(kAddDays.size()));
    if (days && *days >= -kMaxFallbackDays && *days <= kMaxFallbackDays) {
      fallback.days = static_cast<int>(*days);
      return fallback;
    }
  }
  throw TemplateParseError(where + ": unknown fallback '" + text +
                           "' (expected 'use_issue_date' or 'add_days:N')");
}

IssuerSignature parseIssuer(const json& node) {
  const std::string where = "issuer";
  if (!node.is_object()) {
    throw TemplateParseError("issuer must be an object");
  }

  IssuerSignature issuer;
  issuer.keywords = stringList(node, "keywords", where);
  issuer.excludeKeywords = stringList(node, "exclude_keywords", where);
  if (auto it = node.find("fiscal_id"); it != node.end() && !it->is_null()) {
    issuer.fiscalId = compactFiscalId(requireString(*it, "issuer.fiscal_id"));
  }
  return issuer;
}

FieldRule parseField(const std::string& name, const json& node) {
  const std::string where = "fields." + name;
  if (!node.is_object()) {
    throw TemplateParseError(where + " must be an object");
  }

  FieldRule rule;
  rule.name = name;

  std::vector<std::string> sources;
  if (auto it = node.find("patterns"); it != node.end()) {
    if (!it->is_array()) {
      throw TemplateParseError(where + ".patterns must be an array");
    }
    for (const auto& item : *it) {
      sources.push_back(requireString(item, where + ".patterns"));
    }
  } else if (auto single = node.find("pattern"); single != node.end()) {
    sources.push_back(requireString(*single, where + ".pattern"));
  }
  if (auto it = node.find("mapping"); it != node.end()) {
    if (!it->is_object() || it->empty()) {
      throw TemplateParseError(where + ".mapping must be a non-empty object");
    }
    for (const auto& [keyword, value] : it->items()) {
      const std::string normalized = normalizeText(keyword);
      if (normalized.empty()) {
        throw TemplateParseError(where + ".mapping has an empty keyword");
      }
      rule.mapping.push_back(KeywordMapping{
          normalized, requireString(value, where + ".mapping." + keyword)});
    }
  }
  if (sources.empty() && rule.mapping.empty()) {
    throw TemplateParseError(where + " has no patterns");
  }
  if (!sources.empty() && !rule.mapping.empty()) {
    throw TemplateParseError(where + ": 'patterns' and 'mapping' are exclusive");
  }
  for (std::size_t i = 0; i < sources.size(); ++i) {
    rule.patterns.push_back(compileChecked(
        sources[i], where + ".patterns[" + std::to_string(i) + "]"));
  }

  rule.required = optionalBool(node, "required", false, where);
  rule.total = optionalBool(node, "total", false, where);
  rule.multiple = optionalBool(node, "multiple", false, where);

  if (auto it = node.find("type"); it != node.end()) {
    try {
      rule.type = valueTypeFromString(requireString(*it, where + ".type"));
    } catch (const std::invalid_argument& e) {
      throw TemplateParseError(where + ": " + e.what());
    }
  }

  for (const char* key : {"format", "format_hint"}) {
    if (auto it = node.find(key); it != node.end()) {
      rule.formatHint = requireString(*it, where + "." + key);
    }
  }
  if (rule.type == ValueType::Amount && !rule.formatHint.empty() &&
      !conventionFromHint(rule.formatHint)) {
    throw TemplateParseError(where + ": amount format must be 'comma' or 'dot'");
  }

  if (auto it = node.find("validator"); it != node.end()) {
    try {
      rule.validator =
          fieldValidatorFromString(requireString(*it, where + ".validator"));
    } catch (const std::invalid_argument& e) {
      throw TemplateParseError(where + ": " + e.what());
    }
  }
  if (rule.validator != FieldValidator::None && rule.type != ValueType::Text) {
    throw TemplateParseError(where + ": validator '" +
                             toString(rule.validator) +
                             "' requires type 'text'");
  }
  if (rule.total && rule.type != ValueType::Amount) {
    throw TemplateParseError(where + ": 'total' requires type 'amount'");
  }
  if (rule.multiple && (rule.total || !rule.mapping.empty())) {
    throw TemplateParseError(where +
                             ": 'multiple' cannot be combined with 'total' "
                             "or 'mapping'");
  }
  if (!rule.mapping.empty() && rule.type != ValueType::Text) {
    throw TemplateParseError(where + ": 'mapping' requires type 'text'");
  }

  if (auto it = node.find("default"); it != node.end() && !it->is_null()) {
    if (rule.type != ValueType::Text) {
      throw TemplateParseError(where + ": 'default' requires type 'text'");
    }
    std::string value = normalizeText(requireString(*it, where + ".default"));
    if (value.empty()) {
      throw TemplateParseError(where + ".default must not be blank");
    }
    rule.defaultValue = std::move(value);
  }

  if (auto it = node.find("fallback"); it != node.end() && !it->is_null()) {
    if (rule.type != ValueType::Date || rule.multiple) {
      throw TemplateParseError(where +
                               ": 'fallback' requires a single 'date' field");
    }
    rule.fallback = parseDateFallback(requireString(*it, where + ".fallback"),
                                      where);
  }

  const auto group = optionalInteger(node, "group", 1, where);
  if (group < 0) {
    throw TemplateParseError(where + ".group must not be negative");
  }
  rule.group = static_cast<std::size_t>(group);
  // Выражение без групп отдаёт всё совпадение
  for (std::size_t i = 0; i < rule.patterns.size(); ++i) {
    const std::size_t captures = rule.patterns[i].regex.mark_count();
    if (captures > 0 && rule.group > captures) {
      throw TemplateParseError(where + ".group " + std::to_string(rule.group) +
                               " exceeds the " + std::to_string(captures) +
                               " capture group(s) of patterns[" +
                               std::to_string(i) + "]");
    }
  }

  rule.contextKeywords = stringList(node, "context_keywords", where);
  const auto range = optionalInteger(node, "context_range", 200, where);
  if (range <= 0) {
    throw TemplateParseError(where + ".context_range must be positive");
  }
  rule.contextRange = static_cast<std::size_t>(range);

  return rule;
}

TableRule parseTable(const std::string& name, const json& node) {
  const std::string where = "tables." + name;
  if (!node.is_object()) {
    throw TemplateParseError(where + " must be an object");
  }

  TableRule rule;
  rule.name = name;

  auto start = node.find("start");
  if (start == node.end()) {
    throw TemplateParseError(where + " has no start pattern");
  }
  rule.start = compileChecked(requireString(*start, where + ".start"),
                              where + ".start");

  if (auto end = node.find("end"); end != node.end() && !end->is_null()) {
    rule.end = compileChecked(requireString(*end, where + ".end"),
                              where + ".end");
  }

  auto columns = node.find("columns");
  if (columns == node.end() || !columns->is_array() || columns->empty()) {
    throw TemplateParseError(where + ".columns must be a non-empty array");
  }
  for (const auto& column : *columns) {
    if (!column.is_object() || !column.contains("name") ||
        !column.contains("pattern")) {
      throw TemplateParseError(where +
                               ".columns entries need 'name' and 'pattern'");
    }
    const std::string columnName =
        requireString(column.at("name"), where + ".columns.name");
    rule.columns.push_back(TableColumn{
        columnName,
        compileChecked(requireString(column.at("pattern"),
                                     where + ".columns." + columnName),
                       where + ".columns." + columnName)});
  }

  for (const auto& skip : stringList(node, "skip", where)) {
    rule.skipPatterns.push_back(compileChecked(skip, where + ".skip"));
  }
  return rule;
}

}  // namespace

void TemplateParser::checkPatternComplexity(const std::string& pattern) {
  if (pattern.size() > MAX_PATTERN_LENGTH) {
    throw TemplateParseError("pattern longer than " +
                             std::to_string(MAX_PATTERN_LENGTH) +
                             " characters");
  }

  // Для каждой открытой группы: содержит ли её тело неограниченный квантификатор
  std::vector<bool> groups{false};
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c == '\\') {
      ++i;
      continue;
    }
    if (c == '[') {
      ++i;
      if (i < pattern.size() && pattern[i] == '^') ++i;
      if (i < pattern.size() && pattern[i] == ']') ++i;
      while (i < pattern.size() && pattern[i] != ']') {
        if (pattern[i] == '\\') ++i;
        ++i;
      }
      continue;
    }
    if (c == '(') {
      groups.push_back(false);
      continue;
    }
    if (c == ')') {
      if (groups.size() <= 1) continue;  // несбалансированные скобки отловит std::regex
      const bool inner = groups.back();
      groups.pop_back();
      const bool quantified = isUnboundedQuantifierAt(pattern, i + 1);
      if (inner && quantified) {
        throw TemplateParseError("nested unbounded quantifier near offset " +
                                 std::to_string(i));
      }
      if (inner || quantified) groups.back() = true;
      continue;
    }
    if (isUnboundedQuantifierAt(pattern, i)) groups.back() = true;
  }
}

Template TemplateParser::parse(const TemplateDocument& document) {
  json root;
  try {
    root = json::parse(document.content);
  } catch (const json::parse_error& e) {
    throw TemplateParseError(std::string("invalid JSON: ") + e.what());
  }
  if (!root.is_object()) {
    throw TemplateParseError("document root must be an object");
  }

  auto header = root.find("template");
  if (header == root.end() || !header->is_object()) {
    throw TemplateParseError("missing 'template' section");
  }

  Template tpl;
  tpl.sourcePath = document.path;

  tpl.id = document.derivedId;
  if (auto name = header->find("name"); name != header->end()) {
    tpl.id = normalizeText(requireString(*name, "template.name"));
  }
  if (tpl.id.empty()) {
    throw TemplateParseError("template has no name and no path-derived id");
  }

  tpl.locale = document.locale;
  if (auto locale = header->find("locale"); locale != header->end()) {
    tpl.locale = requireString(*locale, "template.locale");
  }
  tpl.locale = toLowerAscii(normalizeText(tpl.locale));

  if (auto description = header->find("description");
      description != header->end()) {
    tpl.description = requireString(*description, "template.description");
  }

  const auto priority = optionalInteger(*header, "priority", 50, "template");
  if (priority < MIN_PRIORITY || priority > MAX_PRIORITY) {
    throw TemplateParseError("template.priority " + std::to_string(priority) +
                             " outside [0, 100]");
  }
  tpl.priority = static_cast<int>(priority);

  if (auto issuer = root.find("issuer");
      issuer != root.end() && !issuer->is_null()) {
    tpl.issuer = parseIssuer(*issuer);
  }

  auto fields = root.find("fields");
  if (fields == root.end() || !fields->is_object() || fields->empty()) {
    throw TemplateParseError("'fields' must be a non-empty object");
  }
  for (const auto& [name, node] : fields->items()) {
    tpl.fields.push_back(parseField(name, node));
  }
  for (const auto& rule : tpl.fields) {
    if (!rule.fallback) continue;
    const auto& source = rule.fallback->sourceField;
    const auto it = std::find_if(
        tpl.fields.begin(), tpl.fields.end(),
        [&](const FieldRule& other) { return other.name == source; });
    if (it == tpl.fields.end() || it->type != ValueType::Date ||
        it->multiple || it->name == rule.name) {
      throw TemplateParseError("fields." + rule.name + ".fallback needs a " +
                               "separate single date field '" + source + "'");
    }
  }

  if (auto tables = root.find("tables");
      tables != root.end() && !tables->is_null()) {
    if (!tables->is_object()) {
      throw TemplateParseError("'tables' must be an object");
    }
    for (const auto& [name, node] : tables->items()) {
      tpl.tables.push_back(parseTable(name, node));
    }
  }

  return tpl;
}

}  // namespace ifx
