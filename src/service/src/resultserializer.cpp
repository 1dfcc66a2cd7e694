#include "../include/resultserializer.hpp"

#include <type_traits>
#include <variant>

using nlohmann::ordered_json;

ordered_json ResultSerializer::valueToJson(const ifx::FieldValue &value) {
  return std::visit(
      [](const auto &v) -> ordered_json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::int64_t>) {
          return v;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, ifx::Date>) {
          return v.toIso();
        } else {
          return v.toString();
        }
      },
      value);
}

ordered_json ResultSerializer::toJson(const ifx::ExtractedField &field) {
  ordered_json out;
  out["status"] = ifx::toString(field.status);
  out["type"] = ifx::toString(field.type);
  out["value"] = field.value ? valueToJson(*field.value) : ordered_json();
  if (field.multiple) {
    ordered_json values = ordered_json::array();
    for (const auto &value : field.values) values.push_back(valueToJson(value));
    out["values"] = std::move(values);
  }
  if (field.derived) out["derived"] = true;
  if (!field.raw.empty()) out["raw"] = field.raw;
  if (!field.reason.empty()) out["reason"] = field.reason;
  out["required"] = field.required;
  return out;
}

ordered_json ResultSerializer::toJson(const ifx::ExtractionResult &result) {
  ordered_json out;
  out["template"] = result.templateId;
  out["complete"] = result.complete;

  ordered_json fields = ordered_json::object();
  for (const auto &field : result.fields) {
    fields[field.name] = toJson(field);
  }
  out["fields"] = std::move(fields);

  ordered_json tables = ordered_json::object();
  for (const auto &[name, rows] : result.tables) {
    ordered_json jsonRows = ordered_json::array();
    for (const auto &row : rows) {
      ordered_json jsonRow = ordered_json::object();
      for (const auto &[column, text] : row) {
        jsonRow[column] = text;
      }
      jsonRows.push_back(std::move(jsonRow));
    }
    tables[name] = std::move(jsonRows);
  }
  out["tables"] = std::move(tables);
  return out;
}

ordered_json ResultSerializer::toJson(const ifx::MatchCandidate &candidate) {
  ordered_json out;
  out["template"] = candidate.templateId;
  out["score"] = candidate.score;
  out["matched_keywords"] = candidate.matchedKeywords;
  out["matched_fiscal_id"] = candidate.matchedFiscalId;
  return out;
}

ordered_json ResultSerializer::toJson(const DocumentReport &report) {
  ordered_json out;
  out["source"] = report.source;
  if (report.failed()) {
    out["error"] = report.error;
    return out;
  }

  out["store_generation"] = report.storeGeneration;
  if (report.match) {
    out["match"] = toJson(*report.match);
  } else {
    out["match"] = nullptr;
  }

  if (!report.candidates.empty()) {
    ordered_json candidates = ordered_json::array();
    for (const auto &candidate : report.candidates) {
      candidates.push_back(toJson(candidate));
    }
    out["candidates"] = std::move(candidates);
  }

  if (report.result) {
    out["result"] = toJson(*report.result);
  }

  if (report.fingerprint) {
    out["fingerprint"] = {{"key", report.fingerprint->value},
                          {"digest", report.fingerprint->digest()}};
  } else if (report.result) {
    out["fingerprint"] = nullptr;
  }

  if (report.duplicateOf) {
    out["duplicate_of"] = *report.duplicateOf;
  }
  return out;
}

ordered_json ResultSerializer::toJson(const ifx::LoadReport &report) {
  ordered_json out;
  out["documents_seen"] = report.documentsSeen;
  out["templates"] = report.store ? report.store->size() : 0;
  out["generation"] = report.store ? report.store->generation() : 0;
  out["overridden"] = report.overridden;

  ordered_json errors = ordered_json::array();
  for (const auto &error : report.errors) {
    errors.push_back({{"path", error.path}, {"reason", error.reason}});
  }
  out["errors"] = std::move(errors);
  return out;
}

std::string ResultSerializer::dump(const ordered_json &json, int indent) {
  return json.dump(indent, ' ', false, ordered_json::error_handler_t::replace);
}

std::string ResultSerializer::toLine(const DocumentReport &report) {
  try {
    return dump(toJson(report));
  } catch (const nlohmann::json::exception &e) {
    ordered_json out;
    out["source"] = report.source;
    out["error"] = std::string("cannot serialize report: ") + e.what();
    return dump(out);
  }
}
