/**
 * @file configvalidator.cpp
 * @brief Реализация валидатора структуры JSON-конфигурации
 */
#include "../include/configvalidator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "ifx/TemplateMatcher.hpp"
#include "ifx/ValueCoercion.hpp"

using namespace std;

namespace {

void requireInteger(const nlohmann::json &section, const string &key,
                    const string &sectionName) {
  if (section.contains(key) && !section[key].is_number_integer()) {
    throw runtime_error("ConfigValidator: " + sectionName + "." + key +
                        " must be an integer");
  }
}

}  // namespace

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  const vector<string> required_sections = {"defaults", "environments"};

  for (const auto &section : required_sections) {
    if (!config.contains(section) || !config[section].is_object()) {
      throw runtime_error("ConfigValidator: Missing required section: " +
                          section);
    }
  }

  if (config["defaults"].empty()) {
    throw runtime_error("ConfigValidator: Defaults section cannot be empty");
  }

  for (const auto &[name, env] : config["environments"].items()) {
    if (!env.is_object()) {
      throw runtime_error("ConfigValidator: Environment '" + name +
                          "' must be an object");
    }
  }

  return true;
}

bool ConfigValidator::validateMerged(const nlohmann::json &merged) const {
  if (!merged.contains("template_sources")) {
    throw runtime_error(
        "ConfigValidator: Missing required section: template_sources");
  }
  validateTemplateSources(merged["template_sources"]);

  if (merged.contains("locale") && !merged["locale"].is_string()) {
    throw runtime_error("ConfigValidator: locale must be a string");
  }
  if (merged.contains("scoring")) validateScoring(merged["scoring"]);
  if (merged.contains("validation")) validateValidation(merged["validation"]);
  if (merged.contains("fingerprint")) {
    validateFingerprint(merged["fingerprint"]);
  }
  if (merged.contains("logging")) validateLogging(merged["logging"]);
  return true;
}

bool ConfigValidator::validateTemplateSources(
    const nlohmann::json &sources) const {
  if (!sources.is_array()) {
    throw runtime_error("ConfigValidator: template_sources must be an array");
  }
  if (sources.empty()) {
    throw runtime_error("ConfigValidator: template_sources cannot be empty");
  }

  for (const auto &source : sources) {
    if (!source.is_object()) {
      throw runtime_error(
          "ConfigValidator: Template source entry must be an object");
    }
    if (!source.contains("path") || !source["path"].is_string() ||
        source["path"].get<string>().empty()) {
      throw runtime_error(
          "ConfigValidator: Template source missing required field: path");
    }
    if (source.contains("locale") && !source["locale"].is_string()) {
      throw runtime_error(
          "ConfigValidator: Invalid locale type in template source " +
          source["path"].get<string>());
    }
    if (source.contains("optional") && !source["optional"].is_boolean()) {
      throw runtime_error(
          "ConfigValidator: Invalid optional flag in template source " +
          source["path"].get<string>());
    }
  }
  return true;
}

bool ConfigValidator::validateScoring(const nlohmann::json &scoring) const {
  if (!scoring.is_object()) {
    throw runtime_error("ConfigValidator: scoring must be an object");
  }
  for (const char *key : {"keyword_weight", "fiscal_id_weight",
                          "priority_weight", "min_score"}) {
    requireInteger(scoring, key, "scoring");
  }

  ifx::ScoringWeights weights;
  weights.keywordWeight = scoring.value("keyword_weight", weights.keywordWeight);
  weights.fiscalIdWeight =
      scoring.value("fiscal_id_weight", weights.fiscalIdWeight);
  weights.priorityWeight =
      scoring.value("priority_weight", weights.priorityWeight);
  weights.minScore = scoring.value("min_score", weights.minScore);
  try {
    ifx::validateWeights(weights);
  } catch (const invalid_argument &e) {
    throw runtime_error(string("ConfigValidator: ") + e.what());
  }
  return true;
}

bool ConfigValidator::validateValidation(
    const nlohmann::json &validation) const {
  if (!validation.is_object()) {
    throw runtime_error("ConfigValidator: validation must be an object");
  }
  requireInteger(validation, "earliest_year", "validation");
  requireInteger(validation, "max_years_ahead", "validation");

  if (validation.value("max_years_ahead", 0) < 0) {
    throw runtime_error(
        "ConfigValidator: validation.max_years_ahead cannot be negative");
  }

  if (validation.contains("amount_ceiling")) {
    const auto &ceiling = validation["amount_ceiling"];
    if (!ceiling.is_string()) {
      throw runtime_error(
          "ConfigValidator: validation.amount_ceiling must be a decimal "
          "string");
    }
    auto amount = ifx::Amount::parse(ceiling.get<string>(),
                                     ifx::DecimalConvention::Dot);
    if (!amount || amount->minorUnits() <= 0) {
      throw runtime_error("ConfigValidator: Invalid amount_ceiling: " +
                          ceiling.get<string>());
    }
  }
  return true;
}

bool ConfigValidator::validateFingerprint(
    const nlohmann::json &fingerprint) const {
  if (!fingerprint.is_object()) {
    throw runtime_error("ConfigValidator: fingerprint must be an object");
  }
  const vector<string> known = {"fiscal_id", "document_number",
                                "document_date", "gross_amount"};
  for (const auto &[key, value] : fingerprint.items()) {
    if (find(known.begin(), known.end(), key) == known.end()) {
      throw runtime_error("ConfigValidator: Unknown fingerprint key: " + key);
    }
    if (!value.is_string() || value.get<string>().empty()) {
      throw runtime_error("ConfigValidator: fingerprint." + key +
                          " must be a field name");
    }
  }
  return true;
}

bool ConfigValidator::validateLogging(const nlohmann::json &logging) const {
  if (!logging.is_array()) {
    throw runtime_error("ConfigValidator: Logging config must be an array");
  }

  const vector<string> valid_types = {"console", "sync_file"};
  const vector<string> valid_levels = {"debug", "info", "warning", "error",
                                       "critical"};

  for (const auto &logger : logging) {
    if (!logger.is_object()) {
      throw runtime_error("ConfigValidator: Logger entry must be an object");
    }

    if (!logger.contains("type") || !logger["type"].is_string()) {
      throw runtime_error("ConfigValidator: Logger missing type field");
    }

    const string type = logger["type"].get<string>();
    if (find(valid_types.begin(), valid_types.end(), type) ==
        valid_types.end()) {
      throw runtime_error("ConfigValidator: Invalid logger type: " + type);
    }

    if (logger.contains("level")) {
      if (!logger["level"].is_string() ||
          find(valid_levels.begin(), valid_levels.end(),
               logger["level"].get<string>()) == valid_levels.end()) {
        throw runtime_error("ConfigValidator: Invalid log level for " + type);
      }
    }

    if (type == "sync_file" &&
        (!logger.contains("file") || !logger["file"].is_string())) {
      throw runtime_error("ConfigValidator: File logger missing file path");
    }

    if (logger.contains("max_size_mb") &&
        !logger["max_size_mb"].is_number_unsigned()) {
      throw runtime_error(
          "ConfigValidator: max_size_mb must be a non-negative integer");
    }
  }
  return true;
}
