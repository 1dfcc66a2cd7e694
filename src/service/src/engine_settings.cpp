#include "../include/engine_settings.hpp"

#include <stdexcept>

namespace {

std::string requireString(const nlohmann::json &node, const std::string &key,
                          const std::string &section) {
  const auto &value = node.at(key);
  if (!value.is_string()) {
    throw std::runtime_error("EngineSettings: " + section + "." + key +
                             " must be a string");
  }
  return value.get<std::string>();
}

}  // namespace

EngineSettings EngineSettings::fromConfig(const nlohmann::json &merged) {
  EngineSettings settings;

  if (!merged.is_object()) {
    throw std::runtime_error("EngineSettings: configuration must be an object");
  }

  try {
    settings.locale = merged.value("locale", std::string());

    if (!merged.contains("template_sources") ||
        !merged["template_sources"].is_array()) {
      throw std::runtime_error("EngineSettings: template_sources is required");
    }
    for (const auto &entry : merged["template_sources"]) {
      ifx::TemplateSource source;
      source.path = requireString(entry, "path", "template_sources");
      source.locale = entry.value("locale", std::string());
      source.optional = entry.value("optional", false);
      settings.templateSources.push_back(std::move(source));
    }

    if (merged.contains("scoring")) {
      const auto &scoring = merged["scoring"];
      auto &w = settings.weights;
      w.keywordWeight = scoring.value("keyword_weight", w.keywordWeight);
      w.fiscalIdWeight = scoring.value("fiscal_id_weight", w.fiscalIdWeight);
      w.priorityWeight = scoring.value("priority_weight", w.priorityWeight);
      w.minScore = scoring.value("min_score", w.minScore);
    }

    if (merged.contains("validation")) {
      const auto &validation = merged["validation"];
      auto &p = settings.policy;
      p.earliestYear = validation.value("earliest_year", p.earliestYear);
      p.maxYearsAhead = validation.value("max_years_ahead", p.maxYearsAhead);
      if (validation.contains("amount_ceiling")) {
        const std::string text =
            requireString(validation, "amount_ceiling", "validation");
        auto ceiling = ifx::Amount::parse(text, ifx::DecimalConvention::Dot);
        if (!ceiling) {
          throw std::runtime_error("EngineSettings: invalid amount_ceiling: " +
                                   text);
        }
        p.amountCeiling = *ceiling;
      }
    }

    if (merged.contains("fingerprint")) {
      const auto &fp = merged["fingerprint"];
      auto &f = settings.fingerprint;
      f.fiscalId = fp.value("fiscal_id", f.fiscalId);
      f.documentNumber = fp.value("document_number", f.documentNumber);
      f.documentDate = fp.value("document_date", f.documentDate);
      f.grossAmount = fp.value("gross_amount", f.grossAmount);
    }
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("EngineSettings: ") + e.what());
  }

  try {
    ifx::validateWeights(settings.weights);
  } catch (const std::invalid_argument &e) {
    throw std::runtime_error(std::string("EngineSettings: ") + e.what());
  }

  return settings;
}

std::optional<std::string> EngineSettings::effectiveLocale(
    const std::optional<std::string> &hint) const {
  if (hint && !hint->empty()) return hint;
  if (!locale.empty()) return locale;
  return std::nullopt;
}
