#include "ifx/TemplateMatcher.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "ifx/ValueCoercion.hpp"
#include "ifx/compositelogger.hpp"

namespace ifx {

namespace {

/// Текст без пробелов и дефисов в верхнем регистре для поиска налогового номера
std::string compactForFiscalSearch(const std::string& text) {
  std::string compact;
  compact.reserve(text.size());
  for (char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc) || c == '-') continue;
    compact.push_back(static_cast<char>(std::toupper(uc)));
  }
  return compact;
}

bool isDigitAt(const std::string& text, std::size_t pos) {
  return pos < text.size() &&
         std::isdigit(static_cast<unsigned char>(text[pos]));
}

/// Поиск номера, не являющегося частью более длинной последовательности цифр
bool containsFiscalId(const std::string& compact, const std::string& fiscalId) {
  const bool digitFront = isDigitAt(fiscalId, 0);
  const bool digitBack = isDigitAt(fiscalId, fiscalId.size() - 1);
  for (std::size_t pos = compact.find(fiscalId); pos != std::string::npos;
       pos = compact.find(fiscalId, pos + 1)) {
    const bool boundedLeft = !digitFront || pos == 0 || !isDigitAt(compact, pos - 1);
    const bool boundedRight =
        !digitBack || !isDigitAt(compact, pos + fiscalId.size());
    if (boundedLeft && boundedRight) return true;
  }
  return false;
}

bool betterCandidate(const MatchCandidate& a, const MatchCandidate& b) {
  if (a.score != b.score) return a.score > b.score;
  if (a.tpl->priority != b.tpl->priority) {
    return a.tpl->priority > b.tpl->priority;
  }
  return a.templateId < b.templateId;
}

}  // namespace

void validateWeights(const ScoringWeights& weights) {
  if (weights.priorityWeight < 0) {
    throw std::invalid_argument("priority_weight must not be negative");
  }
  if (weights.keywordWeight <= weights.priorityWeight * 100) {
    throw std::invalid_argument(
        "keyword_weight must exceed priority_weight * 100");
  }
  if (weights.fiscalIdWeight <= weights.keywordWeight) {
    throw std::invalid_argument("fiscal_id_weight must exceed keyword_weight");
  }
}

TemplateMatcher::TemplateMatcher(ScoringWeights weights) : weights_(weights) {
  validateWeights(weights_);
}

std::optional<MatchCandidate> TemplateMatcher::evaluate(
    const std::shared_ptr<const Template>& tpl, const std::string& lowered,
    const std::string& compact) const {
  const auto& issuer = tpl->issuer;

  for (const auto& excluded : issuer.excludeKeywords) {
    if (lowered.find(toLowerAscii(excluded)) != std::string::npos) {
      CompositeLogger::instance().debug("Template '" + tpl->id +
                                        "' excluded by keyword '" + excluded +
                                        "'");
      return std::nullopt;
    }
  }

  MatchCandidate candidate;
  candidate.templateId = tpl->id;
  candidate.tpl = tpl;

  for (const auto& keyword : issuer.keywords) {
    if (lowered.find(toLowerAscii(keyword)) != std::string::npos) {
      candidate.matchedKeywords.push_back(keyword);
    }
  }
  candidate.matchedFiscalId =
      !issuer.fiscalId.empty() && containsFiscalId(compact, issuer.fiscalId);

  if (!tpl->isGeneric() && candidate.matchedKeywords.empty() &&
      !candidate.matchedFiscalId) {
    return std::nullopt;
  }

  candidate.score =
      weights_.keywordWeight *
          static_cast<std::int64_t>(candidate.matchedKeywords.size()) +
      (candidate.matchedFiscalId ? weights_.fiscalIdWeight : 0) +
      weights_.priorityWeight * tpl->priority;

  if (candidate.score <= weights_.minScore) return std::nullopt;
  return candidate;
}

std::vector<MatchCandidate> TemplateMatcher::rank(
    const std::string& text, const std::optional<std::string>& localeHint,
    const TemplateStore& store) const {
  const std::string lowered = normalizeText(toLowerAscii(text));
  const std::string compact = compactForFiscalSearch(text);

  std::vector<MatchCandidate> candidates;
  for (const auto& tpl : store.candidatesFor(localeHint)) {
    if (auto candidate = evaluate(tpl, lowered, compact)) {
      CompositeLogger::instance().debug(
          "Candidate '" + candidate->templateId +
          "' score=" + std::to_string(candidate->score) +
          " keywords=" + std::to_string(candidate->matchedKeywords.size()) +
          " fiscal_id=" + (candidate->matchedFiscalId ? "yes" : "no"));
      candidates.push_back(std::move(*candidate));
    }
  }

  std::sort(candidates.begin(), candidates.end(), betterCandidate);
  return candidates;
}

std::optional<MatchCandidate> TemplateMatcher::match(
    const std::string& text, const std::optional<std::string>& localeHint,
    const TemplateStore& store) const {
  auto candidates = rank(text, localeHint, store);
  if (candidates.empty()) {
    CompositeLogger::instance().info(
        "No template matched" +
        (localeHint ? " for locale '" + *localeHint + "'" : std::string()));
    return std::nullopt;
  }
  CompositeLogger::instance().debug("Selected template '" +
                                    candidates.front().templateId + "'");
  return std::move(candidates.front());
}

}  // namespace ifx
