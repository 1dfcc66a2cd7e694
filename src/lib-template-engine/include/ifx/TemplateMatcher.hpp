/**
 * @file TemplateMatcher.hpp
 * @brief Выбор шаблона для документа по признакам эмитента
 *
 * @details Оценка кандидата:
 * @code
 * score = Wk * (найдено ключевых слов) + Wf * (найден налоговый номер) + Wp * priority
 * @endcode
 * Порядок весов Wf > Wk > Wp * 100 гарантирует, что совпадение налогового
 * номера важнее ключевых слов, а любое свидетельство об эмитенте важнее
 * приоритета. Шаблон эмитента без единого свидетельства не участвует,
 * поэтому общие шаблоны служат только запасным вариантом.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ifx/TemplateStore.hpp"

namespace ifx {

struct ScoringWeights {
  std::int64_t keywordWeight = 200;
  std::int64_t fiscalIdWeight = 2000;
  std::int64_t priorityWeight = 1;
  std::int64_t minScore = 0;  ///< Кандидаты с score <= minScore отбрасываются
};

/**
 * @brief Проверить порядок весов
 * @throw std::invalid_argument Если нарушено Wf > Wk > Wp * 100 или Wp < 0
 */
void validateWeights(const ScoringWeights& weights);

struct MatchCandidate {
  std::string templateId;
  std::int64_t score = 0;
  std::vector<std::string> matchedKeywords;
  bool matchedFiscalId = false;
  std::shared_ptr<const Template> tpl;
};

class TemplateMatcher {
 public:
  /// @throw std::invalid_argument При некорректных весах
  explicit TemplateMatcher(ScoringWeights weights = {});

  /**
   * @brief Выбрать лучший шаблон
   * @param text Нормализованный текст документа
   * @param localeHint Локаль документа, если известна
   * @return Победитель или nullopt (NoMatch: ни один кандидат не прошёл порог)
   *
   * @note Детерминирован: при равном score выигрывает больший priority,
   * затем меньший id
   */
  std::optional<MatchCandidate> match(const std::string& text,
                                      const std::optional<std::string>& localeHint,
                                      const TemplateStore& store) const;

  /// Все прошедшие порог кандидаты в порядке выбора
  std::vector<MatchCandidate> rank(const std::string& text,
                                   const std::optional<std::string>& localeHint,
                                   const TemplateStore& store) const;

  const ScoringWeights& weights() const noexcept { return weights_; }

 private:
  std::optional<MatchCandidate> evaluate(
      const std::shared_ptr<const Template>& tpl, const std::string& lowered,
      const std::string& compact) const;

  ScoringWeights weights_;
};

}  // namespace ifx
