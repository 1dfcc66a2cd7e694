/**
 * @file documentprocessor.hpp
 * @brief Обработка одного документа: выбор шаблона, извлечение, дубликаты
 *
 * @details
 * DocumentProcessor берёт снимок TemplateRegistry на каждый документ,
 * поэтому перезагрузка шаблонов во время обработки не затрагивает
 * документ, который уже начал обрабатываться. Настройки движка
 * заменяются атомарно через updateSettings().
 *
 * Счётчики MetricsCollector: documents_total, documents_matched,
 * documents_unmatched, documents_incomplete, documents_failed,
 * duplicates_detected; summary extraction.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../include/duplicateindex.hpp"
#include "../include/engine_settings.hpp"
#include "ifx/DuplicateFingerprinter.hpp"
#include "ifx/ExtractionEngine.hpp"
#include "ifx/TemplateMatcher.hpp"
#include "ifx/TemplateRegistry.hpp"

/// Итог обработки документа
struct DocumentReport {
  std::string source;
  std::uint64_t storeGeneration = 0;
  std::optional<ifx::MatchCandidate> match;   ///< nullopt: ни один шаблон
  std::vector<ifx::MatchCandidate> candidates;  ///< Заполняется при explain
  std::optional<ifx::ExtractionResult> result;
  std::optional<ifx::DuplicateKey> fingerprint;  ///< nullopt: неполный ключ
  std::optional<std::string> duplicateOf;  ///< Первый документ с тем же ключом
  std::string error;  ///< Ошибка чтения или пустой документ

  bool failed() const { return !error.empty(); }
};

class DocumentProcessor {
 public:
  /**
   * @throw std::invalid_argument При некорректных весах в settings
   */
  DocumentProcessor(EngineSettings settings, ifx::TemplateRegistry &registry);

  /// Заменить настройки (после перезагрузки конфигурации)
  void updateSettings(EngineSettings settings);

  /**
   * @brief Обработать текст документа
   * @param source Имя документа в отчёте и индексе дубликатов
   * @param text Нормализованный текст
   * @param localeHint Локаль документа; по умолчанию локаль конфигурации
   * @param explain Заполнить DocumentReport::candidates
   * @throw std::runtime_error Если шаблоны ещё не загружены
   */
  DocumentReport process(const std::string &source, const std::string &text,
                         const std::optional<std::string> &localeHint,
                         bool explain = false);

  /// Прочитать файл и обработать его; ошибка чтения попадает в отчёт
  DocumentReport processFile(const std::string &path,
                             const std::optional<std::string> &localeHint,
                             bool explain = false);

  const DuplicateIndex &duplicates() const { return duplicates_; }

 private:
  struct Engine {
    explicit Engine(EngineSettings s);

    EngineSettings settings;
    ifx::TemplateMatcher matcher;
    ifx::ExtractionEngine extractor;
    ifx::DuplicateFingerprinter fingerprinter;
  };

  std::shared_ptr<const Engine> engine() const;

  std::shared_ptr<const Engine> engine_;
  ifx::TemplateRegistry &registry_;
  DuplicateIndex duplicates_;
};
