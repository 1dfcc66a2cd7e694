#include "../include/documentprocessor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "ifx/MetricsCollector.hpp"
#include "ifx/compositelogger.hpp"

namespace {

void registerCounters() {
  auto &metrics = ifx::MetricsCollector::instance();
  metrics.ensureCounter("documents_total", "Documents submitted for extraction");
  metrics.ensureCounter("documents_matched", "Documents with a selected template");
  metrics.ensureCounter("documents_unmatched", "Documents without any template");
  metrics.ensureCounter("documents_incomplete",
                        "Documents missing a required field");
  metrics.ensureCounter("documents_failed", "Unreadable or empty documents");
  metrics.ensureCounter("duplicates_detected",
                        "Documents whose duplicate key was already seen");
}

bool isBlank(const std::string &text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

}  // namespace

DocumentProcessor::Engine::Engine(EngineSettings s)
    : settings(std::move(s)),
      matcher(settings.weights),
      extractor(settings.policy),
      fingerprinter(settings.fingerprint) {}

DocumentProcessor::DocumentProcessor(EngineSettings settings,
                                     ifx::TemplateRegistry &registry)
    : engine_(std::make_shared<const Engine>(std::move(settings))),
      registry_(registry) {
  registerCounters();
}

void DocumentProcessor::updateSettings(EngineSettings settings) {
  auto next = std::make_shared<const Engine>(std::move(settings));
  std::atomic_store(&engine_, std::move(next));
}

std::shared_ptr<const DocumentProcessor::Engine> DocumentProcessor::engine()
    const {
  return std::atomic_load(&engine_);
}

DocumentReport DocumentProcessor::process(
    const std::string &source, const std::string &text,
    const std::optional<std::string> &localeHint, bool explain) {
  auto &metrics = ifx::MetricsCollector::instance();
  auto &logger = ifx::CompositeLogger::instance();

  auto store = registry_.snapshot();
  if (!store) {
    throw std::runtime_error("DocumentProcessor: no templates loaded");
  }
  auto current = engine();

  DocumentReport report;
  report.source = source;
  report.storeGeneration = store->generation();
  metrics.incrementCounter("documents_total");

  if (isBlank(text)) {
    report.error = "Document text is empty";
    metrics.incrementCounter("documents_failed");
    logger.warning("DocumentProcessor: " + source + ": " + report.error);
    return report;
  }

  const auto locale = current->settings.effectiveLocale(localeHint);
  if (explain) {
    report.candidates = current->matcher.rank(text, locale, *store);
  }
  report.match = current->matcher.match(text, locale, *store);
  if (!report.match) {
    metrics.incrementCounter("documents_unmatched");
    logger.info("DocumentProcessor: " + source + ": no template matched");
    return report;
  }
  metrics.incrementCounter("documents_matched");

  const auto started = std::chrono::steady_clock::now();
  try {
    report.result = current->extractor.extract(text, *report.match->tpl);
  } catch (const ifx::EmptyDocumentError &e) {
    report.error = e.what();
    metrics.incrementCounter("documents_failed");
    return report;
  }
  metrics.recordTaskTime(
      "extraction", std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - started));

  if (!report.result->complete) {
    metrics.incrementCounter("documents_incomplete");
    logger.info("DocumentProcessor: " + source + ": incomplete extraction with " +
                report.match->templateId);
  }

  report.fingerprint = current->fingerprinter.fingerprint(*report.result);
  if (report.fingerprint) {
    report.duplicateOf = duplicates_.record(*report.fingerprint, source);
    if (report.duplicateOf) {
      metrics.incrementCounter("duplicates_detected");
      logger.warning("DocumentProcessor: " + source + " duplicates " +
                     *report.duplicateOf + " (" + report.fingerprint->value +
                     ")");
    }
  }

  logger.debug("DocumentProcessor: " + source + " -> " +
               report.match->templateId + " score " +
               std::to_string(report.match->score));
  return report;
}

DocumentReport DocumentProcessor::processFile(
    const std::string &path, const std::optional<std::string> &localeHint,
    bool explain) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    DocumentReport report;
    report.source = path;
    report.error = "cannot open document";
    ifx::MetricsCollector::instance().incrementCounter("documents_total");
    ifx::MetricsCollector::instance().incrementCounter("documents_failed");
    ifx::CompositeLogger::instance().error("DocumentProcessor: cannot open " +
                                           path);
    return report;
  }

  std::ostringstream content;
  content << file.rdbuf();
  return process(path, content.str(), localeHint, explain);
}
