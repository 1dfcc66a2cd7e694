/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 */

#include "../include/service_controller.hpp"

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>
#include <system_error>

#include "../include/config_reload_transaction.hpp"
#include "../include/resultserializer.hpp"
#include "ifx/Errors.hpp"
#include "ifx/MetricsCollector.hpp"
#include "ifx/SignalRouter.hpp"
#include "ifx/TemplateRegistry.hpp"
#include "ifx/compositelogger.hpp"
#include "ifx/consolelogger.hpp"
#include "ifx/syncfilelogger.hpp"

namespace {

template <typename Logger>
std::shared_ptr<ifx::ILogger> singletonPtr(Logger &singleton) {
  return std::shared_ptr<ifx::ILogger>(&singleton, [](ifx::ILogger *) {});
}

// Ошибки до настройки логирования должны быть видны пользователю
void ensureFallbackLogger() {
  auto &composite = ifx::CompositeLogger::instance();
  if (composite.size() == 0) {
    composite.addLogger(singletonPtr(ifx::ConsoleLogger::instance()));
  }
}

std::string trim(const std::string &line) {
  const auto first = line.find_first_not_of(" \t\r");
  if (first == std::string::npos) return {};
  const auto last = line.find_last_not_of(" \t\r");
  return line.substr(first, last - first + 1);
}

}  // namespace

int ServiceController::run(int argc, char **argv) {
  ParsedArgs args;
  try {
    ArgumentParser parser;
    args = parser.parse(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\nTry --help for usage.\n";
    return EXIT_FAILURE;
  }

  if (args.help_message) {
    printHelp();
    return EXIT_SUCCESS;
  }
  if (args.version_message) {
    printVersion();
    return EXIT_SUCCESS;
  }

  auto &metrics = ifx::MetricsCollector::instance();
  metrics.ensureCounter("template_reloads", "Successful template store swaps");
  metrics.ensureCounter("template_load_errors",
                        "Template documents rejected while loading");

  try {
    ConfigManager::instance().initialize(args.config_path);
    if (!args.overrides.empty()) {
      ConfigManager::instance().applyCliOverrides(args.overrides);
    }
    initLogger(args);

    EngineSettings settings = EngineSettings::fromConfig(
        ConfigManager::instance().getMergedConfig(args.environment));
    ifx::LoadReport report = loadTemplates(settings);

    processor_ = std::make_unique<DocumentProcessor>(
        std::move(settings), ifx::TemplateRegistry::instance());

    if (args.documents.empty() && !args.stdin_mode) {
      std::cout << ResultSerializer::dump(ResultSerializer::toJson(report), 2)
                << std::endl;
    }

    for (const auto &path : args.documents) {
      processDocument(path, args);
    }

    if (args.stdin_mode) {
      initialize(args);
      ifx::SignalRouter::instance().start();
      ifx::CompositeLogger::instance().info(
          "SignalRouter started, reading document paths from stdin");
      try {
        mainLoop(args);
      } catch (...) {
        ifx::SignalRouter::instance().stop();
        throw;
      }
      ifx::SignalRouter::instance().stop();
    }

    if (args.metrics) {
      std::cout << metrics.exportPrometheus() << std::flush;
    }
    ifx::CompositeLogger::instance().flush();
    return EXIT_SUCCESS;
  } catch (const ifx::StoreEmptyError &e) {
    ensureFallbackLogger();
    for (const auto &error : e.errors()) {
      ifx::CompositeLogger::instance().error(error.path + ": " + error.reason);
    }
    ifx::CompositeLogger::instance().critical(e.what());
  } catch (const std::exception &e) {
    ensureFallbackLogger();
    ifx::CompositeLogger::instance().critical(e.what());
  }

  ifx::CompositeLogger::instance().flush();
  return EXIT_FAILURE;
}

void ServiceController::initialize(const ParsedArgs &args) {
  auto &router = ifx::SignalRouter::instance();
  ifx::CompositeLogger::instance().debug(
      "Service controller: Registering signal handlers ...");

  router.registerHandler(SIGTERM, [this](int sig_num) {
    ifx::CompositeLogger::instance().info("SIGTERM received (signal " +
                                          std::to_string(sig_num) +
                                          "), shutting down");
    handleShutdown();
  });
  router.registerHandler(SIGINT, [this](int sig_num) {
    ifx::CompositeLogger::instance().info("SIGINT received (signal " +
                                          std::to_string(sig_num) +
                                          "), shutting down");
    handleShutdown();
  });

  // Копия аргументов: обработчик живёт в потоке SignalRouter
  router.registerHandler(SIGHUP, [this, args](int) {
    ifx::CompositeLogger::instance().info(
        "SIGHUP received, reloading configuration and templates");
    reloadTemplates(args);
  });
}

void ServiceController::initLogger(const ParsedArgs &args) {
  auto &composite_logger = ifx::CompositeLogger::instance();
  composite_logger.clear();

  if (!args.logger_types.empty()) {
    for (const auto &type : args.logger_types) {
      if (type == "console") {
        composite_logger.addLogger(singletonPtr(ifx::ConsoleLogger::instance()));
      } else if (type == "sync_file") {
        auto &logger = ifx::SyncFileLogger::instance();
        logger.setMainLogPath("ifx.log");
        composite_logger.addLogger(singletonPtr(logger));
      }
    }
  } else {
    auto config = ConfigManager::instance().getMergedConfig(args.environment);
    if (config.contains("logging") && config["logging"].is_array()) {
      for (auto &entry : config["logging"]) {
        std::string type = entry.value("type", "console");
        std::string level = entry.value("level", "info");

        if (type == "console") {
          auto &logger = ifx::ConsoleLogger::instance();
          logger.setLogLevel(ifx::stringToLogLevel(level));
          composite_logger.addLogger(singletonPtr(logger));
        } else if (type == "sync_file") {
          auto &logger = ifx::SyncFileLogger::instance();
          logger.setMainLogPath(entry.value("file", "ifx.log"));
          if (entry.contains("fallback_file")) {
            logger.setFallbackLogPath(entry["fallback_file"].get<std::string>());
          }
          if (entry.contains("max_size_mb")) {
            ifx::RotationConfig rotation;
            rotation.enabled = true;
            rotation.maxFileSizeBytes =
                entry["max_size_mb"].get<std::size_t>() * 1024 * 1024;
            logger.setRotationConfig(rotation);
          }
          logger.setLogLevel(ifx::stringToLogLevel(level));
          composite_logger.addLogger(singletonPtr(logger));
        }
      }
    }
  }

  if (composite_logger.size() == 0) {
    composite_logger.addLogger(singletonPtr(ifx::ConsoleLogger::instance()));
  }

  if (args.log_level.has_value()) {
    composite_logger.setLogLevel(ifx::stringToLogLevel(args.log_level.value()));
  }
}

ifx::LoadReport ServiceController::loadTemplates(
    const EngineSettings &settings) {
  auto &metrics = ifx::MetricsCollector::instance();
  try {
    ifx::LoadReport report =
        ifx::TemplateRegistry::instance().reload(settings.templateSources);
    metrics.incrementCounter("template_reloads");
    metrics.incrementCounter("template_load_errors", report.errors.size());
    logLoadReport(report);
    return report;
  } catch (const ifx::StoreEmptyError &e) {
    metrics.incrementCounter("template_load_errors", e.errors().size());
    throw;
  }
}

void ServiceController::reloadTemplates(const ParsedArgs &args) {
  auto &metrics = ifx::MetricsCollector::instance();
  try {
    ConfigReloadTransaction tx(ConfigManager::instance(), args.environment,
                               ifx::TemplateRegistry::instance());
    ReloadOutcome outcome = tx.reload();

    metrics.incrementCounter("template_reloads");
    metrics.incrementCounter("template_load_errors",
                             outcome.report.errors.size());
    logLoadReport(outcome.report);

    if (processor_) {
      processor_->updateSettings(std::move(outcome.settings));
    }
  } catch (const ifx::StoreEmptyError &e) {
    metrics.incrementCounter("template_load_errors", e.errors().size());
    ifx::CompositeLogger::instance().error(
        std::string("SIGHUP: reload failed, previous templates stay active: ") +
        e.what());
  } catch (const std::exception &e) {
    ifx::CompositeLogger::instance().error(
        std::string("SIGHUP: reload failed, previous templates stay active: ") +
        e.what());
  }
}

void ServiceController::logLoadReport(const ifx::LoadReport &report) {
  auto &logger = ifx::CompositeLogger::instance();
  for (const auto &error : report.errors) {
    logger.warning("Template rejected: " + error.path + ": " + error.reason);
  }
  logger.info("Templates loaded: " + std::to_string(report.store->size()) +
              " active, " + std::to_string(report.errors.size()) +
              " rejected, generation " +
              std::to_string(report.store->generation()));
}

void ServiceController::mainLoop(const ParsedArgs &args) {
  ifx::CompositeLogger::instance().info(
      "Service controller: Service main loop started");

  std::string pending;
  char buffer[4096];
  bool eof = false;

  while (!eof && !shutdown_requested_.load(std::memory_order_acquire)) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, 500);
    if (ready < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "poll(stdin)");
    }
    if (ready == 0) continue;

    const ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      throw std::system_error(errno, std::generic_category(), "read(stdin)");
    }
    if (n == 0) {
      eof = true;
    } else {
      pending.append(buffer, static_cast<std::size_t>(n));
    }

    std::size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      const std::string path = trim(pending.substr(0, newline));
      pending.erase(0, newline + 1);
      if (!path.empty()) processDocument(path, args);
      if (shutdown_requested_.load(std::memory_order_acquire)) break;
    }
  }

  if (eof && !shutdown_requested_.load(std::memory_order_acquire)) {
    const std::string path = trim(pending);
    if (!path.empty()) processDocument(path, args);
  }

  ifx::CompositeLogger::instance().info(
      "Service controller: Service main loop ended");
}

void ServiceController::processDocument(const std::string &path,
                                        const ParsedArgs &args) {
  DocumentReport report;
  try {
    report = processor_->processFile(path, args.locale, args.explain);
  } catch (const std::exception &e) {
    report = DocumentReport{};
    report.source = path;
    report.error = e.what();
    ifx::CompositeLogger::instance().error("Service controller: " + path +
                                           ": " + e.what());
  }
  std::cout << ResultSerializer::toLine(report) << std::endl;
}

void ServiceController::handleShutdown() {
  shutdown_requested_.store(true, std::memory_order_release);
}

void ServiceController::printHelp() { std::cout << ArgumentParser::helpText(); }

void ServiceController::printVersion() {
  std::cout << "ifx-extract v1.0.0\n";
}
