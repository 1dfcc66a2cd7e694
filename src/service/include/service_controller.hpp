/**
 * @file service_controller.hpp
 * @brief Жизненный цикл ifx-extract
 *
 * @details
 * ServiceController объединяет разбор аргументов, загрузку конфигурации,
 * настройку логирования, загрузку шаблонов и обработку документов.
 * В режиме `--stdin` читает пути документов построчно до EOF, а SIGHUP
 * (через ifx::SignalRouter) запускает ConfigReloadTransaction.
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "../include/argumentparser.hpp"
#include "../include/configmanager.hpp"
#include "../include/documentprocessor.hpp"
#include "../include/engine_settings.hpp"

/**
 * @class ServiceController
 * @brief Управляет запуском, конфигурацией и жизненным циклом сервиса
 *
 * @see ArgumentParser, ConfigManager, DocumentProcessor
 */
class ServiceController {
 public:
  /**
   * @brief Основная точка входа
   *
   * @param[in] argc Количество аргументов командной строки
   * @param[in] argv Массив аргументов
   * @return EXIT_SUCCESS, либо EXIT_FAILURE при ошибке аргументов,
   * конфигурации или пустом наборе шаблонов
   *
   * @details
   *  - Без документов и без `--stdin` печатает отчёт о загрузке шаблонов
   *  - Результат каждого документа выводится одной JSON-строкой в stdout
   *  - Журнал пишется в stderr и/или файл
   *
   * @code
   int main(int argc, char** argv) {
       ServiceController svc;
       return svc.run(argc, argv);
   }
   @endcode
   */
  int run(int argc, char **argv);

 private:
  /// Регистрирует SIGTERM, SIGINT (остановка) и SIGHUP (перезагрузка)
  void initialize(const ParsedArgs &args);

  /**
   * @brief Инициализирует логи по конфигу или CLI
   *
   * @details
   *  - При `--log-type` создаёт логгеры из CLI
   *  - Иначе читает секцию "logging" объединённой конфигурации
   *  - `--log-level` имеет приоритет над уровнями из конфигурации
   */
  void initLogger(const ParsedArgs &args);

  /// Первичная загрузка шаблонов в TemplateRegistry
  ifx::LoadReport loadTemplates(const EngineSettings &settings);

  /// Обработчик SIGHUP
  void reloadTemplates(const ParsedArgs &args);

  void logLoadReport(const ifx::LoadReport &report);

  /**
   * @brief Чтение путей документов из stdin
   *
   * @details Ожидание ввода через poll() с таймаутом 500 мс, чтобы
   * остановка по SIGTERM/SIGINT не ждала следующей строки.
   */
  void mainLoop(const ParsedArgs &args);

  void processDocument(const std::string &path, const ParsedArgs &args);

  /// Обработчик SIGTERM и SIGINT
  void handleShutdown();

  void printHelp();
  void printVersion();

  std::unique_ptr<DocumentProcessor> processor_;
  std::atomic<bool> shutdown_requested_{false};
};
