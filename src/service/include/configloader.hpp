/**
 * @file configloader.hpp
 * @brief Загрузчик конфигурации ifx-extract из JSON-файла
 *
 * @details
 * Читает файл конфигурации целиком и разбирает его через nlohmann/json.
 * Запоминает путь к последнему прочитанному файлу, чтобы ConfigManager
 * мог перечитать его по SIGHUP.
 *
 * @see ConfigManager, ConfigCache
 */

#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @defgroup Configuration Компоненты управления конфигурацией
 */

/**
 * @class ConfigLoader
 * @brief Чтение конфигурации из файла
 * @ingroup Configuration
 *
 * @code
 * ConfigLoader loader;
 * nlohmann::json cfg = loader.loadFromFile("config/config.json");
 * @endcode
 */
class ConfigLoader {
 public:
  /**
   * @brief Загрузить конфигурацию и запомнить путь к файлу
   * @param filename Путь к JSON-файлу
   * @return Разобранный документ
   * @throw std::runtime_error Файл не открывается, пуст или не является
   * JSON-объектом
   */
  nlohmann::json loadFromFile(const std::string &filename);

  /**
   * @brief Перечитать ранее загруженный файл
   * @throw std::runtime_error Если файл ещё не загружался или ошибка чтения
   */
  nlohmann::json reload() const;

  std::string getLastLoadedFile() const;
  bool hasLoadedFile() const;

 private:
  nlohmann::json readFileContents(const std::string &filename) const;

  std::string lastLoadedFile_;
};
