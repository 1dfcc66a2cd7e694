#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @struct ParsedArgs
 * @brief Результат разбора командной строки ifx-extract
 */
struct ParsedArgs {
  std::string config_path = "config/config.json";
  std::string environment = "production";
  std::optional<std::string> locale;  ///< Подсказка локали для всех документов
  std::unordered_map<std::string, std::string> overrides;
  std::vector<std::string> logger_types;
  std::optional<std::string> log_level;
  bool use_cli_logging = false;
  bool explain = false;      ///< Выводить ранжированный список кандидатов
  bool metrics = false;      ///< Печатать метрики Prometheus после обработки
  bool stdin_mode = false;   ///< Читать пути документов из stdin до EOF
  bool help_message = false;
  bool version_message = false;
  std::vector<std::string> documents;  ///< Позиционные пути к текстам
};

/**
 * @class ArgumentParser
 * @brief Разбор аргументов в стиле `--option=value` и `--option value`
 *
 * @throw std::invalid_argument Неизвестный флаг, отсутствующее или
 * недопустимое значение
 */
class ArgumentParser {
 public:
  ParsedArgs parse(int argc, char **argv);

  static std::string helpText();

 private:
  static const std::vector<std::string> validLogLevels;
  static const std::vector<std::string> validLogTypes;

  std::string optionValue(const std::string &arg, const std::string &name,
                          int &i, int argc, char **argv) const;
  void parseOverride(const std::string &arg, ParsedArgs &args);
  void parseLogType(const std::string &value, ParsedArgs &args);
  void parseLogLevel(const std::string &value, ParsedArgs &args);
  void validateLogTypes(const std::vector<std::string> &types);
};
