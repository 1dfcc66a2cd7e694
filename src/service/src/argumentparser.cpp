/**
 * @file argumentparser.cpp
 * @brief Реализация парсера аргументов командной строки
 */

#include "../include/argumentparser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

using namespace std;

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

const vector<string> ArgumentParser::validLogTypes = {"console", "sync_file"};

namespace {

bool matchesOption(const string &arg, const string &name) {
  return arg == name || arg.compare(0, name.size() + 1, name + "=") == 0;
}

}  // namespace

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;
  bool positionalOnly = false;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (positionalOnly || arg.empty() || arg[0] != '-') {
      args.documents.push_back(arg);
    } else if (arg == "--") {
      positionalOnly = true;
    } else if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--version" || arg == "-v") {
      args.version_message = true;
    } else if (arg == "--explain") {
      args.explain = true;
    } else if (arg == "--metrics") {
      args.metrics = true;
    } else if (arg == "--stdin") {
      args.stdin_mode = true;
    } else if (matchesOption(arg, "--override")) {
      parseOverride(arg, args);
    } else if (matchesOption(arg, "--log-type")) {
      parseLogType(optionValue(arg, "--log-type", i, argc, argv), args);
    } else if (matchesOption(arg, "--log-level")) {
      parseLogLevel(optionValue(arg, "--log-level", i, argc, argv), args);
    } else if (matchesOption(arg, "--config-file")) {
      args.config_path = optionValue(arg, "--config-file", i, argc, argv);
    } else if (matchesOption(arg, "--environment")) {
      args.environment = optionValue(arg, "--environment", i, argc, argv);
    } else if (matchesOption(arg, "--locale")) {
      string locale = optionValue(arg, "--locale", i, argc, argv);
      transform(locale.begin(), locale.end(), locale.begin(),
                [](unsigned char c) { return static_cast<char>(tolower(c)); });
      args.locale = locale;
    } else {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    }
  }

  validateLogTypes(args.logger_types);
  return args;
}

string ArgumentParser::optionValue(const string &arg, const string &name,
                                   int &i, int argc, char **argv) const {
  string value;
  size_t eqPos = arg.find('=');
  if (eqPos != string::npos) {
    value = arg.substr(eqPos + 1);
  } else if (i + 1 < argc) {
    value = argv[++i];
  } else {
    throw invalid_argument("ArgumentParser: " + name + " requires a value");
  }

  if (value.empty()) {
    throw invalid_argument("ArgumentParser: " + name + " requires a value");
  }
  return value;
}

void ArgumentParser::parseOverride(const string &arg, ParsedArgs &args) {
  size_t eqPos = arg.find('=');
  if (eqPos == string::npos) {
    throw invalid_argument(
        "ArgumentParser: Invalid override format. Use --override=key:value");
  }

  string overrideStr = arg.substr(eqPos + 1);
  size_t colonPos = overrideStr.find(':');
  if (colonPos == string::npos || colonPos == 0) {
    throw invalid_argument(
        "ArgumentParser: Invalid override format. Use key:value");
  }

  string key = overrideStr.substr(0, colonPos);
  string value = overrideStr.substr(colonPos + 1);
  args.overrides[key] = value;
}

void ArgumentParser::parseLogType(const string &value, ParsedArgs &args) {
  stringstream ss(value);
  string type;
  while (getline(ss, type, ',')) {
    if (!type.empty()) {
      args.logger_types.push_back(type);
    }
  }
  args.use_cli_logging = true;
}

void ArgumentParser::parseLogLevel(const string &value, ParsedArgs &args) {
  if (find(validLogLevels.begin(), validLogLevels.end(), value) ==
      validLogLevels.end()) {
    throw invalid_argument("ArgumentParser: Invalid log level: " + value);
  }

  args.log_level = value;
  args.use_cli_logging = true;
}

void ArgumentParser::validateLogTypes(const vector<string> &types) {
  for (const auto &type : types) {
    if (find(validLogTypes.begin(), validLogTypes.end(), type) ==
        validLogTypes.end()) {
      throw invalid_argument("ArgumentParser: Invalid logger type: " + type);
    }
  }
}

string ArgumentParser::helpText() {
  return "Invoice field extractor\n\n"
         "Usage:\n"
         " ifx-extract [options] [document.txt ...]\n\n"
         "Options:\n"
         " --help, -h            Show this help message\n"
         " --version, -v         Show version info\n"
         " --config-file=FILE    Configuration file path\n"
         " --environment=NAME    Configuration environment (production)\n"
         " --locale=LOCALE       Locale hint for every document\n"
         " --override=KEY:VAL    Override config parameter (dotted key)\n"
         " --log-type=TYPES      Logger types (console,sync_file)\n"
         " --log-level=LEVEL     Logging level "
         "[debug|info|warning|error|critical]\n"
         " --explain             Include ranked template candidates\n"
         " --metrics             Print Prometheus metrics after processing\n"
         " --stdin               Read document paths from stdin until EOF;\n"
         "                       SIGHUP reloads configuration and templates\n";
}
