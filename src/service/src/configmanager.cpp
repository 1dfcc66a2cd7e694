#include "../include/configmanager.hpp"

#include <sstream>
#include <stdexcept>

#include "ifx/compositelogger.hpp"

namespace {

nlohmann::json parseOverrideValue(const std::string &value) {
  nlohmann::json parsed =
      nlohmann::json::parse(value, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    return value;
  }
  return parsed;
}

}  // namespace

ConfigManager &ConfigManager::instance() {
  static ConfigManager instance;
  return instance;
}

void ConfigManager::initialize(const std::string &filename) {
  std::lock_guard<std::mutex> lock(configMutex_);

  try {
    nlohmann::json config = loader_.loadFromFile(filename);
    envProcessor_.process(config);
    validateLocked(config, nlohmann::json::object());

    baseConfig_ = std::move(config);
    overrides_ = nlohmann::json::object();
    configFilePath_ = filename;
    cache_.clearAll();
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Config initialization failed: ") +
                             e.what());
  }

  ifx::CompositeLogger::instance().debug("ConfigManager: loaded " + filename);
}

void ConfigManager::reload() {
  std::lock_guard<std::mutex> lock(configMutex_);

  if (configFilePath_.empty()) {
    throw std::runtime_error("No configuration file path available for reload");
  }

  try {
    nlohmann::json newConfig = loader_.reload();
    envProcessor_.process(newConfig);
    validateLocked(newConfig, overrides_);

    baseConfig_ = std::move(newConfig);
    cache_.clearAll();
  } catch (const std::exception &e) {
    ifx::CompositeLogger::instance().error(
        "ConfigManager: failed to reload configuration, using previous one: " +
        std::string(e.what()));
    throw std::runtime_error("Config reload failed: " + std::string(e.what()));
  }

  ifx::CompositeLogger::instance().info(
      "ConfigManager: configuration reloaded from " + configFilePath_);
}

nlohmann::json ConfigManager::getMergedConfig(const std::string &env) const {
  std::lock_guard<std::mutex> lock(configMutex_);

  if (auto cached = cache_.getCached(env)) {
    return *cached;
  }

  nlohmann::json merged = mergeLocked(baseConfig_, overrides_, env);
  cache_.updateCache(env, merged);
  return merged;
}

void ConfigManager::applyCliOverrides(
    const std::unordered_map<std::string, std::string> &overrides) {
  std::lock_guard<std::mutex> lock(configMutex_);

  nlohmann::json candidate = overrides_;
  for (const auto &[key, value] : overrides) {
    if (key.empty() || key.front() == '.' || key.back() == '.' ||
        key.find("..") != std::string::npos) {
      throw std::runtime_error("ConfigManager: Invalid override key: '" + key +
                               "'");
    }

    nlohmann::json *node = &candidate;
    std::istringstream path(key);
    std::string part;
    std::vector<std::string> parts;
    while (std::getline(path, part, '.')) {
      parts.push_back(part);
    }
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
      nlohmann::json &child = (*node)[parts[i]];
      if (!child.is_object()) {
        child = nlohmann::json::object();
      }
      node = &child;
    }
    (*node)[parts.back()] = parseOverrideValue(value);
  }

  try {
    validateLocked(baseConfig_, candidate);
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("ConfigManager: overrides rejected: ") +
                             e.what());
  }

  overrides_ = std::move(candidate);
  cache_.clearAll();

  for (const auto &[key, value] : overrides) {
    ifx::CompositeLogger::instance().info("ConfigManager: override " + key +
                                          " = " + value);
  }
}

std::vector<std::string> ConfigManager::environments() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  std::vector<std::string> names;
  if (baseConfig_.contains("environments")) {
    for (const auto &[name, _] : baseConfig_["environments"].items()) {
      names.push_back(name);
    }
  }
  return names;
}

std::string ConfigManager::configFilePath() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return configFilePath_;
}

bool ConfigManager::isInitialized() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return !baseConfig_.is_null();
}

nlohmann::json ConfigManager::getCurrentConfig() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return baseConfig_;
}

nlohmann::json ConfigManager::mergeLocked(const nlohmann::json &base,
                                          const nlohmann::json &overrides,
                                          const std::string &env) const {
  if (!base.contains("environments") || !base["environments"].contains(env)) {
    throw std::runtime_error("Environment '" + env + "' not found");
  }

  nlohmann::json merged = base["defaults"];
  merged.merge_patch(base["environments"][env]);
  merged.merge_patch(overrides);
  return merged;
}

void ConfigManager::validateLocked(const nlohmann::json &base,
                                   const nlohmann::json &overrides) const {
  validator_.validateRoot(base);
  for (const auto &[env, _] : base["environments"].items()) {
    try {
      validator_.validateMerged(mergeLocked(base, overrides, env));
    } catch (const std::exception &e) {
      throw std::runtime_error("environment '" + env + "': " + e.what());
    }
  }
}
