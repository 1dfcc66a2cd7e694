#include "../include/configcache.hpp"

#include <stdexcept>

std::optional<nlohmann::json> ConfigCache::getCached(
    const std::string &env) const {
  std::lock_guard<std::mutex> lock(cacheMutex_);

  auto it = cachedConfig_.find(env);
  if (it == cachedConfig_.end()) {
    return std::nullopt;
  }
  return *it;
}

void ConfigCache::updateCache(const std::string &env,
                              const nlohmann::json &config) {
  if (!config.is_object()) {
    throw std::invalid_argument("ConfigCache: invalid config for environment '" +
                                env + "'");
  }

  std::lock_guard<std::mutex> lock(cacheMutex_);
  cachedConfig_[env] = config;
}

void ConfigCache::clearAll() {
  std::lock_guard<std::mutex> lock(cacheMutex_);
  cachedConfig_ = nlohmann::json::object();
}

std::size_t ConfigCache::size() const {
  std::lock_guard<std::mutex> lock(cacheMutex_);
  return cachedConfig_.size();
}
