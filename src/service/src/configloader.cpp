/**
 * @file configloader.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "../include/configloader.hpp"

#include <fstream>
#include <sstream>

nlohmann::json ConfigLoader::loadFromFile(const std::string &filename) {
  nlohmann::json config = readFileContents(filename);
  lastLoadedFile_ = filename;
  return config;
}

nlohmann::json ConfigLoader::reload() const {
  if (lastLoadedFile_.empty()) {
    throw std::runtime_error("ConfigLoader: no file specified for reload");
  }
  return readFileContents(lastLoadedFile_);
}

std::string ConfigLoader::getLastLoadedFile() const { return lastLoadedFile_; }

bool ConfigLoader::hasLoadedFile() const { return !lastLoadedFile_.empty(); }

nlohmann::json ConfigLoader::readFileContents(
    const std::string &filename) const {
  std::ifstream file(filename);

  if (!file.is_open()) {
    throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
  }

  nlohmann::json config;
  try {
    file >> config;
  } catch (const nlohmann::json::parse_error &e) {
    std::stringstream ss;
    ss << "ConfigLoader: JSON parse error in " << filename << ": " << e.what()
       << " at byte " << e.byte;
    throw std::runtime_error(ss.str());
  }

  if (!config.is_object()) {
    throw std::runtime_error("ConfigLoader: " + filename +
                             " must contain a JSON object");
  }
  return config;
}
