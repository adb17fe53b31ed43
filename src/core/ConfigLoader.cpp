/* @file ConfigLoader.cpp
 * @brief settings file reader
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>

// third-party headers
#include <nlohmann/json.hpp>

// Cardia headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace cardia::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw ConfigError("[ConfigLoader] cannot open " + path_);

  try {
    return nlohmann::json::parse(in, nullptr, true, true);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("[ConfigLoader] " + path_ + " is not valid JSON: " + e.what());
  }
}
