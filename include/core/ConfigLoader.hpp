#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Reads the recorder's JSON settings file.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace cardia {
  namespace core {

    /**
 * @class ConfigLoader
 * @brief Opens `cardia.json` (or any path given on the command line) and
 *        returns the raw document for SessionConfig::fromJson.
 *
 *  * `//` and block comments are accepted, so shipped configs can annotate keys.
 *  * An unreadable or unparsable file throws ConfigError naming the path.
 *  * Key and range checks are left to SessionConfig.
 */
    class ConfigLoader {
    public:
      explicit ConfigLoader(std::string configPath);

      nlohmann::json load() const;

      const std::string& path() const { return path_; }

    private:
      std::string path_;
    };

  } // namespace core
} // namespace cardia
