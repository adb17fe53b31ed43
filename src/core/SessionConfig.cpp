/* @file SessionConfig.cpp
 * @brief JSON → SessionConfig with defaults and range checks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// Cardia headers
#include "core/Errors.hpp"
#include "core/SessionConfig.hpp"

namespace cardia {
  namespace core {

    namespace {

      template <typename T> void readKey(const nlohmann::json& j, const char* key, T& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
          return;
        try {
          out = it->get<T>();
        } catch (const nlohmann::json::exception& e) {
          throw ConfigError(std::string("[SessionConfig] bad type for '") + key + "': " + e.what());
        }
      }

      void readSeconds(const nlohmann::json& j, const char* key, std::chrono::seconds& out) {
        long long secs = out.count();
        readKey(j, key, secs);
        if (secs < 0)
          throw ConfigError(std::string("[SessionConfig] '") + key + "' must not be negative");
        out = std::chrono::seconds{ secs };
      }

      std::string lowered(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
      }

      void require(bool ok, const std::string& what) {
        if (!ok)
          throw ConfigError("[SessionConfig] " + what);
      }

    } // namespace

    SessionConfig SessionConfig::fromJson(const nlohmann::json& j) {
      if (!j.is_object())
        throw ConfigError("[SessionConfig] top-level config must be a JSON object");

      SessionConfig c;
      readKey(j, "sampleRateHz", c.sampleRateHz);
      readKey(j, "countdownSeconds", c.countdownSeconds);
      readKey(j, "defaultDurationSeconds", c.defaultDurationSeconds);
      readKey(j, "minDurationSeconds", c.minDurationSeconds);
      readKey(j, "maxDurationSeconds", c.maxDurationSeconds);
      readKey(j, "displayWindowSamples", c.displayWindowSamples);
      readKey(j, "heartRateWindowSeconds", c.heartRateWindowSeconds);
      readKey(j, "heartRateHistory", c.heartRateHistory);
      readKey(j, "healthScoring", c.healthScoring);
      readKey(j, "healthWindowSeconds", c.healthWindowSeconds);
      readKey(j, "userAge", c.userAge);
      readSeconds(j, "scanTimeoutSeconds", c.scanTimeout);
      readSeconds(j, "connectTimeoutSeconds", c.connectTimeout);
      readKey(j, "autoReconnect", c.autoReconnect);
      readSeconds(j, "reconnectDelaySeconds", c.reconnectDelay);
      readKey(j, "deviceKeywords", c.deviceKeywords);
      readKey(j, "adcReference", c.adcReference);
      readKey(j, "serialBaud", c.serialBaud);
      readKey(j, "serialPrefixes", c.serialPrefixes);
      readSeconds(j, "summaryTimeoutSeconds", c.summaryTimeout);
      readKey(j, "logPath", c.logPath);
      readKey(j, "storeRoot", c.storeRoot);

      std::string partial = "discard";
      readKey(j, "partialSave", partial);
      partial = lowered(partial);
      require(partial == "discard" || partial == "persist",
              "partialSave must be \"discard\" or \"persist\", got \"" + partial + "\"");
      c.partialSave = partial == "persist" ? PartialSavePolicy::Persist : PartialSavePolicy::Discard;

      std::string encoding = "volts";
      readKey(j, "sampleEncoding", encoding);
      encoding = lowered(encoding);
      require(encoding == "volts" || encoding == "adc-counts",
              "sampleEncoding must be \"volts\" or \"adc-counts\", got \"" + encoding + "\"");
      c.sampleEncoding = encoding == "adc-counts" ? SampleEncoding::AdcCounts : SampleEncoding::Volts;

      std::string level = "info";
      readKey(j, "logLevel", level);
      auto parsed = parseLogLevel(level);
      require(parsed.has_value(), "unknown logLevel \"" + level + "\"");
      c.logLevel = *parsed;

      require(c.sampleRateHz > 0, "sampleRateHz must be positive");
      require(c.minDurationSeconds > 0, "minDurationSeconds must be positive");
      require(c.minDurationSeconds <= c.maxDurationSeconds,
              "minDurationSeconds must not exceed maxDurationSeconds");
      require(c.defaultDurationSeconds >= c.minDurationSeconds &&
                  c.defaultDurationSeconds <= c.maxDurationSeconds,
              "defaultDurationSeconds outside [minDurationSeconds, maxDurationSeconds]");
      require(c.displayWindowSamples > 0, "displayWindowSamples must be positive");
      require(c.heartRateWindowSeconds > 0.0, "heartRateWindowSeconds must be positive");
      require(c.healthWindowSeconds >= 2.0 && c.healthWindowSeconds <= 60.0,
              "healthWindowSeconds outside [2, 60]");
      require(c.userAge > 0 && c.userAge <= 120, "userAge outside [1, 120]");
      require(c.adcReference > 0.0, "adcReference must be positive");
      require(c.serialBaud > 0, "serialBaud must be positive");
      require(c.connectTimeout.count() > 0, "connectTimeoutSeconds must be positive");
      require(c.summaryTimeout.count() > 0, "summaryTimeoutSeconds must be positive");
      return c;
    }

  } // namespace core
} // namespace cardia
