#pragma once
/** @file  SessionConfig.hpp
 *  @brief Validated settings for capture, transport, persistence and logging.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "core/LogEvent.hpp"

namespace cardia {
  namespace core {

    /// What happens to the samples of a capture that ends on a link failure.
    enum class PartialSavePolicy { Discard, Persist };

    enum class SampleEncoding { Volts, AdcCounts };

    /**
 * @struct SessionConfig
 * @brief Plain settings record; defaults are the values used when a key is
 *        absent from the JSON file.
 */
    struct SessionConfig {
      // capture
      unsigned sampleRateHz{ 250 };
      unsigned countdownSeconds{ 3 };
      unsigned defaultDurationSeconds{ 30 };
      unsigned minDurationSeconds{ 10 };
      unsigned maxDurationSeconds{ 600 };
      std::size_t displayWindowSamples{ 5000 };
      double heartRateWindowSeconds{ 3.0 };
      std::size_t heartRateHistory{ 100 };

      // live health score
      bool healthScoring{ true };
      double healthWindowSeconds{ 10.0 };
      unsigned userAge{ 30 };

      // device link
      std::chrono::seconds scanTimeout{ 30 };
      std::chrono::seconds connectTimeout{ 15 };
      bool autoReconnect{ true };
      std::chrono::seconds reconnectDelay{ 5 };
      PartialSavePolicy partialSave{ PartialSavePolicy::Discard };
      std::vector<std::string> deviceKeywords{}; ///< empty accepts every device

      // decoding / serial
      SampleEncoding sampleEncoding{ SampleEncoding::Volts };
      double adcReference{ 3.3 };
      unsigned serialBaud{ 115200 };
      std::vector<std::string> serialPrefixes{ "ttyUSB", "ttyACM", "rfcomm" };

      // gateways & ambient
      std::chrono::seconds summaryTimeout{ 30 };
      LogLevel logLevel{ LogLevel::Info };
      std::string logPath{ "cardia_run.csv" };
      std::string storeRoot{ "sessions" };

      /// Samples the buffer may retain for one capture (max duration at full rate).
      std::size_t recordCapacity() const {
        return static_cast<std::size_t>(maxDurationSeconds) * sampleRateHz;
      }

      /// Apply defaults for absent keys; throws ConfigError on bad types or ranges.
      static SessionConfig fromJson(const nlohmann::json& j);
    };

  } // namespace core
} // namespace cardia
