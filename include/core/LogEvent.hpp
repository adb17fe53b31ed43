#pragma once
/** @file  LogEvent.hpp
 *  @brief One row of the run log.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace cardia {
  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warning, Error };

    inline const char* toString(LogLevel l) {
      switch (l) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    /// Case-insensitive "debug" / "info" / "warn(ing)" / "error".
    std::optional<LogLevel> parseLogLevel(const std::string& text);

    struct LogEvent {
      std::int64_t timestampMs{ 0 }; ///< wall clock, ms since epoch
      LogLevel level{ LogLevel::Info };
      std::string source;            ///< e.g. "SessionCoordinator"
      std::string message;

      /// CSV row without the trailing newline; quotes in text are doubled.
      std::string toCsv() const;
    };

  } // namespace core
} // namespace cardia
