#pragma once
/** @file  RecordingState.hpp
 *  @brief Capture lifecycle and device link enums.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>

namespace cardia {
  namespace core {

    enum class RecordingState : std::uint8_t { Idle, Countdown, Recording, Processing, Completed, Count };
    static_assert(static_cast<std::uint8_t>(RecordingState::Count) == 5,
                  "RecordingState count changed please update code that depends on it");

    inline const char* toString(RecordingState s) {
      switch (s) {
      case RecordingState::Idle:
        return "idle";
      case RecordingState::Countdown:
        return "countdown";
      case RecordingState::Recording:
        return "recording";
      case RecordingState::Processing:
        return "processing";
      case RecordingState::Completed:
        return "completed";
      default:
        return "unknown";
      }
    }

    enum class ConnectionStatus : std::uint8_t { Disconnected, Scanning, Connecting, Connected, Error };

    inline const char* toString(ConnectionStatus s) {
      switch (s) {
      case ConnectionStatus::Disconnected:
        return "disconnected";
      case ConnectionStatus::Scanning:
        return "scanning";
      case ConnectionStatus::Connecting:
        return "connecting";
      case ConnectionStatus::Connected:
        return "connected";
      case ConnectionStatus::Error:
        return "error";
      default:
        return "unknown";
      }
    }

  } // namespace core
} // namespace cardia
