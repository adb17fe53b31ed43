#pragma once

/** @file  SessionCoordinator.hpp
 *  @brief Public API for cardia::core::SessionCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/Errors.hpp"
#include "core/HealthScorer.hpp"
#include "core/RecordingState.hpp"
#include "core/SampleBuffer.hpp"
#include "core/Session.hpp"
#include "core/SessionConfig.hpp"
#include "core/Timer.hpp"
#include "io/DeviceTransport.hpp"

namespace cardia {
  namespace gateways {
    class SessionStore;
  } // namespace gateways

  namespace core {

    class ErrorMonitor;
    class Logger;

    // ─── notifications the coordinator emits (tagged union) ──────────────────
    struct StateChanged {
      RecordingState from;
      RecordingState to;
    };

    struct ConnectionChanged {
      ConnectionStatus status;
      std::string deviceId;
    };

    struct HeartRateUpdated {
      double bpm;
    };

    struct HealthScoreUpdated {
      HealthScore score;
    };

    struct DevicesChanged {
      std::vector<io::DeviceInfo> devices;
    };

    struct SessionSealed {
      std::shared_ptr<const Session> session;
    };

    struct SessionSaved {
      std::string sessionId;
    };

    struct ErrorRaised {
      std::string domain; ///< "device" | "persistence"
      std::string code;   ///< e.g. "connection-lost"
      std::string message;
    };

    using Notification = std::variant<StateChanged, ConnectionChanged, HeartRateUpdated, HealthScoreUpdated,
                                      DevicesChanged, SessionSealed, SessionSaved, ErrorRaised>;

    /**
 * @class SessionCoordinator
 * @brief Owns the device link and the capture lifecycle
 *        idle → countdown → recording → processing → completed.
 *
 *  * Commands (`start`, `stop`, `connect`, ...) and `poll()` belong to one owner
 *    thread. Device events may arrive on any thread; they are queued by
 *    `post()` and applied one at a time inside `poll()`.
 *  * Timers are deadlines checked by `poll()`; cancelling one guarantees it
 *    cannot fire afterwards.
 *  * Illegal commands throw InvalidStateError. Device and persistence
 *    failures are reported (callback + ErrorMonitor), never thrown.
 *  * At most one Session is open; it is sealed before another can open.
 *  * While recording, every 1 s tick scores the newest `healthWindowSeconds`
 *    of signal (HealthScoreUpdated). The first window scored in a capture
 *    becomes the signal baseline for the rest of it; trend scoring uses the
 *    user's stored sessions, read once per `start()`.
 */
    class SessionCoordinator {

    public:
      using Callback = std::function<void(const Notification&)>;

      SessionCoordinator(SessionConfig config, std::shared_ptr<io::DeviceTransport> transport,
                         std::shared_ptr<ErrorMonitor> errors, std::shared_ptr<Logger> logger,
                         std::shared_ptr<gateways::SessionStore> store = nullptr);
      ~SessionCoordinator();

      SessionCoordinator(const SessionCoordinator&) = delete;
      SessionCoordinator& operator=(const SessionCoordinator&) = delete;

      void registerCallback(Callback cb) { cb_ = std::move(cb); }
      void setUserId(std::string userId) { userId_ = std::move(userId); }

      // ---- device link ----------------------------------------------------
      void startScan();
      void stopScan();
      void connect(const std::string& deviceId);
      void disconnect(); ///< user initiated: aborts any capture, no auto-reconnect

      // ---- capture lifecycle ----------------------------------------------
      /// Connected + idle only; duration defaults to the configured one and is clamped.
      void start(std::optional<std::chrono::seconds> duration = std::nullopt);
      void stop();        ///< no-op when idle
      void resetToIdle(); ///< completed → idle

      // ---- event intake (any thread) --------------------------------------
      void post(io::DeviceEvent event);

      /** Apply queued events, rejoin finished saves, fire due timers. `now` is
          a monotonic timestamp supplied by the owner loop. */
      void poll(std::chrono::milliseconds now);

      /// Block until outstanding saves finish (or timeout), then rejoin them.
      bool waitForPersistence(std::chrono::milliseconds timeout);

      // ---- observers -------------------------------------------------------
      RecordingState recordingState() const { return state_; }
      ConnectionStatus connectionStatus() const { return connection_; }
      const std::string& connectedDevice() const { return connectedDevice_; }
      const std::vector<io::DeviceInfo>& discoveredDevices() const { return discovered_; }
      unsigned countdownRemaining() const { return countdownRemaining_; }
      unsigned recordingRemaining() const { return recordingRemaining_; }
      std::chrono::seconds recordingDuration() const { return recordingDuration_; }
      double currentHeartRate() const { return buffer_.currentHeartRate(); }
      /// Latest score of the current or last capture; empty before the first one.
      const std::optional<HealthScore>& healthScore() const { return health_; }
      const SampleBuffer& buffer() const { return buffer_; }
      bool hasOpenSession() const { return active_ != nullptr; }
      std::shared_ptr<const Session> lastSession() const { return lastSession_; }
      const std::string& statusMessage() const { return status_; }
      std::size_t pendingSaves() const { return pendingSaves_.size(); }
      const SessionConfig& config() const { return cfg_; }

    private:
      // event handlers
      void handle(const io::DeviceDiscovered& e);
      void handle(const io::LinkChanged& e);
      void handle(const io::SamplesReceived& e);
      void handle(const io::DeviceFault& e);

      // timers
      void fireTimers(std::chrono::milliseconds now);
      void onCountdownTick(std::chrono::milliseconds at);
      void onRecordingTick(std::chrono::milliseconds at);
      void onConnectTimeout();
      void onReconnect();

      // lifecycle helpers
      void transitionTo(RecordingState next);
      void setConnection(ConnectionStatus next, const std::string& deviceId);
      void beginRecording(std::chrono::milliseconds at);
      void finishRecording(std::chrono::milliseconds at);
      std::shared_ptr<const Session> sealActive(SessionOutcome outcome, std::chrono::milliseconds at,
                                                bool keepSamples);
      bool abortCapture(const std::string& why);
      void releaseCompleted();
      void handleLinkLost(const std::string& deviceId);
      bool acceptsDevice(const io::DeviceInfo& dev) const;
      void loadHistory();
      void scoreHealth();

      // persistence
      void persist(std::shared_ptr<const Session> session);
      void collectFinishedSaves();

      // reporting
      void reportError(const std::string& domain, const std::string& code, const std::string& message);
      void notify(const Notification& n);
      void log(LogLevel level, const std::string& message) const;
      void setStatus(std::string message) { status_ = std::move(message); }

      SessionConfig cfg_;
      std::shared_ptr<io::DeviceTransport> transport_;
      std::shared_ptr<ErrorMonitor> errors_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<gateways::SessionStore> store_;
      Callback cb_{};

      // serialized intake
      mutable std::mutex queueMtx_;
      std::deque<io::DeviceEvent> queue_;

      // link
      ConnectionStatus connection_{ ConnectionStatus::Disconnected };
      std::vector<io::DeviceInfo> discovered_;
      std::string targetDevice_{};    ///< connect() in flight
      std::string connectedDevice_{};
      std::string lastDevice_{};      ///< reconnect target

      // capture
      RecordingState state_{ RecordingState::Idle };
      SampleBuffer buffer_;
      HealthScorer scorer_;
      std::unique_ptr<Session> active_;
      std::shared_ptr<const Session> lastSession_;
      std::string userId_{ "local" };
      std::uint64_t sessionSeq_{ 0 };
      unsigned countdownRemaining_{ 0 };
      unsigned recordingRemaining_{ 0 };
      std::chrono::seconds recordingDuration_{ 0 };
      std::chrono::milliseconds recordingStartedAt_{ 0 };
      std::size_t droppedReported_{ 0 };
      std::vector<HistoryEntry> history_;
      std::optional<SignalBaseline> healthBaseline_;
      std::optional<HealthScore> health_;
      std::string status_{ "Ready to scan for ECG devices" };

      // time
      std::chrono::milliseconds now_{ 0 };
      OneShotTimer scanTimer_;
      OneShotTimer connectTimer_;
      OneShotTimer countdownTimer_;
      OneShotTimer recordingTimer_;
      OneShotTimer reconnectTimer_;

      std::vector<std::future<std::string>> pendingSaves_;
    };

  } // namespace core
} // namespace cardia
