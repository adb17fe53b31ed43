/* @file SessionCoordinator.cpp
 * @brief device link + capture lifecycle state machine, driven from the owner's poll loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <cctype>
#include <cmath>
#include <stdexcept>

// Cardia headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SessionCoordinator.hpp"
#include "gateways/SessionStore.hpp"

namespace cardia {
  namespace core {

    namespace {
      constexpr std::chrono::milliseconds kTick{ 1000 };

      SampleBuffer::Limits limitsFrom(const SessionConfig& cfg) {
        SampleBuffer::Limits l;
        l.sampleRateHz = cfg.sampleRateHz;
        l.recordCapacity = cfg.recordCapacity();
        l.displayCapacity = cfg.displayWindowSamples;
        l.heartRateWindow =
            static_cast<std::size_t>(std::lround(cfg.heartRateWindowSeconds * cfg.sampleRateHz));
        l.heartRateHistory = cfg.heartRateHistory;
        return l;
      }

      std::string lowered(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
      }

      std::string displayName(const std::string& deviceId) {
        const auto slash = deviceId.find_last_of('/');
        return slash == std::string::npos ? deviceId : deviceId.substr(slash + 1);
      }
    } // namespace

    SessionCoordinator::SessionCoordinator(SessionConfig config,
                                           std::shared_ptr<io::DeviceTransport> transport,
                                           std::shared_ptr<ErrorMonitor> errors,
                                           std::shared_ptr<Logger> logger,
                                           std::shared_ptr<gateways::SessionStore> store)
        : cfg_(std::move(config)), transport_(std::move(transport)), errors_(std::move(errors)),
          logger_(std::move(logger)), store_(std::move(store)), buffer_(limitsFrom(cfg_)),
          scorer_(HealthScorer::Options{ cfg_.sampleRateHz, cfg_.userAge }),
          recordingDuration_(cfg_.defaultDurationSeconds) {
      if (!transport_)
        throw std::invalid_argument("[SessionCoordinator] device transport is nullptr");
      if (!errors_)
        throw std::invalid_argument("[SessionCoordinator] error monitor is nullptr");

      transport_->registerCallback([this](const io::DeviceEvent& e) { post(e); });
    }

    SessionCoordinator::~SessionCoordinator() {
      transport_->registerCallback(nullptr);
      for (auto& f : pendingSaves_)
        if (f.valid())
          f.wait();
    }

    //---device link-------------------------------------------------------------

    void SessionCoordinator::startScan() {
      if (connection_ == ConnectionStatus::Scanning)
        return;
      if (connection_ == ConnectionStatus::Connecting || connection_ == ConnectionStatus::Connected)
        throw InvalidStateError(std::string("[SessionCoordinator] cannot scan while ") + toString(connection_));

      discovered_.clear();
      notify(DevicesChanged{ discovered_ });
      setConnection(ConnectionStatus::Scanning, "");
      setStatus("Scanning for ECG devices...");
      scanTimer_.arm(now_ + std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.scanTimeout));

      try {
        transport_->startScan();
      } catch (const DeviceError& e) {
        scanTimer_.cancel();
        setConnection(ConnectionStatus::Error, "");
        setStatus("Failed to start scanning");
        reportError("device", e.code(), e.what());
      }
    }

    void SessionCoordinator::stopScan() {
      if (connection_ != ConnectionStatus::Scanning)
        return;
      scanTimer_.cancel();
      try {
        transport_->stopScan();
      } catch (const DeviceError& e) {
        log(LogLevel::Warning, std::string("stopScan failed: ") + e.what()); // scan is over either way
      }
      setConnection(ConnectionStatus::Disconnected, "");
      setStatus(discovered_.empty() ? "No ECG devices found" : "Scan completed");
    }

    void SessionCoordinator::connect(const std::string& deviceId) {
      if (deviceId.empty())
        throw std::invalid_argument("[SessionCoordinator] empty device id");
      if (connection_ == ConnectionStatus::Connecting || connection_ == ConnectionStatus::Connected)
        throw InvalidStateError(std::string("[SessionCoordinator] connect() while ") + toString(connection_));

      stopScan();
      reconnectTimer_.cancel();
      targetDevice_ = deviceId;
      lastDevice_ = deviceId;
      setConnection(ConnectionStatus::Connecting, deviceId);
      setStatus("Connecting to " + displayName(deviceId) + "...");
      connectTimer_.arm(now_ + std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.connectTimeout));

      try {
        transport_->connect(deviceId);
      } catch (const DeviceError& e) {
        handle(io::DeviceFault{ e.kind(), e.what() });
      }
    }

    void SessionCoordinator::disconnect() {
      reconnectTimer_.cancel();
      connectTimer_.cancel();
      stopScan();

      if (abortCapture("device disconnected by user"))
        log(LogLevel::Info, "capture aborted by user disconnect");
      releaseCompleted();

      const bool linked = connection_ == ConnectionStatus::Connected || connection_ == ConnectionStatus::Connecting;
      targetDevice_.clear();
      connectedDevice_.clear();
      lastDevice_.clear();
      if (connection_ != ConnectionStatus::Disconnected) {
        setConnection(ConnectionStatus::Disconnected, "");
        setStatus("Disconnected");
      }

      if (linked) {
        try {
          transport_->disconnect();
        } catch (const DeviceError& e) {
          log(LogLevel::Warning, std::string("transport disconnect failed: ") + e.what());
        }
      }
    }

    //---capture lifecycle-------------------------------------------------------

    void SessionCoordinator::start(std::optional<std::chrono::seconds> duration) {
      if (connection_ != ConnectionStatus::Connected)
        throw InvalidStateError("[SessionCoordinator] start() requires a connected device");
      if (state_ != RecordingState::Idle)
        throw InvalidStateError(std::string("[SessionCoordinator] start() requires idle, state is ") +
                                toString(state_));

      const auto requested = duration.value_or(std::chrono::seconds{ cfg_.defaultDurationSeconds });
      recordingDuration_ = std::clamp(requested, std::chrono::seconds{ cfg_.minDurationSeconds },
                                      std::chrono::seconds{ cfg_.maxDurationSeconds });
      countdownRemaining_ = cfg_.countdownSeconds;
      recordingRemaining_ = 0;
      buffer_.reset();
      droppedReported_ = 0;
      healthBaseline_.reset();
      health_.reset();
      errors_->reset();
      loadHistory();

      transitionTo(RecordingState::Countdown);
      if (countdownRemaining_ == 0) {
        beginRecording(now_);
        return;
      }
      setStatus("Get ready... Recording starts in " + std::to_string(countdownRemaining_) + " seconds");
      countdownTimer_.arm(now_ + kTick);
    }

    void SessionCoordinator::stop() {
      switch (state_) {
      case RecordingState::Countdown:
        countdownTimer_.cancel();
        countdownRemaining_ = 0;
        transitionTo(RecordingState::Idle);
        setStatus("Recording cancelled");
        break;
      case RecordingState::Recording:
        finishRecording(now_);
        break;
      default:
        break; // idle / processing / completed: nothing to stop
      }
    }

    void SessionCoordinator::resetToIdle() {
      if (state_ == RecordingState::Idle)
        return;
      if (state_ != RecordingState::Completed)
        throw InvalidStateError(std::string("[SessionCoordinator] resetToIdle() while ") + toString(state_));
      transitionTo(RecordingState::Idle);
      setStatus(connection_ == ConnectionStatus::Connected ? "Ready to record" : "Disconnected");
    }

    void SessionCoordinator::beginRecording(std::chrono::milliseconds at) {
      if (active_)
        throw InvalidStateError("[SessionCoordinator] a session is already open: " + active_->id());

      countdownTimer_.cancel();
      countdownRemaining_ = 0;
      buffer_.reset();

      const auto wall = Session::Clock::now();
      const auto epochMs =
          std::chrono::duration_cast<std::chrono::milliseconds>(wall.time_since_epoch()).count();
      active_ = std::make_unique<Session>("ses-" + std::to_string(epochMs) + "-" + std::to_string(++sessionSeq_),
                                          userId_, wall, cfg_.sampleRateHz);

      recordingStartedAt_ = at;
      recordingRemaining_ = static_cast<unsigned>(recordingDuration_.count());
      transitionTo(RecordingState::Recording);
      setStatus("Recording ECG... " + std::to_string(recordingRemaining_) + "s remaining");
      log(LogLevel::Info, "session " + active_->id() + " opened for " +
                              std::to_string(recordingDuration_.count()) + "s");
      recordingTimer_.arm(at + kTick);
    }

    void SessionCoordinator::finishRecording(std::chrono::milliseconds at) {
      if (state_ != RecordingState::Recording)
        return;

      recordingTimer_.cancel();
      recordingRemaining_ = 0;
      transitionTo(RecordingState::Processing);
      setStatus("Processing ECG data...");

      if (!health_)
        scoreHealth(); // stopped before the first tick
      auto sealed = sealActive(SessionOutcome::Completed, at, true);
      const auto& m = sealed->metrics();
      log(LogLevel::Info, "session " + sealed->id() + " completed: " + std::to_string(sealed->sampleCount()) +
                              " samples, avg " + std::to_string(m.avgBpm) + " bpm");

      if (store_ && sealed->sampleCount() > 0)
        persist(sealed);

      transitionTo(RecordingState::Completed);
      setStatus("ECG recording completed");
    }

    std::shared_ptr<const Session> SessionCoordinator::sealActive(SessionOutcome outcome,
                                                                  std::chrono::milliseconds at,
                                                                  bool keepSamples) {
      assert(active_ && "[SessionCoordinator] sealing without an open session");

      std::vector<double> samples;
      std::vector<double> heartRates;
      if (keepSamples)
        buffer_.takeCapture(samples, heartRates);
      else
        buffer_.reset();

      const auto elapsed = at > recordingStartedAt_ ? at - recordingStartedAt_ : std::chrono::milliseconds{ 0 };
      active_->seal(std::move(samples), std::move(heartRates), elapsed, outcome);

      std::shared_ptr<const Session> sealed = std::move(active_);
      lastSession_ = sealed;
      notify(SessionSealed{ sealed });
      return sealed;
    }

    bool SessionCoordinator::abortCapture(const std::string& why) {
      if (state_ != RecordingState::Countdown && state_ != RecordingState::Recording)
        return false;

      countdownTimer_.cancel();
      recordingTimer_.cancel();
      countdownRemaining_ = 0;
      recordingRemaining_ = 0;

      if (state_ == RecordingState::Recording && active_) {
        const bool keep = cfg_.partialSave == PartialSavePolicy::Persist;
        auto sealed = sealActive(SessionOutcome::Aborted, now_, keep);
        log(LogLevel::Warning, "session " + sealed->id() + " aborted (" + why + "), " +
                                   (keep ? "partial capture kept" : "partial capture discarded"));
        if (keep && store_ && sealed->sampleCount() > 0)
          persist(sealed);
      }

      transitionTo(RecordingState::Idle);
      setStatus("Recording aborted: " + why);
      return true;
    }

    // A finished session stays on display only while its device is linked.
    void SessionCoordinator::releaseCompleted() {
      if (state_ != RecordingState::Completed)
        return;
      transitionTo(RecordingState::Idle);
      setStatus("Disconnected");
    }

    void SessionCoordinator::loadHistory() {
      history_.clear();
      if (!cfg_.healthScoring || !store_)
        return;
      try {
        for (const auto& s : store_->listSessions(userId_))
          history_.push_back(HistoryEntry{ s.timestamp, s.avgBpm, s.status == "Normal" });
      } catch (const PersistenceError& e) {
        log(LogLevel::Warning, std::string("session history unavailable for trend scoring: ") + e.what());
      }
    }

    void SessionCoordinator::scoreHealth() {
      if (!cfg_.healthScoring)
        return;
      const auto& display = buffer_.displayWindow();
      const auto wanted = static_cast<std::size_t>(std::lround(cfg_.healthWindowSeconds * cfg_.sampleRateHz));
      const std::size_t n = std::min(display.size(), wanted);
      if (n < 2 * static_cast<std::size_t>(cfg_.sampleRateHz))
        return; // under two seconds of signal

      const std::vector<double> window(display.end() - static_cast<std::ptrdiff_t>(n), display.end());
      if (!healthBaseline_)
        healthBaseline_ = HealthScorer::baselineOf(window);

      health_ = scorer_.score(window, history_, Session::Clock::now(), &*healthBaseline_);
      log(LogLevel::Debug, "health score " + std::to_string(std::lround(health_->overall)) + " (" +
                               toString(health_->status) + ")");
      notify(HealthScoreUpdated{ *health_ });
    }

    //---event intake------------------------------------------------------------

    void SessionCoordinator::post(io::DeviceEvent event) {
      std::lock_guard<std::mutex> lock(queueMtx_);
      queue_.push_back(std::move(event));
    }

    void SessionCoordinator::poll(std::chrono::milliseconds now) {
      now_ = std::max(now_, now);

      collectFinishedSaves();

      std::deque<io::DeviceEvent> batch;
      {
        std::lock_guard<std::mutex> lock(queueMtx_);
        batch.swap(queue_);
      }
      for (const auto& ev : batch)
        std::visit([this](const auto& e) { handle(e); }, ev);

      fireTimers(now_);
    }

    void SessionCoordinator::handle(const io::DeviceDiscovered& e) {
      if (connection_ != ConnectionStatus::Scanning || !acceptsDevice(e.device))
        return;
      const bool known = std::any_of(discovered_.begin(), discovered_.end(),
                                     [&](const io::DeviceInfo& d) { return d.id == e.device.id; });
      if (known)
        return;
      discovered_.push_back(e.device);
      setStatus(std::to_string(discovered_.size()) + " ECG device(s) found");
      notify(DevicesChanged{ discovered_ });
    }

    void SessionCoordinator::handle(const io::LinkChanged& e) {
      switch (e.state) {
      case io::LinkState::Connecting:
        break; // we entered Connecting ourselves in connect()

      case io::LinkState::Connected:
        if (connection_ != ConnectionStatus::Connecting || e.deviceId != targetDevice_) {
          log(LogLevel::Warning, "ignoring unsolicited connection to " + e.deviceId);
          return;
        }
        connectTimer_.cancel();
        reconnectTimer_.cancel();
        targetDevice_.clear();
        connectedDevice_ = e.deviceId;
        setConnection(ConnectionStatus::Connected, e.deviceId);
        setStatus("Connected to " + displayName(e.deviceId));
        log(LogLevel::Info, "ECG device connected: " + e.deviceId);
        break;

      case io::LinkState::Disconnected:
        handleLinkLost(e.deviceId);
        break;
      }
    }

    void SessionCoordinator::handleLinkLost(const std::string& deviceId) {
      if (connection_ == ConnectionStatus::Connecting && deviceId == targetDevice_) {
        connectTimer_.cancel();
        targetDevice_.clear();
        setConnection(ConnectionStatus::Error, deviceId);
        setStatus("Failed to connect to ECG device");
        reportError("device", toString(DeviceErrorKind::ConnectionFailed), "link to " + deviceId + " closed while connecting");
        return;
      }
      if (connection_ != ConnectionStatus::Connected || deviceId != connectedDevice_)
        return; // already torn down (user disconnect) or a stale link

      const bool wasRecording = state_ == RecordingState::Recording;
      connectedDevice_.clear();
      setConnection(ConnectionStatus::Disconnected, deviceId);
      setStatus("Disconnected");

      if (abortCapture("device disconnected"))
        reportError("device", toString(DeviceErrorKind::ConnectionLost),
                    "ECG device " + deviceId + " disconnected during capture");
      else
        log(LogLevel::Warning, "ECG device disconnected: " + deviceId);
      releaseCompleted();

      if (wasRecording && cfg_.autoReconnect && !lastDevice_.empty()) {
        log(LogLevel::Info, "Attempting ECG device reconnection in " + std::to_string(cfg_.reconnectDelay.count()) + "s");
        reconnectTimer_.arm(now_ + std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.reconnectDelay));
      }
    }

    void SessionCoordinator::handle(const io::SamplesReceived& e) {
      if (state_ != RecordingState::Recording || e.samples.empty())
        return;

      buffer_.append(e.samples);
      if (buffer_.dropped() > droppedReported_ && droppedReported_ == 0)
        log(LogLevel::Warning, "record capacity reached, further samples are not retained");
      droppedReported_ = buffer_.dropped();

      notify(HeartRateUpdated{ buffer_.currentHeartRate() });
    }

    void SessionCoordinator::handle(const io::DeviceFault& e) {
      reportError("device", toString(e.kind), e.message);

      if (connection_ == ConnectionStatus::Connecting) {
        connectTimer_.cancel();
        targetDevice_.clear();
        setConnection(ConnectionStatus::Error, "");
        setStatus("Failed to connect to ECG device");
      } else if (connection_ == ConnectionStatus::Scanning && e.kind == DeviceErrorKind::NotFound) {
        scanTimer_.cancel();
        setConnection(ConnectionStatus::Error, "");
        setStatus("Failed to start scanning");
      }

      abortCapture(e.message);
    }

    //---timers--------------------------------------------------------------------

    void SessionCoordinator::fireTimers(std::chrono::milliseconds now) {
      bool fired = true;
      while (fired) {
        fired = false;
        if (scanTimer_.due(now)) {
          scanTimer_.cancel();
          stopScan();
          fired = true;
        }
        if (connectTimer_.due(now)) {
          connectTimer_.cancel();
          onConnectTimeout();
          fired = true;
        }
        if (countdownTimer_.due(now)) {
          onCountdownTick(countdownTimer_.take());
          fired = true;
        }
        if (recordingTimer_.due(now)) {
          onRecordingTick(recordingTimer_.take());
          fired = true;
        }
        if (reconnectTimer_.due(now)) {
          reconnectTimer_.cancel();
          onReconnect();
          fired = true;
        }
      }
    }

    void SessionCoordinator::onCountdownTick(std::chrono::milliseconds at) {
      if (state_ != RecordingState::Countdown)
        return;
      if (countdownRemaining_ > 0)
        --countdownRemaining_;
      if (countdownRemaining_ == 0) {
        beginRecording(at);
        return;
      }
      setStatus("Get ready... Recording starts in " + std::to_string(countdownRemaining_) + "s");
      countdownTimer_.arm(at + kTick);
    }

    void SessionCoordinator::onRecordingTick(std::chrono::milliseconds at) {
      if (state_ != RecordingState::Recording)
        return;
      if (recordingRemaining_ > 0)
        --recordingRemaining_;
      scoreHealth();
      if (recordingRemaining_ == 0) {
        finishRecording(at);
        return;
      }
      setStatus("Recording ECG... " + std::to_string(recordingRemaining_) + "s remaining");
      recordingTimer_.arm(at + kTick);
    }

    void SessionCoordinator::onConnectTimeout() {
      if (connection_ != ConnectionStatus::Connecting)
        return;
      const std::string id = std::move(targetDevice_);
      targetDevice_.clear();
      setConnection(ConnectionStatus::Error, id);
      setStatus("Failed to connect to ECG device");
      reportError("device", toString(DeviceErrorKind::ConnectionFailed),
                  "no connection to " + id + " within " + std::to_string(cfg_.connectTimeout.count()) + "s");
      try {
        transport_->disconnect();
      } catch (const DeviceError& e) {
        log(LogLevel::Warning, std::string("transport disconnect failed: ") + e.what());
      }
    }

    void SessionCoordinator::onReconnect() {
      if (lastDevice_.empty() ||
          (connection_ != ConnectionStatus::Disconnected && connection_ != ConnectionStatus::Error))
        return;
      log(LogLevel::Info, "Attempting ECG device reconnection to " + lastDevice_);
      connect(lastDevice_);
    }

    //---helpers-------------------------------------------------------------------

    void SessionCoordinator::transitionTo(RecordingState next) {
      if (next == state_)
        return;
      const auto prev = state_;
      state_ = next;
      log(LogLevel::Debug, std::string("recording ") + toString(prev) + " -> " + toString(next));
      notify(StateChanged{ prev, next });
    }

    void SessionCoordinator::setConnection(ConnectionStatus next, const std::string& deviceId) {
      if (next == connection_)
        return;
      connection_ = next;
      log(LogLevel::Debug, std::string("link ") + toString(next) + (deviceId.empty() ? "" : " " + deviceId));
      notify(ConnectionChanged{ next, deviceId });
    }

    bool SessionCoordinator::acceptsDevice(const io::DeviceInfo& dev) const {
      if (cfg_.deviceKeywords.empty())
        return true;
      const std::string name = lowered(dev.name);
      const std::string desc = lowered(dev.description);
      return std::any_of(cfg_.deviceKeywords.begin(), cfg_.deviceKeywords.end(), [&](const std::string& k) {
        const std::string key = lowered(k);
        return name.find(key) != std::string::npos || desc.find(key) != std::string::npos;
      });
    }

    void SessionCoordinator::persist(std::shared_ptr<const Session> session) {
      pendingSaves_.push_back(std::async(std::launch::async, [store = store_, session] {
        return store->saveSession(*session);
      }));
    }

    void SessionCoordinator::collectFinishedSaves() {
      for (auto it = pendingSaves_.begin(); it != pendingSaves_.end();) {
        if (it->wait_for(std::chrono::milliseconds{ 0 }) != std::future_status::ready) {
          ++it;
          continue;
        }
        try {
          const std::string id = it->get();
          log(LogLevel::Info, "session saved: " + id);
          notify(SessionSaved{ id });
        } catch (const CardiaError& e) {
          reportError("persistence", e.code(), e.what());
        } catch (const std::exception& e) {
          reportError("persistence", "persistence-failed", e.what());
        }
        it = pendingSaves_.erase(it);
      }
    }

    bool SessionCoordinator::waitForPersistence(std::chrono::milliseconds timeout) {
      const auto deadline = std::chrono::steady_clock::now() + timeout;
      for (auto& f : pendingSaves_)
        if (f.valid())
          f.wait_until(deadline);
      collectFinishedSaves();
      return pendingSaves_.empty();
    }

    void SessionCoordinator::reportError(const std::string& domain, const std::string& code,
                                         const std::string& message) {
      log(LogLevel::Error, domain + " error [" + code + "]: " + message);
      errors_->notifyFailure("[" + domain + "] " + code + ": " + message);
      notify(ErrorRaised{ domain, code, message });
    }

    void SessionCoordinator::notify(const Notification& n) {
      if (cb_)
        cb_(n);
    }

    void SessionCoordinator::log(LogLevel level, const std::string& message) const {
      if (logger_)
        logger_->log(level, "SessionCoordinator", message);
    }

  } // namespace core
} // namespace cardia
