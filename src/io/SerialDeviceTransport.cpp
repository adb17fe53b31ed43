/* @file SerialDeviceTransport.cpp
 * @brief tty discovery, open/close and line streaming for serial ECG sensors
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

// Linux headers
#include <errno.h>

// Cardia headers
#include "core/Logger.hpp"
#include "io/SerialDeviceTransport.hpp"

namespace fs = std::filesystem;

namespace cardia {
  namespace io {

    SerialDeviceTransport::SerialDeviceTransport(const core::SessionConfig& cfg,
                                                 std::shared_ptr<core::Logger> logger,
                                                 std::string devRoot,
                                                 std::unique_ptr<SerialChannel> channel)
        : logger_(std::move(logger)), devRoot_(std::move(devRoot)), prefixes_(cfg.serialPrefixes),
          baud_(cfg.serialBaud),
          channel_(channel ? std::move(channel) : std::make_unique<SerialChannel>()),
          decoder_(cfg.sampleEncoding, cfg.adcReference) {}

    SerialDeviceTransport::~SerialDeviceTransport() {
      if (channel_)
        channel_->close();
    }

    void SerialDeviceTransport::log(core::LogLevel level, const std::string& msg) const {
      if (logger_)
        logger_->log(level, "SerialDeviceTransport", msg);
    }

    void SerialDeviceTransport::startScan() {
      std::error_code ec;
      fs::directory_iterator it(devRoot_, ec);
      if (ec) {
        emit(DeviceFault{ core::DeviceErrorKind::NotFound,
                          "cannot list " + devRoot_ + ": " + ec.message() });
        return;
      }

      std::vector<DeviceInfo> found;
      for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        const bool match = std::any_of(prefixes_.begin(), prefixes_.end(),
                                       [&](const std::string& p) { return name.starts_with(p); });
        if (match)
          found.push_back(DeviceInfo{ entry.path().string(), name, "serial tty" });
      }
      std::sort(found.begin(), found.end(),
                [](const DeviceInfo& a, const DeviceInfo& b) { return a.id < b.id; });

      log(core::LogLevel::Debug, "scan found " + std::to_string(found.size()) + " tty device(s)");
      for (auto& dev : found)
        emit(DeviceDiscovered{ std::move(dev) });
    }

    void SerialDeviceTransport::connect(const std::string& deviceId) {
      if (connected())
        disconnect();

      emit(LinkChanged{ deviceId, LinkState::Connecting });

      std::error_code ec;
      if (!fs::exists(deviceId, ec)) {
        emit(DeviceFault{ core::DeviceErrorKind::NotFound, "no such device: " + deviceId });
        return;
      }

      auto speed = toSpeed(baud_);
      if (!speed) {
        emit(DeviceFault{ core::DeviceErrorKind::ConnectionFailed,
                          "unsupported baud rate " + std::to_string(baud_) });
        return;
      }

      if (!channel_->open(deviceId, *speed)) {
        const auto err = channel_->lastErrno();
        const auto kind = (err == EACCES || err == EPERM) ? core::DeviceErrorKind::PermissionDenied
                                                          : core::DeviceErrorKind::ConnectionFailed;
        emit(DeviceFault{ kind, deviceId + ": " + channel_->lastError() });
        return;
      }

      deviceId_ = deviceId;
      decoder_.resetCounters();
      log(core::LogLevel::Info, "opened " + deviceId);
      emit(LinkChanged{ deviceId, LinkState::Connected });
    }

    void SerialDeviceTransport::disconnect() {
      if (deviceId_.empty())
        return;
      channel_->close();
      const std::string id = std::exchange(deviceId_, std::string{});
      log(core::LogLevel::Info, "closed " + id);
      emit(LinkChanged{ id, LinkState::Disconnected });
    }

    void SerialDeviceTransport::poll() {
      if (deviceId_.empty())
        return;

      SamplesReceived batch;
      std::size_t good = 0;
      std::size_t bad = 0;
      for (std::size_t i = 0; i < kMaxLinesPerPoll; ++i) {
        auto line = channel_->readLine(std::chrono::milliseconds{ 0 });
        if (!line)
          break;
        const auto before = decoder_.rejected();
        if (auto v = decoder_.decodeLine(*line)) {
          batch.samples.push_back(*v);
          ++good;
        } else if (decoder_.rejected() != before) {
          ++bad;
        }
      }

      if (!batch.samples.empty())
        emit(batch);

      if (bad > good) {
        emit(DeviceFault{ core::DeviceErrorKind::SignalPoor,
                          std::to_string(bad) + " unreadable line(s) vs " + std::to_string(good) +
                              " sample(s) from " + deviceId_ });
      }

      if (!channel_->isOpen()) {
        const std::string id = std::exchange(deviceId_, std::string{});
        log(core::LogLevel::Warning, "link to " + id + " dropped");
        emit(LinkChanged{ id, LinkState::Disconnected });
      }
    }

  } // namespace io
} // namespace cardia
