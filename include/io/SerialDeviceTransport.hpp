#pragma once
/** @file  SerialDeviceTransport.hpp
 *  @brief DeviceTransport over a tty (USB CDC sensors, BLE-UART bridges, rfcomm).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "core/SessionConfig.hpp"
#include "io/DeviceTransport.hpp"
#include "io/SampleDecoder.hpp"
#include "io/SerialChannel.hpp"

namespace cardia {
  namespace core {
    class Logger;
  } // namespace core

  namespace io {

    /**
 * @class SerialDeviceTransport
 * @brief Scan lists /dev entries with the configured prefixes; the sensor
 *        streams one sample per line once the tty is open.
 *
 *  * Non-blocking: `poll()` is called periodically by the owner loop and
 *    emits at most one SamplesReceived batch per call.
 *  * Failures are reported as DeviceFault events, never thrown.
 */
    class SerialDeviceTransport : public DeviceTransport {
    public:
      static constexpr std::size_t kMaxLinesPerPoll = 1024;

      SerialDeviceTransport(const core::SessionConfig& cfg, std::shared_ptr<core::Logger> logger,
                            std::string devRoot = "/dev",
                            std::unique_ptr<SerialChannel> channel = nullptr);
      ~SerialDeviceTransport() override;

      void startScan() override;
      void stopScan() override {}
      void connect(const std::string& deviceId) override;
      void disconnect() override;

      /** Drain whatever the tty has buffered; call every ~10 ms. */
      void poll();

      bool connected() const { return channel_ && channel_->isOpen() && !deviceId_.empty(); }
      const std::string& deviceId() const { return deviceId_; }

    private:
      void log(core::LogLevel level, const std::string& msg) const;

      std::shared_ptr<core::Logger> logger_;
      std::string devRoot_;
      std::vector<std::string> prefixes_;
      unsigned baud_;
      std::unique_ptr<SerialChannel> channel_;
      SampleDecoder decoder_;
      std::string deviceId_{};
    };

  } // namespace io
} // namespace cardia
