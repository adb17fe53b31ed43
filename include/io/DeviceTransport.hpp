#pragma once
/** @file  DeviceTransport.hpp
 *  @brief Abstract event-emitting link to an ECG sensor.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "core/Errors.hpp"

namespace cardia {
  namespace io {

    struct DeviceInfo {
      std::string id;          ///< transport address (tty path, BLE MAC, ...)
      std::string name;        ///< advertised / display name
      std::string description; ///< free-form discovery metadata
    };

    // ─── events a transport emits (tagged union) ─────────────────────────────
    struct DeviceDiscovered {
      DeviceInfo device;
    };

    enum class LinkState { Connecting, Connected, Disconnected };

    struct LinkChanged {
      std::string deviceId;
      LinkState state{ LinkState::Disconnected };
    };

    struct SamplesReceived {
      std::vector<double> samples; ///< volts, arrival order
    };

    struct DeviceFault {
      core::DeviceErrorKind kind{ core::DeviceErrorKind::ConnectionFailed };
      std::string message;
    };

    using DeviceEvent = std::variant<DeviceDiscovered, LinkChanged, SamplesReceived, DeviceFault>;

    /**
 * @class DeviceTransport
 * @brief Commands go in synchronously, results come back as `DeviceEvent`s on
 *        the registered callback, possibly from another thread.
 *
 *  * Command methods may throw core::DeviceError for immediate failures.
 *  * Implementations must tolerate `disconnect()` while not connected.
 *  * `registerCallback()` blocks until an `emit()` in progress has returned, so
 *    after `registerCallback(nullptr)` the old callback is never entered again.
 *    A callback must not call `registerCallback()` itself.
 */
    class DeviceTransport {
    public:
      using Callback = std::function<void(const DeviceEvent&)>;

      virtual ~DeviceTransport() = default;

      virtual void startScan() = 0;
      virtual void stopScan() = 0;
      virtual void connect(const std::string& deviceId) = 0;
      virtual void disconnect() = 0;

      void registerCallback(Callback cb) {
        std::lock_guard<std::mutex> lock(cbMtx_);
        cb_ = std::move(cb);
      }

    protected:
      /** Derived classes call this for every event they produce, from any thread. */
      void emit(const DeviceEvent& e) {
        std::lock_guard<std::mutex> lock(cbMtx_);
        if (cb_)
          cb_(e);
      }

    private:
      std::mutex cbMtx_;
      Callback cb_{};
    };

  } // namespace io
} // namespace cardia
