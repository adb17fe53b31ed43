#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by the coordinator, transports and gateways.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace cardia {
  namespace core {

    /**
 * @class CardiaError
 * @brief Runtime fault with a stable machine-readable code (e.g. "connection-failed").
 */
    class CardiaError : public std::runtime_error {
    public:
      CardiaError(const std::string& message, std::string code)
          : std::runtime_error(message), code_(std::move(code)) {}

      const std::string& code() const noexcept { return code_; }

    private:
      std::string code_;
    };

    enum class DeviceErrorKind { NotFound, ConnectionFailed, PermissionDenied, SignalPoor, ConnectionLost };

    inline const char* toString(DeviceErrorKind k) {
      switch (k) {
      case DeviceErrorKind::NotFound:
        return "not-found";
      case DeviceErrorKind::ConnectionFailed:
        return "connection-failed";
      case DeviceErrorKind::PermissionDenied:
        return "permission-denied";
      case DeviceErrorKind::SignalPoor:
        return "signal-poor";
      case DeviceErrorKind::ConnectionLost:
        return "connection-lost";
      default:
        return "unknown";
      }
    }

    class DeviceError : public CardiaError {
    public:
      DeviceError(DeviceErrorKind kind, const std::string& message)
          : CardiaError(message, toString(kind)), kind_(kind) {}

      DeviceErrorKind kind() const noexcept { return kind_; }

    private:
      DeviceErrorKind kind_;
    };

    class PersistenceError : public CardiaError {
    public:
      explicit PersistenceError(const std::string& message, std::string code = "persistence-failed")
          : CardiaError(message, std::move(code)) {}
    };

    enum class GatewayErrorKind { Timeout, MalformedResponse, RequestFailed };

    inline const char* toString(GatewayErrorKind k) {
      switch (k) {
      case GatewayErrorKind::Timeout:
        return "timeout";
      case GatewayErrorKind::MalformedResponse:
        return "malformed-response";
      case GatewayErrorKind::RequestFailed:
        return "request-failed";
      default:
        return "unknown";
      }
    }

    class GatewayError : public CardiaError {
    public:
      GatewayError(GatewayErrorKind kind, const std::string& message)
          : CardiaError(message, toString(kind)), kind_(kind) {}

      GatewayErrorKind kind() const noexcept { return kind_; }

    private:
      GatewayErrorKind kind_;
    };

    class ConfigError : public CardiaError {
    public:
      explicit ConfigError(const std::string& message) : CardiaError(message, "config-invalid") {}
    };

    /**
 * @class InvalidStateError
 * @brief Illegal transition request. A usage fault, not a runtime condition,
 *        hence `std::logic_error`.
 */
    class InvalidStateError : public std::logic_error {
    public:
      using std::logic_error::logic_error;
    };

  } // namespace core
} // namespace cardia
