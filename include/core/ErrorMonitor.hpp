#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace cardia {
  namespace core {

    /**
 * @class ErrorMonitor
 * @brief Transports, gateways and the coordinator call `notifyFailure()`; we
 *        call the registered escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the front end doesn’t get spammed.
 * * `reset()` forgets the de-dupe list (called when a new capture begins).
 */
    class ErrorMonitor {
    public:
      using Escalation = std::function<void(const std::string&)>;

      ErrorMonitor() = default;
      virtual ~ErrorMonitor() = default;

      /// Register a lambda that escalates a fault to the application layer.
      void registerEscalation(Escalation cb);

      /// Called by subsystems on fault; will forward to the escalation callback.
      virtual void notifyFailure(const std::string& message);

      void reset();

      /// Number of distinct failures seen since the last reset.
      std::size_t uniqueFailures() const;

    private:
      bool rememberIfNew(const std::string& message);

      Escalation escalation_{};
      std::vector<std::string> seen_; ///< de-dupe list
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace cardia
