/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault fan-in, escalation runs outside the lock
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Cardia headers
#include "core/ErrorMonitor.hpp"

namespace cardia {
  namespace core {

    void ErrorMonitor::registerEscalation(Escalation cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!rememberIfNew(message))
        return;

      Escalation cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        cb = escalation_;
      }
      if (cb)
        cb(message);
    }

    void ErrorMonitor::reset() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace cardia
