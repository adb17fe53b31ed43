#pragma once
/** @file  Timer.hpp
 *  @brief Deadline holder polled by the owner loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>

namespace cardia {
  namespace core {

    /**
 * @class OneShotTimer
 * @brief No thread, no callback: the owner asks `due(now)` from its poll loop.
 *        `cancel()` guarantees the deadline can no longer fire.
 */
    class OneShotTimer {
    public:
      void arm(std::chrono::milliseconds at) { deadline_ = at; }
      void cancel() { deadline_.reset(); }

      bool armed() const { return deadline_.has_value(); }
      bool due(std::chrono::milliseconds now) const { return deadline_ && now >= *deadline_; }

      /// Only meaningful while armed.
      std::chrono::milliseconds deadline() const { return deadline_.value_or(std::chrono::milliseconds{ 0 }); }

      /// Disarm and return the deadline that was due.
      std::chrono::milliseconds take() {
        const auto at = deadline();
        deadline_.reset();
        return at;
      }

    private:
      std::optional<std::chrono::milliseconds> deadline_{};
    };

  } // namespace core
} // namespace cardia
