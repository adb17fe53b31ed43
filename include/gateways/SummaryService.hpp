#pragma once
/** @file  SummaryService.hpp
 *  @brief Bounded-time wrapper around a SummaryGateway with canned fallback.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gateways/SummaryGateway.hpp"

namespace cardia {
  namespace core { // forward decls only
    class Logger;
    class ErrorMonitor;
  } // namespace core

  namespace gateways {

    /**
 * @class SummaryService
 * @brief Runs each gateway call on an async worker and waits at most
 *        `timeout`. Timeouts, GatewayErrors and failures to start a worker
 *        yield `fallbackSummary()`; callers never see an exception.
 *
 *  * A call that outlives its timeout keeps running; its result is discarded.
 *    Only those calls are retained, and each is dropped once it finishes.
 *  * The destructor waits for calls still running.
 */
    class SummaryService {
    public:
      SummaryService(std::shared_ptr<SummaryGateway> gateway, std::chrono::milliseconds timeout,
                     std::shared_ptr<core::Logger> logger = nullptr,
                     std::shared_ptr<core::ErrorMonitor> errors = nullptr);
      ~SummaryService();

      AiSummary summarize(const SessionStatistics& stats, const std::string& language);

      std::chrono::milliseconds timeout() const { return timeout_; }

      /// Timed-out calls whose gateway has not returned yet.
      std::size_t pendingCalls();

      SummaryService(const SummaryService&) = delete;
      SummaryService& operator=(const SummaryService&) = delete;

    private:
      AiSummary fallback(const std::string& why);
      void reapFinished();

      std::shared_ptr<SummaryGateway> gateway_;
      std::chrono::milliseconds timeout_;
      std::shared_ptr<core::Logger> logger_;
      std::shared_ptr<core::ErrorMonitor> errors_;
      std::mutex lateMtx_;
      std::vector<std::future<AiSummary>> late_;
    };

  } // namespace gateways
} // namespace cardia
