/* @file SummaryService.cpp
 * @brief timeout + fallback policy for AI summaries
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <exception>
#include <stdexcept>

// Cardia headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "gateways/SummaryService.hpp"

namespace cardia {
  namespace gateways {

    SummaryService::SummaryService(std::shared_ptr<SummaryGateway> gateway, std::chrono::milliseconds timeout,
                                   std::shared_ptr<core::Logger> logger,
                                   std::shared_ptr<core::ErrorMonitor> errors)
        : gateway_(std::move(gateway)), timeout_(timeout), logger_(std::move(logger)),
          errors_(std::move(errors)) {
      if (!gateway_)
        throw std::invalid_argument("[SummaryService] gateway is nullptr");
    }

    SummaryService::~SummaryService() {
      std::lock_guard<std::mutex> lock(lateMtx_);
      late_.clear(); // async futures block until their call returns
    }

    void SummaryService::reapFinished() {
      std::lock_guard<std::mutex> lock(lateMtx_);
      late_.erase(std::remove_if(late_.begin(), late_.end(),
                                 [](const std::future<AiSummary>& f) {
                                   return f.wait_for(std::chrono::seconds{ 0 }) == std::future_status::ready;
                                 }),
                  late_.end());
    }

    std::size_t SummaryService::pendingCalls() {
      reapFinished();
      std::lock_guard<std::mutex> lock(lateMtx_);
      return late_.size();
    }

    AiSummary SummaryService::fallback(const std::string& why) {
      if (logger_)
        logger_->log(core::LogLevel::Warning, "SummaryService", "using fallback summary: " + why);
      if (errors_)
        errors_->notifyFailure("[SummaryService] " + why);
      return fallbackSummary();
    }

    AiSummary SummaryService::summarize(const SessionStatistics& stats, const std::string& language) {
      reapFinished();

      std::future<AiSummary> result;
      try {
        result = std::async(std::launch::async,
                            [gateway = gateway_, stats, language] { return gateway->summarize(stats, language); });
      } catch (const std::exception& e) {
        return fallback(std::string("could not start gateway call: ") + e.what());
      }

      if (result.wait_for(timeout_) != std::future_status::ready) {
        {
          std::lock_guard<std::mutex> lock(lateMtx_);
          late_.push_back(std::move(result));
        }
        return fallback("gateway did not answer within " + std::to_string(timeout_.count()) + " ms");
      }

      try {
        AiSummary summary = result.get();
        summary.fallback = false;
        return summary;
      } catch (const core::GatewayError& e) {
        return fallback(std::string(core::toString(e.kind())) + ": " + e.what());
      } catch (const std::exception& e) {
        return fallback(std::string("gateway failure: ") + e.what());
      }
    }

  } // namespace gateways
} // namespace cardia
