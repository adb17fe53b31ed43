#pragma once
/** @file  SummaryGateway.hpp
 *  @brief Abstract AI summary backend plus the request/response codec.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

#include "gateways/SessionStore.hpp"

namespace cardia {
  namespace gateways {

    /// Aggregated input for one summary request.
    struct SessionStatistics {
      std::vector<SessionSummary> sessions;
    };

    struct AiSummary {
      std::string summary;
      std::string observations;
      std::vector<std::string> suggestions;
      bool fallback{ false }; ///< true when this is the canned text
    };

    /**
 * @class SummaryGateway
 * @brief One blocking call per request; throws core::GatewayError on failure.
 *
 *  The HTTP client lives outside this repository; implementations use
 *  `buildAnalysisPrompt`, `buildRequestPayload` and `parseSummaryResponse`.
 */
    class SummaryGateway {
    public:
      virtual ~SummaryGateway() = default;

      virtual AiSummary summarize(const SessionStatistics& stats, const std::string& language) = 0;
    };

    //---codec helpers------------------------------------------------------------

    /// "en" → "English", "hi" → "Hindi (हिंदी)", ...; unknown codes → "English".
    std::string languageName(const std::string& code);

    /// Prompt text covering each session and the trend across them.
    std::string buildAnalysisPrompt(const SessionStatistics& stats, const std::string& language);

    /// generateContent body: prompt, system instruction and response schema.
    nlohmann::json buildRequestPayload(const std::string& prompt);

    /// Decode a generateContent response body. Throws GatewayError(MalformedResponse).
    AiSummary parseSummaryResponse(const std::string& body);

    /// The static text shown when the backend is unavailable.
    AiSummary fallbackSummary();

  } // namespace gateways
} // namespace cardia
