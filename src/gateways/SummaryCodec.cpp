/* @file SummaryCodec.cpp
 * @brief prompt building and response decoding for the AI summary backend
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

// third-party headers
#include <nlohmann/json.hpp>

// Cardia headers
#include "core/Errors.hpp"
#include "core/Session.hpp"
#include "gateways/SummaryGateway.hpp"

using nlohmann::json;

namespace cardia {
  namespace gateways {

    namespace {

      std::string isoDate(std::chrono::system_clock::time_point tp) {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream os;
        os << std::put_time(&tm, "%Y-%m-%d");
        return os.str();
      }

      std::string sessionBlock(const SessionSummary& s, std::size_t index) {
        std::ostringstream os;
        os << "Session " << index << " (" << isoDate(s.timestamp) << "):\n"
           << "- Heart Rate: " << std::lround(s.avgBpm) << " bpm (Range: " << std::lround(s.minBpm) << '-'
           << std::lround(s.maxBpm) << ")\n"
           << "- Rhythm: " << s.rhythm << '\n'
           << "- Status: " << s.status << '\n'
           << "- Duration: " << s.durationSeconds << "s\n"
           << "- Data Points: " << s.sampleCount << " samples\n"
           << "- Quality: " << core::assessQuality(s.avgBpm, s.durationSeconds, s.sampleCount) << '\n';
        return os.str();
      }

      std::string trendAnalysis(std::vector<SessionSummary> sessions) {
        if (sessions.size() < 2)
          return "Trend analysis requires at least 2 ECG sessions for comparison.";

        std::sort(sessions.begin(), sessions.end(),
                  [](const SessionSummary& a, const SessionSummary& b) { return a.timestamp < b.timestamp; });

        const double first = sessions.front().avgBpm;
        const double last = sessions.back().avgBpm;
        std::ostringstream os;
        os << "Overall Trends:\n";
        if (first > 0.0) {
          const double change = (last - first) / first * 100.0;
          os << "• Heart rate change: " << (change >= 0.0 ? "+" : "") << std::fixed << std::setprecision(1)
             << change << "%\n";
        } else {
          os << "• Heart rate change: n/a\n";
        }
        os << "• Sessions analyzed: " << sessions.size() << '\n'
           << "• Time span: " << isoDate(sessions.front().timestamp) << " to "
           << isoDate(sessions.back().timestamp) << '\n';
        return os.str();
      }

    } // namespace

    std::string languageName(const std::string& code) {
      static const std::map<std::string, std::string> kNames{
        { "en", "English" },
        { "hi", "Hindi (हिंदी)" },
        { "ta", "Tamil (தமிழ்)" },
        { "te", "Telugu (తెలుగు)" },
        { "ml", "Malayalam (മലയാളം)" },
        { "kn", "Kannada (ಕನ್ನಡ)" },
        { "bn", "Bengali (বাংলা)" },
        { "gu", "Gujarati (ગુજરાતી)" },
        { "mr", "Marathi (मराठी)" },
        { "pa", "Punjabi (ਪੰਜਾਬੀ)" },
      };
      auto it = kNames.find(code);
      return it == kNames.end() ? "English" : it->second;
    }

    std::string buildAnalysisPrompt(const SessionStatistics& stats, const std::string& language) {
      const std::string lang = languageName(language);

      std::ostringstream data;
      if (stats.sessions.empty()) {
        data << "No ECG data available";
      } else {
        const auto n = stats.sessions.size();
        data << "Patient ECG Analysis (" << n << " session" << (n > 1 ? "s" : "") << "):\n\n";
        for (std::size_t i = 0; i < n; ++i)
          data << sessionBlock(stats.sessions[i], i + 1) << '\n';
        data << "Historical Trends:\n" << trendAnalysis(stats.sessions);
      }

      std::ostringstream os;
      os << "Analyze the following ECG data for a patient: " << data.str() << ".\n\n"
         << "IMPORTANT: Respond in " << lang
         << " language. If the language is not English, provide the response completely in that language.\n\n"
         << "Provide a comprehensive analysis including:\n"
         << "1. A concise summary of the ECG findings\n"
         << "2. Any potential observations or areas of interest\n"
         << "3. Three specific, actionable lifestyle suggestions for heart health\n\n"
         << "Format your response as a JSON object with the keys \"summary\", \"observations\" (strings in "
         << lang << ") and \"suggestions\" (array of three strings in " << lang << ").\n";
      return os.str();
    }

    json buildRequestPayload(const std::string& prompt) {
      return json{
        { "contents", json::array({ { { "parts", json::array({ { { "text", prompt } } }) } } }) },
        { "systemInstruction",
          { { "parts", json::array({ { { "text",
                                         "You are a helpful AI assistant specializing in ECG analysis. Always "
                                         "provide medically accurate information but include appropriate "
                                         "disclaimers. Format your response as a JSON object." } } }) } } },
        { "generationConfig",
          { { "responseMimeType", "application/json" },
            { "responseSchema",
              { { "type", "OBJECT" },
                { "properties",
                  { { "summary", { { "type", "STRING" } } },
                    { "observations", { { "type", "STRING" } } },
                    { "suggestions", { { "type", "ARRAY" }, { "items", { { "type", "STRING" } } } } } } },
                { "required", json::array({ "summary", "observations", "suggestions" }) } } } } },
      };
    }

    AiSummary parseSummaryResponse(const std::string& body) {
      auto malformed = [](const std::string& why) {
        return core::GatewayError(core::GatewayErrorKind::MalformedResponse, "[SummaryGateway] " + why);
      };

      json envelope = json::parse(body, nullptr, false);
      if (envelope.is_discarded())
        throw malformed("response body is not JSON");

      const json* text = nullptr;
      try {
        text = &envelope.at("candidates").at(0).at("content").at("parts").at(0).at("text");
      } catch (const json::exception&) {
        throw malformed("response has no candidates[0].content.parts[0].text");
      }
      if (!text->is_string())
        throw malformed("candidate text is not a string");

      json inner = json::parse(text->get<std::string>(), nullptr, false);
      if (inner.is_discarded() || !inner.is_object())
        throw malformed("candidate text is not a JSON object");

      AiSummary out;
      try {
        out.summary = inner.at("summary").get<std::string>();
        out.observations = inner.at("observations").get<std::string>();
        out.suggestions = inner.at("suggestions").get<std::vector<std::string>>();
      } catch (const json::exception& e) {
        throw malformed(std::string("summary object incomplete: ") + e.what());
      }
      return out;
    }

    AiSummary fallbackSummary() {
      AiSummary s;
      s.summary = "Based on the available ECG data, the analysis shows normal sinus rhythm with heart rate "
                  "within normal parameters.";
      s.observations = "The ECG demonstrates regular cardiac rhythm with consistent intervals. Heart rate "
                       "variability appears normal for the recorded duration.";
      s.suggestions = {
        "Maintain regular cardiovascular exercise for 30 minutes daily",
        "Follow a heart-healthy diet rich in omega-3 fatty acids and low in sodium",
        "Practice stress management techniques such as meditation or deep breathing exercises",
      };
      s.fallback = true;
      return s;
    }

  } // namespace gateways
} // namespace cardia
