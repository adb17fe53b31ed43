/* @file Session.cpp
 * @brief session sealing and heart-rate statistics
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iterator>
#include <numeric>

// Cardia headers
#include "core/Errors.hpp"
#include "core/Session.hpp"

namespace cardia {
  namespace core {

    namespace {
      constexpr double kBradycardiaBpm = 60.0;
      constexpr double kTachycardiaBpm = 100.0;

      SessionMetrics computeMetrics(const std::vector<double>& bpm) {
        SessionMetrics m;
        std::vector<double> valid;
        std::copy_if(bpm.begin(), bpm.end(), std::back_inserter(valid), [](double v) { return v > 0.0; });
        if (valid.empty())
          return m;

        m.avgBpm = std::accumulate(valid.begin(), valid.end(), 0.0) / static_cast<double>(valid.size());
        auto [lo, hi] = std::minmax_element(valid.begin(), valid.end());
        m.minBpm = *lo;
        m.maxBpm = *hi;
        return m;
      }
    } // namespace

    std::string SessionMetrics::heartRateStatus() const {
      if (avgBpm < kBradycardiaBpm)
        return "Bradycardia";
      if (avgBpm > kTachycardiaBpm)
        return "Tachycardia";
      return "Normal";
    }

    std::string SessionMetrics::overallAssessment(const std::string& rhythm) const {
      std::vector<std::string> findings;
      if (avgBpm < kBradycardiaBpm)
        findings.emplace_back("Bradycardia");
      if (avgBpm > kTachycardiaBpm)
        findings.emplace_back("Tachycardia");
      if (rhythm.find("Normal") == std::string::npos)
        findings.emplace_back("Abnormal rhythm");

      if (findings.empty())
        return "Normal ECG";

      std::string out = "Abnormal ECG: ";
      for (std::size_t i = 0; i < findings.size(); ++i) {
        if (i)
          out += ", ";
        out += findings[i];
      }
      return out;
    }

    std::string assessQuality(double avgBpm, long durationSeconds, std::size_t sampleCount) {
      if (durationSeconds < 10)
        return "Short duration";
      if (sampleCount < 100)
        return "Limited data";
      if (avgBpm < 50.0 || avgBpm > 120.0)
        return "Irregular heart rate detected";
      return "Good quality data";
    }

    Session::Session(std::string id, std::string userId, Clock::time_point startedAt,
                     unsigned sampleRateHz)
        : id_(std::move(id)), userId_(std::move(userId)), startedAt_(startedAt),
          sampleRateHz_(sampleRateHz) {}

    void Session::seal(std::vector<double> samples, std::vector<double> heartRates,
                       std::chrono::milliseconds duration, SessionOutcome outcome) {
      if (sealed_)
        throw InvalidStateError("[Session] " + id_ + " is already sealed");

      samples_ = std::move(samples);
      heartRates_ = std::move(heartRates);
      duration_ = duration;
      outcome_ = outcome;
      metrics_ = computeMetrics(heartRates_);
      sealed_ = true;
    }

  } // namespace core
} // namespace cardia
