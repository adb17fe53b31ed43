#pragma once
/** @file  HealthScorer.hpp
 *  @brief Live 0–100 health score computed from the recent ECG window.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>
#include <vector>

#include "core/RhythmAnalysis.hpp"

namespace cardia {
  namespace core {

    enum class HealthStatus { Excellent, Good, Fair, Poor, Critical };

    inline const char* toString(HealthStatus s) {
      switch (s) {
      case HealthStatus::Excellent:
        return "Excellent";
      case HealthStatus::Good:
        return "Good";
      case HealthStatus::Fair:
        return "Fair";
      case HealthStatus::Poor:
        return "Poor";
      case HealthStatus::Critical:
        return "Critical";
      }
      return "?";
    }

    /// >= 90 Excellent, >= 80 Good, >= 70 Fair, >= 60 Poor, else Critical.
    HealthStatus healthStatusFor(double overall);

    /// Reference level of the wearer's own signal, taken from an earlier window.
    struct SignalBaseline {
      double meanAmplitude{ 0.0 }; ///< mean |x|
      double variability{ 0.0 };   ///< standard deviation
    };

    /// One earlier session, as far as trend scoring needs it.
    struct HistoryEntry {
      std::chrono::system_clock::time_point timestamp{};
      double avgBpm{ 0.0 };
      bool normal{ true };
    };

    struct HealthScore {
      double cardiac{ 0.0 };  ///< heart rate, HRV and QRS width
      double rhythm{ 0.0 };   ///< RR regularity and arrhythmia screen
      double signal{ 0.0 };   ///< SNR, baseline wander, artifacts
      double trend{ 0.0 };    ///< recent sessions against the last 30 days
      double baseline{ 0.0 }; ///< amplitude and variability against SignalBaseline
      double overall{ 0.0 };
      HealthStatus status{ HealthStatus::Critical };
      RhythmMetrics rhythmMetrics{};
      double snrDb{ 0.0 };
      std::vector<std::string> insights;
    };

    /**
 * @class HealthScorer
 * @brief Stateless scorer; `score()` may be called on every new window.
 *
 *  overall = 0.40·cardiac + 0.25·rhythm + 0.15·signal + 0.10·trend + 0.10·baseline
 *
 *  * An empty window scores cardiac 50, rhythm 50, signal 0, baseline 50.
 *  * A window of at least 2 s in which fewer than two beats are found scores
 *    cardiac 25; a flat window scores signal 0.
 *  * Fewer than 3 history entries score trend 75; no baseline scores 75.
 */
    class HealthScorer {
    public:
      struct Options {
        unsigned sampleRateHz{ 250 };
        unsigned userAge{ 30 };
      };

      static constexpr double kWeightCardiac = 0.40;
      static constexpr double kWeightRhythm = 0.25;
      static constexpr double kWeightSignal = 0.15;
      static constexpr double kWeightTrend = 0.10;
      static constexpr double kWeightBaseline = 0.10;

      explicit HealthScorer(Options options);

      HealthScore score(const std::vector<double>& window, const std::vector<HistoryEntry>& history,
                        std::chrono::system_clock::time_point at, const SignalBaseline* baseline = nullptr) const;

      static SignalBaseline baselineOf(const std::vector<double>& window);

      double cardiacHealth(const std::vector<double>& window, const std::vector<std::size_t>& peaks,
                           const RhythmMetrics& rhythm) const;
      static double rhythmStability(const RhythmMetrics& rhythm);
      double signalQuality(const std::vector<double>& window, double* snrDb = nullptr) const;
      static double trendScore(const std::vector<HistoryEntry>& history, std::chrono::system_clock::time_point at);
      static double baselineScore(const std::vector<double>& window, const SignalBaseline* baseline);

      const Options& options() const { return options_; }

    private:
      Options options_;
    };

  } // namespace core
} // namespace cardia
