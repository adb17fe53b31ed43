#pragma once
/** @file  RhythmAnalysis.hpp
 *  @brief R-peak detection and RR-interval (HRV) metrics.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <vector>

namespace cardia {
  namespace core {

    /// Smallest and largest RR interval accepted as a beat-to-beat interval.
    constexpr double kMinRrMs = 250.0;
    constexpr double kMaxRrMs = 2000.0;

    /**
 * @brief Indices of R peaks in `x[0..n)`.
 *
 * A peak is a local maximum above mean + 0.2·|mean| of the span. Peaks closer
 * than `refractorySeconds` belong to the same beat; the taller one is kept.
 */
    std::vector<std::size_t> detectPeaks(const double* x, std::size_t n, unsigned sampleRateHz,
                                         double refractorySeconds = 0.25);

    /**
 * @struct RhythmMetrics
 * @brief Time-domain beat statistics over one span of samples.
 *
 * Intervals outside [kMinRrMs, kMaxRrMs] are dropped before any statistic is
 * taken. Every field is 0 when too few intervals remain for it.
 */
    struct RhythmMetrics {
      double bpm{ 0.0 };
      std::vector<double> rrMs;    ///< accepted intervals, in order
      double meanRrMs{ 0.0 };
      double sdnn{ 0.0 };          ///< needs 2 intervals
      double rmssd{ 0.0 };         ///< needs 2 intervals
      double pnn50{ 0.0 };         ///< percent of successive changes > 50 ms
      double cv{ 0.0 };            ///< sdnn / meanRrMs
      double irregularRatio{ 0.0 }; ///< share of successive changes > 20 % of meanRrMs; needs 3 intervals
    };

    RhythmMetrics analyzeRhythm(const std::vector<std::size_t>& peaks, unsigned sampleRateHz);

  } // namespace core
} // namespace cardia
