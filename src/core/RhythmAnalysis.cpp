/* @file RhythmAnalysis.cpp
 * @brief peak picking and RR statistics
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <numeric>

// Cardia headers
#include "core/RhythmAnalysis.hpp"

namespace cardia {
  namespace core {

    namespace {
      double mean(const std::vector<double>& v) {
        return v.empty() ? 0.0 : std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
      }

      double stdDev(const std::vector<double>& v) {
        if (v.size() < 2)
          return 0.0;
        const double m = mean(v);
        double acc = 0.0;
        for (double x : v)
          acc += (x - m) * (x - m);
        return std::sqrt(acc / static_cast<double>(v.size()));
      }
    } // namespace

    std::vector<std::size_t> detectPeaks(const double* x, std::size_t n, unsigned sampleRateHz,
                                         double refractorySeconds) {
      std::vector<std::size_t> peaks;
      if (!x || n < 3)
        return peaks;

      const double m = std::accumulate(x, x + n, 0.0) / static_cast<double>(n);
      const double threshold = m + 0.2 * std::fabs(m);
      const auto refractory = static_cast<std::size_t>(std::lround(refractorySeconds * sampleRateHz));

      for (std::size_t i = 1; i + 1 < n; ++i) {
        if (x[i] <= threshold || x[i] <= x[i - 1] || x[i] < x[i + 1])
          continue;
        if (!peaks.empty() && i - peaks.back() < refractory) {
          if (x[i] > x[peaks.back()])
            peaks.back() = i; // taller peak inside the same beat
          continue;
        }
        peaks.push_back(i);
      }
      return peaks;
    }

    RhythmMetrics analyzeRhythm(const std::vector<std::size_t>& peaks, unsigned sampleRateHz) {
      RhythmMetrics m;
      if (sampleRateHz == 0)
        return m;

      for (std::size_t i = 1; i < peaks.size(); ++i) {
        const double rr = static_cast<double>(peaks[i] - peaks[i - 1]) * 1000.0 / sampleRateHz;
        if (rr >= kMinRrMs && rr <= kMaxRrMs)
          m.rrMs.push_back(rr);
      }
      if (m.rrMs.empty())
        return m;

      m.meanRrMs = mean(m.rrMs);
      m.bpm = 60000.0 / m.meanRrMs;
      if (m.rrMs.size() < 2)
        return m;

      m.sdnn = stdDev(m.rrMs);
      m.cv = m.sdnn / m.meanRrMs;

      double sumsq = 0.0;
      std::size_t over50 = 0;
      std::size_t irregular = 0;
      for (std::size_t i = 1; i < m.rrMs.size(); ++i) {
        const double d = m.rrMs[i] - m.rrMs[i - 1];
        sumsq += d * d;
        if (std::fabs(d) > 50.0)
          ++over50;
        if (std::fabs(d) > 0.2 * m.meanRrMs)
          ++irregular;
      }
      const auto diffs = static_cast<double>(m.rrMs.size() - 1);
      m.rmssd = std::sqrt(sumsq / diffs);
      m.pnn50 = 100.0 * static_cast<double>(over50) / diffs;
      if (m.rrMs.size() >= 3)
        m.irregularRatio = static_cast<double>(irregular) / static_cast<double>(m.rrMs.size());
      return m;
    }

  } // namespace core
} // namespace cardia
