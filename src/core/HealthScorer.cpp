/* @file HealthScorer.cpp
 * @brief component scores, weighting and insight text
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <ctime>
#include <numeric>

// Cardia headers
#include "core/HealthScorer.hpp"

namespace cardia {
  namespace core {

    namespace {
      constexpr double kFlatSignal = 1e-9;
      constexpr double kNoNoiseSnrDb = 50.0;

      double clampScore(double v) { return std::clamp(v, 0.0, 100.0); }

      std::size_t samplesFor(double seconds, unsigned sampleRateHz) {
        return std::max<std::size_t>(1, static_cast<std::size_t>(std::lround(seconds * sampleRateHz)));
      }

      /// Samples around `peak` above half its height over `base`.
      std::size_t halfHeightWidth(const std::vector<double>& x, std::size_t peak, double base) {
        const double half = base + 0.5 * (x[peak] - base);
        std::size_t lo = peak;
        while (lo > 0 && x[lo] > half)
          --lo;
        std::size_t hi = peak;
        while (hi + 1 < x.size() && x[hi] > half)
          ++hi;
        return hi - lo;
      }

      std::vector<std::string> insightsFor(const HealthScore& s, std::chrono::system_clock::time_point at) {
        std::vector<std::string> out;
        switch (s.status) {
        case HealthStatus::Excellent:
          out.emplace_back("Excellent cardiac health! Your heart is performing optimally.");
          break;
        case HealthStatus::Good:
          out.emplace_back("Good heart health with room for minor improvements.");
          break;
        case HealthStatus::Fair:
          out.emplace_back("Fair cardiac condition. Consider lifestyle adjustments.");
          break;
        case HealthStatus::Poor:
          out.emplace_back("Below optimal heart health. Monitor closely and consult healthcare provider.");
          break;
        case HealthStatus::Critical:
          out.emplace_back("Critical: Significant cardiac irregularities detected. Seek immediate medical attention.");
          break;
        }

        if (s.cardiac < 70.0)
          out.emplace_back("Cardiac function needs attention. Consider cardio exercise and stress management.");
        if (s.rhythm < 75.0)
          out.emplace_back("Irregular rhythm detected. Avoid caffeine and ensure adequate rest.");
        if (s.signal < 60.0)
          out.emplace_back("Poor signal quality. Check electrode placement and reduce movement.");
        if (s.trend < 70.0)
          out.emplace_back("Declining trend detected. Recent readings show concerning patterns.");

        const std::time_t t = std::chrono::system_clock::to_time_t(at);
        std::tm local{};
        if (localtime_r(&t, &local)) {
          if (local.tm_hour >= 22 || local.tm_hour < 6)
            out.emplace_back("Nighttime reading. Heart rate naturally lower during rest.");
          else if (local.tm_hour <= 10)
            out.emplace_back("Morning reading. Heart rate may be elevated due to cortisol awakening response.");
        }
        return out;
      }
    } // namespace

    HealthStatus healthStatusFor(double overall) {
      if (overall >= 90.0)
        return HealthStatus::Excellent;
      if (overall >= 80.0)
        return HealthStatus::Good;
      if (overall >= 70.0)
        return HealthStatus::Fair;
      if (overall >= 60.0)
        return HealthStatus::Poor;
      return HealthStatus::Critical;
    }

    HealthScorer::HealthScorer(Options options) : options_(options) {
      if (options_.sampleRateHz == 0)
        options_.sampleRateHz = 1;
    }

    SignalBaseline HealthScorer::baselineOf(const std::vector<double>& window) {
      SignalBaseline b;
      if (window.empty())
        return b;
      const auto n = static_cast<double>(window.size());
      double absSum = 0.0;
      for (double x : window)
        absSum += std::fabs(x);
      b.meanAmplitude = absSum / n;

      const double mean = std::accumulate(window.begin(), window.end(), 0.0) / n;
      double acc = 0.0;
      for (double x : window)
        acc += (x - mean) * (x - mean);
      b.variability = std::sqrt(acc / n);
      return b;
    }

    HealthScore HealthScorer::score(const std::vector<double>& window, const std::vector<HistoryEntry>& history,
                                    std::chrono::system_clock::time_point at,
                                    const SignalBaseline* baseline) const {
      HealthScore s;
      const auto peaks = detectPeaks(window.data(), window.size(), options_.sampleRateHz);
      s.rhythmMetrics = analyzeRhythm(peaks, options_.sampleRateHz);

      s.cardiac = cardiacHealth(window, peaks, s.rhythmMetrics);
      s.rhythm = window.empty() ? 50.0 : rhythmStability(s.rhythmMetrics);
      s.signal = signalQuality(window, &s.snrDb);
      s.trend = trendScore(history, at);
      s.baseline = baselineScore(window, baseline);

      s.overall = s.cardiac * kWeightCardiac + s.rhythm * kWeightRhythm + s.signal * kWeightSignal +
                  s.trend * kWeightTrend + s.baseline * kWeightBaseline;
      s.status = healthStatusFor(s.overall);
      s.insights = insightsFor(s, at);
      return s;
    }

    double HealthScorer::cardiacHealth(const std::vector<double>& window, const std::vector<std::size_t>& peaks,
                                       const RhythmMetrics& rhythm) const {
      if (window.empty())
        return 50.0;

      double score = 100.0;
      if (rhythm.rrMs.empty()) {
        if (window.size() >= 2 * static_cast<std::size_t>(options_.sampleRateHz))
          return 25.0; // two seconds without a beat
      } else {
        const double target = 60.0 + 0.1 * options_.userAge;
        if (rhythm.bpm < target - 10.0 || rhythm.bpm > target + 20.0)
          score -= 15.0;

        if (rhythm.rrMs.size() >= 2) {
          const double expectedRmssd = std::max(10.0, 50.0 - 0.5 * options_.userAge);
          const double hrv = clampScore(rhythm.rmssd / expectedRmssd * 100.0);
          score = (score + hrv) / 2.0;
        }
      }

      double qrs = 50.0;
      if (!peaks.empty()) {
        qrs = 100.0;
        const double base = std::accumulate(window.begin(), window.end(), 0.0) / static_cast<double>(window.size());
        const std::size_t maxWidth = samplesFor(0.12, options_.sampleRateHz);
        for (std::size_t p : peaks) {
          if (p < maxWidth || p + maxWidth >= window.size())
            continue; // complex cut by the window edge
          if (halfHeightWidth(window, p, base) > maxWidth)
            qrs -= 10.0;
        }
        qrs = std::max(0.0, qrs);
      }
      return clampScore((score + qrs) / 2.0);
    }

    double HealthScorer::rhythmStability(const RhythmMetrics& rhythm) {
      if (rhythm.rrMs.size() < 2)
        return 75.0;

      const double regularity = 100.0 - rhythm.cv * 1000.0;
      double arrhythmia = 100.0;
      if (rhythm.rrMs.size() >= 3) {
        if (rhythm.irregularRatio > 0.3)
          arrhythmia -= 30.0;
        else if (rhythm.irregularRatio > 0.15)
          arrhythmia -= 15.0;
      }
      return clampScore((regularity + arrhythmia) / 2.0);
    }

    double HealthScorer::signalQuality(const std::vector<double>& window, double* snrDb) const {
      if (snrDb)
        *snrDb = 0.0;
      if (window.size() < 2 || baselineOf(window).variability < kFlatSignal)
        return 0.0;

      const auto n = static_cast<double>(window.size());
      double signalPower = 0.0;
      double absSum = 0.0;
      for (double x : window) {
        signalPower += x * x;
        absSum += std::fabs(x);
      }
      signalPower /= n;
      const double avgAbs = absSum / n;

      double noisePower = 0.0;
      std::size_t artifacts = 0;
      for (std::size_t i = 1; i < window.size(); ++i) {
        const double d = window[i] - window[i - 1];
        noisePower += d * d;
        if (std::fabs(d) > 2.0 * avgAbs)
          ++artifacts;
      }
      noisePower /= n - 1.0;

      const double snr = noisePower > 0.0 ? 10.0 * std::log10(signalPower / noisePower) : kNoNoiseSnrDb;
      if (snrDb)
        *snrDb = snr;

      double quality = 100.0;
      if (snr < 10.0)
        quality -= 30.0;
      else if (snr < 20.0)
        quality -= 15.0;

      // baseline wander: largest step between means of consecutive 0.4 s blocks
      const std::size_t block = samplesFor(0.4, options_.sampleRateHz);
      double stability = 100.0;
      if (window.size() >= 2 * block) {
        double prev = 0.0;
        double maxDrift = 0.0;
        for (std::size_t i = 0; i + block <= window.size(); i += block) {
          const double m = std::accumulate(window.begin() + static_cast<std::ptrdiff_t>(i),
                                           window.begin() + static_cast<std::ptrdiff_t>(i + block), 0.0) /
                           static_cast<double>(block);
          if (i > 0)
            maxDrift = std::max(maxDrift, std::fabs(m - prev));
          prev = m;
        }
        stability = std::max(0.0, 100.0 - maxDrift * 100.0);
      }
      quality = (quality + stability) / 2.0;

      const double artifactScore = std::max(0.0, 100.0 - static_cast<double>(artifacts) / n * 200.0);
      quality = (quality + artifactScore) / 2.0;
      return clampScore(quality);
    }

    double HealthScorer::trendScore(const std::vector<HistoryEntry>& history,
                                    std::chrono::system_clock::time_point at) {
      if (history.size() < 3)
        return 75.0;

      const auto week = std::chrono::hours{ 24 * 7 };
      const auto month = std::chrono::hours{ 24 * 30 };
      double weekSum = 0.0;
      double monthSum = 0.0;
      std::size_t weekCount = 0;
      std::size_t monthCount = 0;
      std::size_t weekAbnormal = 0;
      for (const auto& e : history) {
        const auto age = at - e.timestamp;
        if (age <= month) {
          monthSum += e.avgBpm;
          ++monthCount;
        }
        if (age <= week) {
          weekSum += e.avgBpm;
          ++weekCount;
          if (!e.normal)
            ++weekAbnormal;
        }
      }

      double score = 100.0;
      if (weekCount >= 3) {
        const double recent = weekSum / static_cast<double>(weekCount);
        const double longer = monthSum / static_cast<double>(monthCount);
        if (longer > 0.0 && std::fabs(recent - longer) / longer > 0.15)
          score -= 20.0;
      }
      if (static_cast<double>(weekAbnormal) > 0.3 * static_cast<double>(weekCount))
        score -= 25.0;
      return clampScore(score);
    }

    double HealthScorer::baselineScore(const std::vector<double>& window, const SignalBaseline* baseline) {
      if (window.empty())
        return 50.0;
      if (!baseline || baseline->meanAmplitude <= 0.0)
        return 75.0;

      const auto now = baselineOf(window);
      double score = 100.0;
      const double ampDev = std::fabs(now.meanAmplitude - baseline->meanAmplitude) / baseline->meanAmplitude;
      if (ampDev > 0.3)
        score -= 25.0;
      else if (ampDev > 0.15)
        score -= 10.0;

      if (baseline->variability > 0.0) {
        const double varDev = std::fabs(now.variability - baseline->variability) / baseline->variability;
        if (varDev > 0.5)
          score -= 20.0;
        else if (varDev > 0.25)
          score -= 10.0;
      }
      return clampScore(score);
    }

  } // namespace core
} // namespace cardia
