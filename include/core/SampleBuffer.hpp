#pragma once
/** @file  SampleBuffer.hpp
 *  @brief Bounded accumulation of ECG samples with running heart-rate estimate.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <deque>
#include <vector>

namespace cardia {
  namespace core {

    /**
 * @class SampleBuffer
 * @brief Two views over one capture:
 *
 *  * the *record* keeps every sample from the start of the capture up to
 *    `recordCapacity`; later samples are counted as dropped, retained ones are
 *    never overwritten;
 *  * the *display window* keeps the newest `displayCapacity` samples.
 *
 * Heart rate is re-estimated after every append from the newest
 * `heartRateWindow` samples: local maxima above mean + 0.2·|mean|, separated by
 * a 250 ms refractory gap, BPM = 60·fs / mean peak interval, clamped to
 * [40, 200]. Until that is possible the estimate is `kNoHeartRate`.
 *
 * Single-owner: not thread-safe.
 */
    class SampleBuffer {
    public:
      static constexpr double kNoHeartRate = 0.0;
      static constexpr std::size_t kMinSamplesForHeartRate = 20;
      static constexpr double kMinBpm = 40.0;
      static constexpr double kMaxBpm = 200.0;
      static constexpr double kRefractorySeconds = 0.25;

      struct Limits {
        unsigned sampleRateHz{ 250 };
        std::size_t recordCapacity{ 150000 };
        std::size_t displayCapacity{ 5000 };
        std::size_t heartRateWindow{ 750 };
        std::size_t heartRateHistory{ 100 };
      };

      explicit SampleBuffer(Limits limits);

      /// Append in arrival order; returns how many samples entered the record.
      std::size_t append(const double* samples, std::size_t n);
      std::size_t append(const std::vector<double>& samples) { return append(samples.data(), samples.size()); }

      double currentHeartRate() const { return heartRate_; }

      void reset();

      std::size_t size() const { return record_.size(); }
      std::size_t dropped() const { return dropped_; }
      const std::vector<double>& record() const { return record_; }
      const std::deque<double>& displayWindow() const { return display_; }
      const std::vector<double>& heartRateSeries() const { return heartRates_; }
      const std::deque<double>& recentHeartRates() const { return recentHeartRates_; }
      const Limits& limits() const { return limits_; }

      /// Move the record and BPM series out (for sealing) and reset.
      void takeCapture(std::vector<double>& samples, std::vector<double>& heartRates);

    private:
      double estimateHeartRate() const;

      Limits limits_;
      std::vector<double> record_;
      std::deque<double> display_;
      std::vector<double> heartRates_;
      std::deque<double> recentHeartRates_;
      std::size_t dropped_{ 0 };
      double heartRate_{ kNoHeartRate };
    };

  } // namespace core
} // namespace cardia
