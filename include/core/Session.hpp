#pragma once
/** @file  Session.hpp
 *  @brief One bounded ECG capture plus the metrics derived from it.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace cardia {
  namespace core {

    enum class SessionOutcome { Completed, Aborted };

    inline const char* toString(SessionOutcome o) {
      return o == SessionOutcome::Completed ? "completed" : "aborted";
    }

    /**
 * @struct SessionMetrics
 * @brief Heart-rate statistics over the non-zero part of the BPM series.
 */
    struct SessionMetrics {
      double avgBpm{ 0.0 };
      double minBpm{ 0.0 };
      double maxBpm{ 0.0 };

      /// "Bradycardia" (< 60), "Tachycardia" (> 100) or "Normal".
      std::string heartRateStatus() const;
      /// "Normal ECG" or "Abnormal ECG: <findings>".
      std::string overallAssessment(const std::string& rhythm) const;
    };

    /// Data-quality label used in reports and AI prompts.
    std::string assessQuality(double avgBpm, long durationSeconds, std::size_t sampleCount);

    /**
 * @class Session
 * @brief Opened when recording begins; sealed exactly once, after which it is
 *        immutable and may be shared (e.g. with a persistence gateway).
 *
 *  * Samples are handed over at seal time by the SampleBuffer that
 *    accumulated them.
 *  * Accessors for recorded data are meaningful only after `seal()`.
 */
    class Session {
    public:
      using Clock = std::chrono::system_clock;

      Session(std::string id, std::string userId, Clock::time_point startedAt, unsigned sampleRateHz);

      /// Freeze the capture. Throws InvalidStateError when already sealed.
      void seal(std::vector<double> samples, std::vector<double> heartRates,
                std::chrono::milliseconds duration, SessionOutcome outcome);

      bool sealed() const { return sealed_; }
      const std::string& id() const { return id_; }
      const std::string& userId() const { return userId_; }
      Clock::time_point startedAt() const { return startedAt_; }
      unsigned sampleRateHz() const { return sampleRateHz_; }
      std::size_t sampleCount() const { return samples_.size(); }
      const std::vector<double>& samples() const { return samples_; }
      const std::vector<double>& heartRates() const { return heartRates_; }
      std::chrono::milliseconds duration() const { return duration_; }
      SessionOutcome outcome() const { return outcome_; }
      const SessionMetrics& metrics() const { return metrics_; }
      const std::string& rhythm() const { return rhythm_; }

    private:
      std::string id_;
      std::string userId_;
      Clock::time_point startedAt_;
      unsigned sampleRateHz_;

      bool sealed_{ false };
      std::vector<double> samples_;
      std::vector<double> heartRates_;
      std::chrono::milliseconds duration_{ 0 };
      SessionOutcome outcome_{ SessionOutcome::Aborted };
      SessionMetrics metrics_{};
      std::string rhythm_{ "Normal Sinus Rhythm" };
    };

  } // namespace core
} // namespace cardia
