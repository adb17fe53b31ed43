/* @file SampleBuffer.cpp
 * @brief record/display buffers and peak-interval heart rate
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Cardia headers
#include "core/RhythmAnalysis.hpp"
#include "core/SampleBuffer.hpp"

using namespace cardia::core;

SampleBuffer::SampleBuffer(Limits limits) : limits_(limits) {
  if (limits_.sampleRateHz == 0)
    limits_.sampleRateHz = 1;
  if (limits_.heartRateWindow < kMinSamplesForHeartRate)
    limits_.heartRateWindow = kMinSamplesForHeartRate;
  record_.reserve(std::min<std::size_t>(limits_.recordCapacity, 64 * 1024));
}

std::size_t SampleBuffer::append(const double* samples, std::size_t n) {
  if (!samples || n == 0)
    return 0;

  const std::size_t room = limits_.recordCapacity > record_.size() ? limits_.recordCapacity - record_.size() : 0;
  const std::size_t kept = std::min(room, n);
  record_.insert(record_.end(), samples, samples + kept);
  dropped_ += n - kept;

  for (std::size_t i = 0; i < n; ++i)
    display_.push_back(samples[i]);
  while (display_.size() > limits_.displayCapacity)
    display_.pop_front();

  heartRate_ = estimateHeartRate();
  if (heartRate_ > kNoHeartRate) {
    heartRates_.push_back(heartRate_);
    recentHeartRates_.push_back(heartRate_);
    while (recentHeartRates_.size() > limits_.heartRateHistory)
      recentHeartRates_.pop_front();
  }
  return kept;
}

void SampleBuffer::reset() {
  record_.clear();
  display_.clear();
  heartRates_.clear();
  recentHeartRates_.clear();
  dropped_ = 0;
  heartRate_ = kNoHeartRate;
}

void SampleBuffer::takeCapture(std::vector<double>& samples, std::vector<double>& heartRates) {
  samples = std::move(record_);
  heartRates = std::move(heartRates_);
  reset();
}

// Works on the display window: it always holds the newest samples, even after
// the record has hit its capacity.
double SampleBuffer::estimateHeartRate() const {
  if (display_.size() < kMinSamplesForHeartRate)
    return kNoHeartRate;

  const std::size_t n = std::min(display_.size(), limits_.heartRateWindow);
  const auto first = display_.end() - static_cast<std::ptrdiff_t>(n);
  std::vector<double> win(first, display_.end());

  const auto peaks = detectPeaks(win.data(), n, limits_.sampleRateHz, kRefractorySeconds);
  if (peaks.size() < 2)
    return kNoHeartRate;

  const double meanInterval =
      static_cast<double>(peaks.back() - peaks.front()) / static_cast<double>(peaks.size() - 1);
  const double bpm = 60.0 * limits_.sampleRateHz / meanInterval;
  return std::clamp(bpm, kMinBpm, kMaxBpm);
}
