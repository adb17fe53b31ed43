// Cardia-Prod headers
#include "core/HealthScorer.hpp"
#include "core/RhythmAnalysis.hpp"

// STL headers
#include <cmath>
#include <random>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace cardia::test {

  using namespace std::chrono_literals;
  using namespace cardia::core;

  constexpr unsigned kRate = 250;

  /// Gaussian R waves (σ in samples) separated by the given RR intervals in samples.
  std::vector<double> ecgLike(const std::vector<std::size_t>& rrSamples, std::size_t length, double sigma = 5.0,
                              double amplitude = 1.0) {
    std::vector<double> x(length, 0.0);
    std::size_t centre = 125;
    std::size_t k = 0;
    while (centre < length) {
      for (std::size_t i = 0; i < length; ++i) {
        const double t = static_cast<double>(i) - static_cast<double>(centre);
        x[i] += amplitude * std::exp(-t * t / (2.0 * sigma * sigma));
      }
      centre += rrSamples[k++ % rrSamples.size()];
    }
    return x;
  }

  /// Ten seconds at 60 bpm with ±40 ms beat-to-beat variation.
  std::vector<double> variedRhythm() { return ecgLike({ 240, 260 }, 10 * kRate); }

  /// Ten seconds at exactly 60 bpm.
  std::vector<double> metronomeRhythm() { return ecgLike({ 250 }, 10 * kRate); }

  //---RhythmAnalysis----------------------------------------------------------------

  TEST(RhythmAnalysisTest, PeaksSitOnEveryRWave) {
    const auto x = metronomeRhythm();
    const auto peaks = detectPeaks(x.data(), x.size(), kRate);
    ASSERT_EQ(peaks.size(), 10u);
    EXPECT_EQ(peaks.front(), 125u);
    EXPECT_EQ(peaks[1], 375u);
  }

  TEST(RhythmAnalysisTest, TimeDomainMetrics) {
    // RR 1000, 1040, 960, 1040 ms
    const auto m = analyzeRhythm({ 0, 250, 510, 750, 1010 }, kRate);
    ASSERT_EQ(m.rrMs.size(), 4u);
    EXPECT_DOUBLE_EQ(m.meanRrMs, 1010.0);
    EXPECT_NEAR(m.bpm, 59.406, 1e-3);
    EXPECT_NEAR(m.sdnn, std::sqrt(1100.0), 1e-9);
    EXPECT_NEAR(m.rmssd, std::sqrt(4800.0), 1e-9);
    EXPECT_NEAR(m.pnn50, 200.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(m.irregularRatio, 0.0);
  }

  TEST(RhythmAnalysisTest, ImplausibleIntervalsAreDropped) {
    const auto m = analyzeRhythm({ 0, 50, 300, 1000 }, kRate); // 200 ms, 1000 ms, 2800 ms
    ASSERT_EQ(m.rrMs.size(), 1u);
    EXPECT_DOUBLE_EQ(m.bpm, 60.0);
    EXPECT_DOUBLE_EQ(m.rmssd, 0.0);
  }

  TEST(RhythmAnalysisTest, TooFewPeaksGiveEmptyMetrics) {
    EXPECT_TRUE(analyzeRhythm({}, kRate).rrMs.empty());
    EXPECT_DOUBLE_EQ(analyzeRhythm({ 42 }, kRate).bpm, 0.0);
  }

  //---HealthScorer components-------------------------------------------------------

  TEST(HealthStatusTest, Thresholds) {
    EXPECT_EQ(healthStatusFor(90.0), HealthStatus::Excellent);
    EXPECT_EQ(healthStatusFor(89.9), HealthStatus::Good);
    EXPECT_EQ(healthStatusFor(70.0), HealthStatus::Fair);
    EXPECT_EQ(healthStatusFor(60.0), HealthStatus::Poor);
    EXPECT_EQ(healthStatusFor(59.9), HealthStatus::Critical);
  }

  class HealthScorerTest : public ::testing::Test {
  protected:
    double cardiac(const std::vector<double>& x) const {
      const auto peaks = detectPeaks(x.data(), x.size(), kRate);
      return scorer.cardiacHealth(x, peaks, analyzeRhythm(peaks, kRate));
    }

    HealthScorer scorer{ HealthScorer::Options{ kRate, 30 } };
    const std::chrono::system_clock::time_point now{ std::chrono::hours{ 24 * 20000 } };
  };

  TEST_F(HealthScorerTest, VariableRhythmScoresFullCardiacHealth) {
    EXPECT_DOUBLE_EQ(cardiac(variedRhythm()), 100.0);
  }

  TEST_F(HealthScorerTest, MetronomeRhythmLosesHrvCredit) {
    EXPECT_DOUBLE_EQ(cardiac(metronomeRhythm()), 75.0);
  }

  TEST_F(HealthScorerTest, FastRateIsPenalised) {
    EXPECT_DOUBLE_EQ(cardiac(ecgLike({ 150 }, 10 * kRate)), 71.25); // 100 bpm
  }

  TEST_F(HealthScorerTest, WideComplexesArePenalised) {
    EXPECT_LT(cardiac(ecgLike({ 250 }, 10 * kRate, 20.0)), cardiac(metronomeRhythm()));
  }

  TEST_F(HealthScorerTest, NoBeatsInTwoSecondsScoresLow) {
    EXPECT_DOUBLE_EQ(cardiac(std::vector<double>(2 * kRate, 0.0)), 25.0);
    EXPECT_DOUBLE_EQ(cardiac(std::vector<double>(kRate / 2, 0.0)), 75.0); // too short to tell
  }

  TEST_F(HealthScorerTest, RhythmStabilityFromRegularityAndIrregularBeats) {
    RhythmMetrics m;
    m.rrMs = { 1000.0 };
    EXPECT_DOUBLE_EQ(HealthScorer::rhythmStability(m), 75.0);

    m.rrMs = { 1000.0, 1000.0, 1000.0 };
    EXPECT_DOUBLE_EQ(HealthScorer::rhythmStability(m), 100.0);

    m.cv = 0.05;
    m.irregularRatio = 0.4;
    EXPECT_NEAR(HealthScorer::rhythmStability(m), 60.0, 1e-9);
  }

  TEST_F(HealthScorerTest, NoiseLowersSignalQuality) {
    const auto clean = variedRhythm();
    auto noisy = clean;
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> noise(-0.5, 0.5);
    for (auto& v : noisy)
      v += noise(rng);

    double cleanSnr = 0.0;
    double noisySnr = 0.0;
    const double cleanQ = scorer.signalQuality(clean, &cleanSnr);
    const double noisyQ = scorer.signalQuality(noisy, &noisySnr);

    EXPECT_GT(cleanSnr, 10.0);
    EXPECT_LT(noisySnr, 10.0);
    EXPECT_GT(cleanQ, 80.0);
    EXPECT_LT(noisyQ, cleanQ - 10.0);
  }

  TEST_F(HealthScorerTest, FlatOrMissingSignalHasNoQuality) {
    EXPECT_DOUBLE_EQ(scorer.signalQuality({}), 0.0);
    EXPECT_DOUBLE_EQ(scorer.signalQuality(std::vector<double>(1000, 0.5)), 0.0);
  }

  TEST_F(HealthScorerTest, TrendComparesLastWeekWithLastMonth) {
    std::vector<HistoryEntry> history{ { now - 1h, 70.0, true }, { now - 24h, 70.0, true } };
    EXPECT_DOUBLE_EQ(HealthScorer::trendScore(history, now), 75.0); // not enough history

    history.push_back({ now - 48h, 70.0, true });
    for (int i = 0; i < 3; ++i)
      history.push_back({ now - std::chrono::hours{ 24 * 40 }, 200.0, true }); // outside the month
    EXPECT_DOUBLE_EQ(HealthScorer::trendScore(history, now), 100.0);

    std::vector<HistoryEntry> rising{ { now - 1h, 100.0, false }, { now - 24h, 100.0, false },
                                      { now - 48h, 100.0, true } };
    for (int i = 0; i < 5; ++i)
      rising.push_back({ now - std::chrono::hours{ 24 * 20 }, 60.0, true });
    EXPECT_DOUBLE_EQ(HealthScorer::trendScore(rising, now), 55.0); // rate change and abnormal rhythm
  }

  TEST_F(HealthScorerTest, BaselineDeviation) {
    const auto x = variedRhythm();
    const auto base = HealthScorer::baselineOf(x);
    EXPECT_DOUBLE_EQ(HealthScorer::baselineScore(x, &base), 100.0);
    EXPECT_DOUBLE_EQ(HealthScorer::baselineScore(x, nullptr), 75.0);
    EXPECT_DOUBLE_EQ(HealthScorer::baselineScore({}, &base), 50.0);

    auto doubled = x;
    for (auto& v : doubled)
      v *= 2.0;
    EXPECT_DOUBLE_EQ(HealthScorer::baselineScore(doubled, &base), 55.0);

    auto raised = x;
    for (auto& v : raised)
      v *= 1.2;
    EXPECT_DOUBLE_EQ(HealthScorer::baselineScore(raised, &base), 90.0);
  }

  //---HealthScorer::score-----------------------------------------------------------

  TEST_F(HealthScorerTest, OverallIsTheWeightedSum) {
    const auto x = variedRhythm();
    const auto base = HealthScorer::baselineOf(x);
    const auto s = scorer.score(x, {}, now, &base);

    EXPECT_DOUBLE_EQ(s.cardiac, 100.0);
    EXPECT_NEAR(s.rhythm, 80.0, 1.0);
    EXPECT_DOUBLE_EQ(s.trend, 75.0);
    EXPECT_DOUBLE_EQ(s.baseline, 100.0);
    EXPECT_NEAR(s.overall,
                0.40 * s.cardiac + 0.25 * s.rhythm + 0.15 * s.signal + 0.10 * s.trend + 0.10 * s.baseline, 1e-9);
    EXPECT_EQ(s.status, healthStatusFor(s.overall));
    EXPECT_NEAR(s.rhythmMetrics.bpm, 60.0, 0.5);

    ASSERT_FALSE(s.insights.empty());
    EXPECT_THAT(s.insights, testing::Not(testing::Contains(testing::HasSubstr("Irregular rhythm"))));
    EXPECT_THAT(s.insights, testing::Not(testing::Contains(testing::HasSubstr("Poor signal quality"))));
  }

  TEST_F(HealthScorerTest, ErraticRhythmIsFlagged) {
    const auto x = ecgLike({ 150, 300, 180, 320, 200, 290 }, 10 * kRate);
    const auto s = scorer.score(x, {}, now);
    EXPECT_GT(s.rhythmMetrics.irregularRatio, 0.3);
    EXPECT_LT(s.rhythm, 75.0);
    EXPECT_THAT(s.insights, testing::Contains(testing::HasSubstr("Irregular rhythm")));
  }

  TEST_F(HealthScorerTest, EmptyWindowScoresNeutralDefaults) {
    const auto s = scorer.score({}, {}, now);
    EXPECT_DOUBLE_EQ(s.cardiac, 50.0);
    EXPECT_DOUBLE_EQ(s.rhythm, 50.0);
    EXPECT_DOUBLE_EQ(s.signal, 0.0);
    EXPECT_DOUBLE_EQ(s.trend, 75.0);
    EXPECT_DOUBLE_EQ(s.baseline, 50.0);
    EXPECT_NEAR(s.overall, 45.0, 1e-9);
    EXPECT_EQ(s.status, HealthStatus::Critical);
  }

} // namespace cardia::test
