// Cardia-Prod headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/SessionCoordinator.hpp"
#include "gateways/SessionStore.hpp"

// Cardia-Fake headers
#include "FakeDeviceTransport.hpp"
#include "MockErrorMonitor.hpp"

// STL headers
#include <random>
#include <thread>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace cardia::test {

  using namespace std::chrono_literals;
  using cardia::core::ConnectionStatus;
  using cardia::core::InvalidStateError;
  using cardia::core::Notification;
  using cardia::core::RecordingState;
  using cardia::core::Session;
  using cardia::core::SessionConfig;
  using cardia::core::SessionCoordinator;
  using cardia::core::SessionOutcome;
  using testing::_;
  using testing::NiceMock;

  class MockSessionStore : public gateways::SessionStore {
  public:
    MOCK_METHOD(gateways::SessionId, saveSession, (const core::Session&), (override));
    MOCK_METHOD(std::vector<gateways::SessionSummary>, listSessions, (const std::string&), (override));
    MOCK_METHOD(void, renameSession, (const std::string&, const gateways::SessionId&, const std::string&),
                (override));
    MOCK_METHOD(void, deleteSession, (const std::string&, const gateways::SessionId&), (override));
  };

  constexpr const char* kDevice = "/dev/ttyUSB0";

  /// 60 bpm at 250 Hz: one unit spike every 250 samples.
  std::vector<double> heartbeatBatch(std::size_t firstIndex, std::size_t n) {
    std::vector<double> out(n, 0.0);
    for (std::size_t i = 0; i < n; ++i)
      if ((firstIndex + i) % 250 == 0)
        out[i] = 1.0;
    return out;
  }

  class SessionCoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override { build(SessionConfig{}); }

    void build(const SessionConfig& cfg, bool withStore = false) {
      coordinator.reset();
      transport = std::make_shared<FakeDeviceTransport>();
      errors = std::make_shared<NiceMock<MockErrorMonitor>>();
      store = withStore ? std::make_shared<NiceMock<MockSessionStore>>() : nullptr;
      coordinator = std::make_unique<SessionCoordinator>(cfg, transport, errors, nullptr, store);
      coordinator->registerCallback([this](const Notification& n) { notes.push_back(n); });
      notes.clear();
      now = 0ms;
    }

    void advanceTo(std::chrono::milliseconds t) {
      now = t;
      coordinator->poll(now);
    }

    void connectDevice() {
      coordinator->connect(kDevice);
      advanceTo(now);
      ASSERT_EQ(coordinator->connectionStatus(), ConnectionStatus::Connected);
    }

    /// start() and run the 3 s countdown; returns with the session open.
    void startRecording(std::optional<std::chrono::seconds> duration = 30s) {
      coordinator->start(duration);
      ASSERT_EQ(coordinator->recordingState(), RecordingState::Countdown);
      for (int i = 0; i < 3; ++i)
        advanceTo(now + 1s);
      ASSERT_EQ(coordinator->recordingState(), RecordingState::Recording);
    }

    /// One 250-sample batch followed by a poll `step` later.
    void feedBatch(std::chrono::milliseconds step) {
      transport->samples(heartbeatBatch(fed, 250));
      fed += 250;
      advanceTo(now + step);
    }

    template <typename T> std::vector<T> notesOf() const {
      std::vector<T> out;
      for (const auto& n : notes)
        if (const auto* t = std::get_if<T>(&n))
          out.push_back(*t);
      return out;
    }

    std::shared_ptr<FakeDeviceTransport> transport;
    std::shared_ptr<NiceMock<MockErrorMonitor>> errors;
    std::shared_ptr<NiceMock<MockSessionStore>> store;
    std::vector<Notification> notes;
    std::chrono::milliseconds now{ 0 };
    std::size_t fed{ 0 };
    std::unique_ptr<SessionCoordinator> coordinator;
  };

  TEST_F(SessionCoordinatorTest, StopAfterThirtySecondsSealsEverySample) {
    connectDevice();
    startRecording(30s);

    // batches land half way between the 1 s ticks; 29 ticks leave 1 s to go
    for (int i = 0; i < 30; ++i)
      feedBatch(i == 0 ? 500ms : 1000ms);
    ASSERT_EQ(coordinator->recordingState(), RecordingState::Recording);
    EXPECT_EQ(coordinator->recordingRemaining(), 1u);

    coordinator->stop();

    EXPECT_EQ(coordinator->recordingState(), RecordingState::Completed);
    EXPECT_FALSE(coordinator->hasOpenSession());
    auto session = coordinator->lastSession();
    ASSERT_TRUE(session);
    EXPECT_TRUE(session->sealed());
    EXPECT_EQ(session->sampleCount(), 7500u);
    EXPECT_EQ(session->outcome(), SessionOutcome::Completed);
    EXPECT_NEAR(session->metrics().avgBpm, 60.0, 0.5);
    EXPECT_EQ(notesOf<core::SessionSealed>().size(), 1u);
  }

  TEST_F(SessionCoordinatorTest, RecordingStopsItselfWhenDurationElapses) {
    connectDevice();
    startRecording(30s);

    for (int i = 0; i < 30; ++i)
      feedBatch(1000ms);

    EXPECT_EQ(coordinator->recordingState(), RecordingState::Completed);
    auto session = coordinator->lastSession();
    ASSERT_TRUE(session);
    EXPECT_EQ(session->sampleCount(), 7500u);
    EXPECT_EQ(session->duration(), 30s);
  }

  TEST_F(SessionCoordinatorTest, StateSequenceFollowsLifecycle) {
    connectDevice();
    startRecording(10s);
    coordinator->stop();

    const auto changes = notesOf<core::StateChanged>();
    ASSERT_EQ(changes.size(), 4u);
    EXPECT_EQ(changes[0].to, RecordingState::Countdown);
    EXPECT_EQ(changes[1].to, RecordingState::Recording);
    EXPECT_EQ(changes[2].to, RecordingState::Processing);
    EXPECT_EQ(changes[3].to, RecordingState::Completed);

    coordinator->resetToIdle();
    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
  }

  TEST_F(SessionCoordinatorTest, CountdownTicksOncePerSecond) {
    connectDevice();
    coordinator->start(30s);
    EXPECT_EQ(coordinator->countdownRemaining(), 3u);
    advanceTo(999ms);
    EXPECT_EQ(coordinator->countdownRemaining(), 3u);
    advanceTo(1000ms);
    EXPECT_EQ(coordinator->countdownRemaining(), 2u);
    advanceTo(2000ms);
    EXPECT_EQ(coordinator->countdownRemaining(), 1u);
    advanceTo(3000ms);
    EXPECT_EQ(coordinator->recordingState(), RecordingState::Recording);
    EXPECT_EQ(coordinator->recordingRemaining(), 30u);
  }

  TEST_F(SessionCoordinatorTest, StopWhileIdleIsNoOp) {
    connectDevice();
    coordinator->stop();
    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
    EXPECT_FALSE(coordinator->lastSession());
    EXPECT_TRUE(notesOf<core::StateChanged>().empty());
  }

  TEST_F(SessionCoordinatorTest, StopDuringCountdownReturnsToIdleWithoutSession) {
    connectDevice();
    coordinator->start(30s);
    advanceTo(1000ms);
    coordinator->stop();

    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
    EXPECT_FALSE(coordinator->hasOpenSession());
    EXPECT_FALSE(coordinator->lastSession());

    // the cancelled countdown must not start a recording later
    advanceTo(10s);
    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
  }

  TEST_F(SessionCoordinatorTest, StartRequiresConnectedDevice) {
    EXPECT_THROW(coordinator->start(30s), InvalidStateError);
    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
  }

  TEST_F(SessionCoordinatorTest, StartWhileCapturingThrowsAndKeepsSession) {
    connectDevice();
    startRecording(30s);
    EXPECT_THROW(coordinator->start(30s), InvalidStateError);
    EXPECT_TRUE(coordinator->hasOpenSession());
    EXPECT_EQ(coordinator->recordingState(), RecordingState::Recording);
  }

  TEST_F(SessionCoordinatorTest, DurationIsClampedToConfiguredRange) {
    connectDevice();
    coordinator->start(2s);
    EXPECT_EQ(coordinator->recordingDuration(), 10s);
    coordinator->stop();

    coordinator->start(3600s);
    EXPECT_EQ(coordinator->recordingDuration(), 600s);
  }

  TEST_F(SessionCoordinatorTest, SamplesOutsideRecordingAreIgnored) {
    connectDevice();
    transport->samples(std::vector<double>(100, 0.5));
    advanceTo(100ms);
    EXPECT_EQ(coordinator->buffer().size(), 0u);
  }

  TEST_F(SessionCoordinatorTest, HeartRateIsPublishedPerBatch) {
    connectDevice();
    startRecording(30s);
    for (int i = 0; i < 4; ++i)
      feedBatch(100ms);

    const auto rates = notesOf<core::HeartRateUpdated>();
    ASSERT_EQ(rates.size(), 4u);
    EXPECT_EQ(rates[0].bpm, core::SampleBuffer::kNoHeartRate);
    EXPECT_NEAR(rates.back().bpm, 60.0, 0.5);
    EXPECT_NEAR(coordinator->currentHeartRate(), 60.0, 0.5);
  }

  TEST_F(SessionCoordinatorTest, LinkLossMidRecordingAbortsToIdle) {
    EXPECT_CALL(*errors, notifyFailure(testing::HasSubstr("connection-lost"))).Times(1);
    connectDevice();
    startRecording(30s);
    feedBatch(500ms);

    transport->linkDown(kDevice);
    advanceTo(now + 100ms);

    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Disconnected);
    EXPECT_FALSE(coordinator->hasOpenSession());

    auto session = coordinator->lastSession();
    ASSERT_TRUE(session);
    EXPECT_EQ(session->outcome(), SessionOutcome::Aborted);
    EXPECT_EQ(session->sampleCount(), 0u); // discarded by default

    const auto errorsRaised = notesOf<core::ErrorRaised>();
    ASSERT_EQ(errorsRaised.size(), 1u);
    EXPECT_EQ(errorsRaised[0].domain, "device");
    EXPECT_EQ(errorsRaised[0].code, "connection-lost");
  }

  TEST_F(SessionCoordinatorTest, LinkLossKeepsPartialCaptureWhenConfigured) {
    SessionConfig cfg;
    cfg.partialSave = core::PartialSavePolicy::Persist;
    build(cfg, true);
    EXPECT_CALL(*store, saveSession(testing::AllOf(
                            testing::Property(&Session::outcome, SessionOutcome::Aborted),
                            testing::Property(&Session::sampleCount, 500u))))
        .WillOnce(testing::Return("partial"));

    connectDevice();
    startRecording(30s);
    feedBatch(500ms);
    feedBatch(500ms);

    transport->linkDown(kDevice);
    advanceTo(now + 100ms);
    ASSERT_TRUE(coordinator->waitForPersistence(2s));

    ASSERT_TRUE(coordinator->lastSession());
    EXPECT_EQ(coordinator->lastSession()->sampleCount(), 500u);
    ASSERT_EQ(notesOf<core::SessionSaved>().size(), 1u);
  }

  TEST_F(SessionCoordinatorTest, ReconnectsAfterDelayWhenLinkDropsDuringRecording) {
    connectDevice();
    startRecording(30s);
    const auto droppedAt = now + 200ms;

    transport->linkDown(kDevice);
    advanceTo(droppedAt);
    ASSERT_EQ(transport->connectRequests.size(), 1u);

    advanceTo(droppedAt + 4999ms);
    EXPECT_EQ(transport->connectRequests.size(), 1u);

    advanceTo(droppedAt + 5000ms);
    ASSERT_EQ(transport->connectRequests.size(), 2u);
    EXPECT_EQ(transport->connectRequests.back(), kDevice);

    advanceTo(now + 10ms);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Connected);
    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
  }

  TEST_F(SessionCoordinatorTest, UserDisconnectAbortsQuietly) {
    EXPECT_CALL(*errors, notifyFailure(_)).Times(0);
    connectDevice();
    startRecording(30s);

    coordinator->disconnect();
    transport->linkDown(kDevice); // echo from the transport
    advanceTo(now + 10s);

    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Disconnected);
    EXPECT_EQ(transport->disconnects, 1);
    EXPECT_EQ(transport->connectRequests.size(), 1u);
    EXPECT_TRUE(notesOf<core::ErrorRaised>().empty());
  }

  TEST_F(SessionCoordinatorTest, SignalFaultAbortsCaptureButKeepsLink) {
    connectDevice();
    startRecording(30s);

    transport->fault(core::DeviceErrorKind::SignalPoor, "too noisy");
    advanceTo(now + 10ms);

    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Connected);
    const auto raised = notesOf<core::ErrorRaised>();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].code, "signal-poor");
  }

  TEST_F(SessionCoordinatorTest, ConnectTimesOutWithoutLink) {
    transport->autoConnect = false;
    coordinator->connect(kDevice);
    advanceTo(1s);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Connecting);

    advanceTo(15s);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Error);
    EXPECT_EQ(transport->disconnects, 1);
    const auto raised = notesOf<core::ErrorRaised>();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].code, "connection-failed");

    // a late link-up for the abandoned attempt is not adopted
    transport->linkUp(kDevice);
    advanceTo(16s);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Error);
  }

  TEST_F(SessionCoordinatorTest, ConnectFaultMovesToError) {
    transport->autoConnect = false;
    coordinator->connect(kDevice);
    transport->fault(core::DeviceErrorKind::PermissionDenied, "EACCES");
    advanceTo(10ms);

    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Error);
    // no stale timeout afterwards
    advanceTo(60s);
    EXPECT_EQ(notesOf<core::ErrorRaised>().size(), 1u);
  }

  TEST_F(SessionCoordinatorTest, ScanFiltersByKeywordAndTimesOut) {
    SessionConfig cfg;
    cfg.deviceKeywords = { "ecg", "bioamp" };
    build(cfg);

    coordinator->startScan();
    EXPECT_EQ(transport->scans, 1);
    transport->discover("AA:01", "BioAmp EXG Pill");
    transport->discover("AA:02", "Wireless Mouse");
    transport->discover("AA:03", "HM-10", "ECG monitor");
    transport->discover("AA:01", "BioAmp EXG Pill");
    advanceTo(1s);

    ASSERT_EQ(coordinator->discoveredDevices().size(), 2u);
    EXPECT_EQ(coordinator->discoveredDevices()[0].id, "AA:01");
    EXPECT_EQ(coordinator->discoveredDevices()[1].id, "AA:03");

    advanceTo(30s);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Disconnected);
    EXPECT_EQ(transport->scanStops, 1);
    EXPECT_EQ(coordinator->statusMessage(), "Scan completed");
  }

  TEST_F(SessionCoordinatorTest, CompletedSessionIsPersisted) {
    build(SessionConfig{}, true);
    EXPECT_CALL(*store, saveSession(testing::Property(&Session::sampleCount, 2500u)))
        .WillOnce(testing::Return("ses-saved"));

    connectDevice();
    startRecording(10s);
    for (int i = 0; i < 10; ++i)
      feedBatch(1000ms);
    ASSERT_EQ(coordinator->recordingState(), RecordingState::Completed);

    ASSERT_TRUE(coordinator->waitForPersistence(2s));
    EXPECT_EQ(coordinator->pendingSaves(), 0u);
    const auto saved = notesOf<core::SessionSaved>();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0].sessionId, "ses-saved");
  }

  TEST_F(SessionCoordinatorTest, PersistenceFailureIsReportedNotThrown) {
    build(SessionConfig{}, true);
    EXPECT_CALL(*store, saveSession(_)).WillOnce(testing::Throw(core::PersistenceError("disk full")));
    EXPECT_CALL(*errors, notifyFailure(testing::HasSubstr("disk full"))).Times(1);

    connectDevice();
    startRecording(10s);
    feedBatch(500ms);
    coordinator->stop();

    ASSERT_TRUE(coordinator->waitForPersistence(2s));
    const auto raised = notesOf<core::ErrorRaised>();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].domain, "persistence");
    EXPECT_EQ(raised[0].code, "persistence-failed");
    EXPECT_EQ(coordinator->recordingState(), RecordingState::Completed);
  }

  TEST_F(SessionCoordinatorTest, EventsPostedFromOtherThreadsAreAppliedInPoll) {
    connectDevice();
    startRecording(30s);

    std::thread producer([this] {
      for (int i = 0; i < 10; ++i)
        transport->samples(std::vector<double>(25, 0.1));
    });
    producer.join();
    EXPECT_EQ(coordinator->buffer().size(), 0u);

    advanceTo(now + 10ms);
    EXPECT_EQ(coordinator->buffer().size(), 250u);
  }

  TEST_F(SessionCoordinatorTest, LinkLossAfterCompletionReturnsToIdle) {
    connectDevice();
    startRecording(10s);
    feedBatch(500ms);
    coordinator->stop();
    ASSERT_EQ(coordinator->recordingState(), RecordingState::Completed);

    transport->linkDown(kDevice);
    advanceTo(now + 100ms);

    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Disconnected);
    ASSERT_TRUE(coordinator->lastSession());
    EXPECT_EQ(coordinator->lastSession()->outcome(), SessionOutcome::Completed);
  }

  TEST_F(SessionCoordinatorTest, UserDisconnectAfterCompletionReturnsToIdle) {
    connectDevice();
    startRecording(10s);
    coordinator->stop();
    ASSERT_EQ(coordinator->recordingState(), RecordingState::Completed);

    coordinator->disconnect();

    EXPECT_EQ(coordinator->recordingState(), RecordingState::Idle);
    EXPECT_EQ(coordinator->connectionStatus(), ConnectionStatus::Disconnected);
  }

  /// Random interleavings of commands and device events never open a second
  /// session and keep "session open" equivalent to "recording".
  TEST_F(SessionCoordinatorTest, RandomCommandSequencesKeepOneSessionAtMost) {
    for (unsigned seed = 1; seed <= 20; ++seed) {
      build(SessionConfig{});
      std::mt19937 rng(seed);
      std::uniform_int_distribution<int> pick(0, 8);
      std::size_t opened = 0;

      for (int step = 0; step < 400; ++step) {
        const int action = pick(rng);
        try {
          switch (action) {
          case 0:
            coordinator->connect(kDevice);
            break;
          case 1:
            coordinator->start(10s);
            break;
          case 2:
            coordinator->stop();
            break;
          case 3:
            transport->linkDown(kDevice);
            break;
          case 4:
            coordinator->disconnect();
            break;
          case 5:
            coordinator->resetToIdle();
            break;
          case 6:
            transport->samples(heartbeatBatch(0, 50));
            break;
          default:
            break;
          }
        } catch (const InvalidStateError&) {
          // illegal in the current state; state must be unchanged
        }
        advanceTo(now + (action == 7 ? 1000ms : 250ms));

        const auto state = coordinator->recordingState();
        ASSERT_TRUE(state == RecordingState::Idle || state == RecordingState::Countdown ||
                    state == RecordingState::Recording || state == RecordingState::Processing ||
                    state == RecordingState::Completed)
            << "seed " << seed << " step " << step;
        ASSERT_EQ(coordinator->hasOpenSession(), state == RecordingState::Recording)
            << "seed " << seed << " step " << step << " state " << core::toString(state);
      }

      for (const auto& c : notesOf<core::StateChanged>())
        if (c.to == RecordingState::Recording) {
          EXPECT_EQ(c.from, RecordingState::Countdown) << "seed " << seed;
          ++opened;
        }
      EXPECT_EQ(notesOf<core::SessionSealed>().size(), opened - (coordinator->hasOpenSession() ? 1 : 0))
          << "seed " << seed;
    }
  }

  TEST_F(SessionCoordinatorTest, HealthScoreFollowsEachRecordingSecond) {
    connectDevice();
    startRecording(10s);
    for (int i = 0; i < 10; ++i)
      feedBatch(1000ms);
    ASSERT_EQ(coordinator->recordingState(), RecordingState::Completed);

    // the first tick holds one second of signal, too little to score
    const auto scores = notesOf<core::HealthScoreUpdated>();
    ASSERT_EQ(scores.size(), 9u);
    EXPECT_NEAR(scores.back().score.rhythmMetrics.bpm, 60.0, 1.0);
    ASSERT_TRUE(coordinator->healthScore());
    EXPECT_DOUBLE_EQ(coordinator->healthScore()->overall, scores.back().score.overall);
  }

  TEST_F(SessionCoordinatorTest, HealthScoringCanBeSwitchedOff) {
    SessionConfig cfg;
    cfg.healthScoring = false;
    build(cfg);
    connectDevice();
    startRecording(10s);
    for (int i = 0; i < 10; ++i)
      feedBatch(1000ms);

    EXPECT_TRUE(notesOf<core::HealthScoreUpdated>().empty());
    EXPECT_FALSE(coordinator->healthScore());
  }

  TEST_F(SessionCoordinatorTest, StoredSessionsFeedTheTrendScore) {
    build(SessionConfig{}, true);
    std::vector<gateways::SessionSummary> past(3);
    for (std::size_t i = 0; i < past.size(); ++i) {
      past[i].timestamp = std::chrono::system_clock::now() - std::chrono::hours{ 24 * static_cast<int>(i + 1) };
      past[i].avgBpm = 60.0;
    }
    EXPECT_CALL(*store, listSessions("local")).WillOnce(testing::Return(past));

    connectDevice();
    startRecording(10s);
    feedBatch(1000ms);
    feedBatch(1000ms);

    ASSERT_TRUE(coordinator->healthScore());
    EXPECT_DOUBLE_EQ(coordinator->healthScore()->trend, 100.0);
  }

} // namespace cardia::test
