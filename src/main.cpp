/* @file main.cpp
 * @brief cardia_recorder: record one ECG session from a tty sensor
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Cardia headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SessionConfig.hpp"
#include "core/SessionCoordinator.hpp"
#include "gateways/JsonFileSessionStore.hpp"
#include "io/SerialDeviceTransport.hpp"

namespace {

  struct Options {
    std::string configPath{ "config/cardia.json" };
    std::string device{};
    std::optional<std::chrono::seconds> duration{};
    std::string userId{ "local" };
    bool list{ false };
  };

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " --config <file> --device <tty> [--duration <s>] [--user <id>]\n"
              << "       " << argv0 << " --config <file> --list [--user <id>]\n";
  }

  std::optional<Options> parseArgs(int argc, char** argv) {
    Options o;
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      const bool hasValue = i + 1 < argc;
      if (arg == "--list") {
        o.list = true;
      } else if (arg == "--config" && hasValue) {
        o.configPath = argv[++i];
      } else if (arg == "--device" && hasValue) {
        o.device = argv[++i];
      } else if (arg == "--user" && hasValue) {
        o.userId = argv[++i];
      } else if (arg == "--duration" && hasValue) {
        try {
          o.duration = std::chrono::seconds{ std::stol(argv[++i]) };
        } catch (const std::exception&) {
          return std::nullopt;
        }
      } else {
        return std::nullopt;
      }
    }
    if (!o.list && o.device.empty())
      return std::nullopt;
    return o;
  }

  std::chrono::milliseconds monotonicNow() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
  }

  int listSessions(cardia::gateways::SessionStore& store, const std::string& userId) {
    const auto sessions = store.listSessions(userId);
    if (sessions.empty()) {
      std::cout << "no stored sessions for " << userId << "\n";
      return EXIT_SUCCESS;
    }
    for (const auto& s : sessions) {
      std::cout << std::left << std::setw(12) << s.name << "  " << s.id << "  " << s.durationSeconds << "s  "
                << s.sampleCount << " samples  avg " << std::fixed << std::setprecision(1) << s.avgBpm
                << " bpm  " << s.status << "  (" << s.outcome << ")\n";
    }
    return EXIT_SUCCESS;
  }

  void printSession(const cardia::core::Session& s) {
    const auto& m = s.metrics();
    std::cout << "session   " << s.id() << " (" << cardia::core::toString(s.outcome()) << ")\n"
              << "samples   " << s.sampleCount() << " @ " << s.sampleRateHz() << " Hz\n"
              << "duration  " << s.duration().count() / 1000.0 << " s\n"
              << std::fixed << std::setprecision(1) << "heart     avg " << m.avgBpm << "  min " << m.minBpm
              << "  max " << m.maxBpm << " bpm (" << m.heartRateStatus() << ")\n"
              << "rhythm    " << s.rhythm() << "\n"
              << "quality   "
              << cardia::core::assessQuality(m.avgBpm, static_cast<long>(s.duration().count() / 1000),
                                             s.sampleCount())
              << "\n"
              << "summary   " << m.overallAssessment(s.rhythm()) << "\n";
  }

  void printHealth(const cardia::core::HealthScore& h) {
    std::cout << std::fixed << std::setprecision(0) << "health    " << h.overall << " ("
              << cardia::core::toString(h.status) << ")  cardiac " << h.cardiac << "  rhythm " << h.rhythm
              << "  signal " << h.signal << "  trend " << h.trend << "  baseline " << h.baseline << "\n"
              << std::setprecision(1) << "hrv       rmssd " << h.rhythmMetrics.rmssd << " ms  sdnn "
              << h.rhythmMetrics.sdnn << " ms  pnn50 " << h.rhythmMetrics.pnn50 << " %\n";
    for (const auto& line : h.insights)
      std::cout << "  - " << line << "\n";
  }

} // namespace

int main(int argc, char** argv) {
  using namespace cardia;

  const auto opts = parseArgs(argc, argv);
  if (!opts) {
    usage(argv[0]);
    return 2;
  }

  core::SessionConfig cfg;
  try {
    cfg = core::SessionConfig::fromJson(core::ConfigLoader(opts->configPath).load());
  } catch (const std::exception& e) {
    std::cerr << "[cardia_recorder] " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  auto logger = std::make_shared<core::Logger>(cfg.logLevel);
  if (!logger->startNewRun(cfg.logPath))
    std::cerr << "[cardia_recorder] cannot open log file " << cfg.logPath << ", logging to stderr only\n";

  auto store = std::make_shared<gateways::JsonFileSessionStore>(cfg.storeRoot, logger);
  if (opts->list) {
    try {
      return listSessions(*store, opts->userId);
    } catch (const core::PersistenceError& e) {
      std::cerr << "[cardia_recorder] " << e.what() << "\n";
      return EXIT_FAILURE;
    }
  }

  bool failed = false;
  auto errors = std::make_shared<core::ErrorMonitor>();
  errors->registerEscalation([&failed](const std::string& msg) {
    failed = true;
    std::cerr << "[cardia_recorder] " << msg << "\n";
  });

  auto transport = std::make_shared<io::SerialDeviceTransport>(cfg, logger);
  core::SessionCoordinator coordinator(cfg, transport, errors, logger, store);
  coordinator.setUserId(opts->userId);

  coordinator.registerCallback([](const core::Notification& n) {
    if (const auto* s = std::get_if<core::StateChanged>(&n))
      std::cout << "[state] " << core::toString(s->from) << " -> " << core::toString(s->to) << std::endl;
    else if (const auto* c = std::get_if<core::ConnectionChanged>(&n))
      std::cout << "[link]  " << core::toString(c->status) << " " << c->deviceId << std::endl;
    else if (const auto* h = std::get_if<core::HealthScoreUpdated>(&n))
      std::cout << "[health] " << std::lround(h->score.overall) << " " << core::toString(h->score.status) << std::endl;
    else if (const auto* saved = std::get_if<core::SessionSaved>(&n))
      std::cout << "[store] saved " << saved->sessionId << std::endl;
  });

  // loop until the link settles or a deadline fires
  auto pump = [&] {
    transport->poll();
    coordinator.poll(monotonicNow());
    std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
  };

  try {
    coordinator.poll(monotonicNow());
    coordinator.connect(opts->device);
    while (coordinator.connectionStatus() == core::ConnectionStatus::Connecting)
      pump();
    if (coordinator.connectionStatus() != core::ConnectionStatus::Connected) {
      std::cerr << "[cardia_recorder] " << coordinator.statusMessage() << "\n";
      logger->finishRun();
      return EXIT_FAILURE;
    }

    coordinator.start(opts->duration);
    while (coordinator.recordingState() == core::RecordingState::Countdown ||
           coordinator.recordingState() == core::RecordingState::Recording ||
           coordinator.recordingState() == core::RecordingState::Processing)
      pump();
  } catch (const core::InvalidStateError& e) {
    std::cerr << "[cardia_recorder] " << e.what() << "\n";
    logger->finishRun();
    return EXIT_FAILURE;
  }

  if (!coordinator.waitForPersistence(std::chrono::seconds{ 10 }))
    std::cerr << "[cardia_recorder] session still being written, giving up\n";

  if (auto session = coordinator.lastSession())
    printSession(*session);
  else
    failed = true;
  if (const auto& health = coordinator.healthScore())
    printHealth(*health);

  coordinator.disconnect();
  logger->finishRun();
  return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
