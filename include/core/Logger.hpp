#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/LogEvent.hpp"

namespace cardia {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Producers enqueue `LogEvent`s; one worker thread drains them into a
 *        CSV file through io::FileLogger.
 *
 *  * `log()` never blocks on disk; a full queue drops the event (counted).
 *  * Without an open run, warnings and errors are echoed to std::cerr and the
 *    rest is discarded.
 */
    class Logger {

    public:
      explicit Logger(LogLevel minLevel = LogLevel::Info, std::size_t queueCapacity = 4096);
      ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(const LogEvent& event);              ///< enqueue event (non-blocking)
      void log(LogLevel level, const std::string& source, const std::string& message);
      void finishRun();                             ///< flush + join worker thread

      void setMinLevel(LogLevel level) { minLevel_.store(level); }
      LogLevel minLevel() const { return minLevel_.load(); }
      bool running() const { return running_.load(); }
      std::size_t dropped() const { return dropped_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void drainOnce();

      std::unique_ptr<io::FileLogger> csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex wakeMtx_;
      std::condition_variable wake_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> minLevel_;
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace cardia
