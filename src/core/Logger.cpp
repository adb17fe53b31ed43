/* @file Logger.cpp
 * @brief async CSV run log: ring buffer in front, FileLogger behind one worker
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

// Cardia headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

namespace cardia {
  namespace core {

    namespace {
      constexpr auto kIdleWait = std::chrono::milliseconds{ 50 };

      std::string quoted(const std::string& text) {
        std::string out = "\"";
        for (char c : text) {
          if (c == '"')
            out += '"';
          out += (c == '\n' || c == '\r') ? ' ' : c;
        }
        out += '"';
        return out;
      }
    } // namespace

    std::optional<LogLevel> parseLogLevel(const std::string& text) {
      std::string lower(text);
      std::transform(lower.begin(), lower.end(), lower.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (lower == "debug")
        return LogLevel::Debug;
      if (lower == "info")
        return LogLevel::Info;
      if (lower == "warn" || lower == "warning")
        return LogLevel::Warning;
      if (lower == "error")
        return LogLevel::Error;
      return std::nullopt;
    }

    std::string LogEvent::toCsv() const {
      return std::to_string(timestampMs) + ',' + toString(level) + ',' + quoted(source) + ',' +
             quoted(message);
    }

    Logger::Logger(LogLevel minLevel, std::size_t queueCapacity)
        : csvFile_(std::make_unique<io::FileLogger>()),
          buffer_(std::make_unique<RingBuffer<LogEvent>>(queueCapacity)), minLevel_(minLevel) {}

    Logger::~Logger() { finishRun(); }

    bool Logger::startNewRun(const std::string& csvPath) {
      finishRun();
      if (!csvFile_->open(csvPath)) {
        std::cerr << "[Logger] cannot open run log: " << csvPath << '\n';
        return false;
      }
      csvFile_->write("timestamp_ms,level,source,message\n");
      running_ = true;
      worker_ = std::thread(&Logger::workerLoop, this);
      return true;
    }

    void Logger::log(const LogEvent& event) {
      if (event.level < minLevel_.load())
        return;

      if (!running_) {
        if (event.level >= LogLevel::Warning)
          std::cerr << '[' << toString(event.level) << "] " << event.source << ": "
                    << event.message << '\n';
        return;
      }

      if (!buffer_->tryPush(event)) {
        ++dropped_;
        return;
      }
      wake_.notify_one();
    }

    void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
      if (level < minLevel_.load())
        return;
      const auto now = std::chrono::system_clock::now().time_since_epoch();
      log(LogEvent{ std::chrono::duration_cast<std::chrono::milliseconds>(now).count(), level, source,
                    message });
    }

    void Logger::finishRun() {
      if (!running_.exchange(false))
        return;
      wake_.notify_one();
      if (worker_.joinable())
        worker_.join();
      drainOnce(); // whatever raced in after the worker's last pass
      csvFile_->close();
    }

    void Logger::workerLoop() {
      while (running_) {
        drainOnce();
        std::unique_lock<std::mutex> lock(wakeMtx_);
        wake_.wait_for(lock, kIdleWait, [this] { return !running_ || buffer_->size() > 0; });
      }
      drainOnce();
    }

    void Logger::drainOnce() {
      bool wrote = false;
      while (auto event = buffer_->tryPop()) {
        csvFile_->write(event->toCsv() + '\n');
        wrote = true;
      }
      if (wrote && !csvFile_->flush())
        std::cerr << "[Logger] flush to run log failed\n";
    }

  } // namespace core
} // namespace cardia
