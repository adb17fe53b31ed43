#pragma once
/** @file  FakeSerialChannel.hpp
 *  @brief SerialChannel derivative replaying scripted lines for transport tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <deque>

#include "io/SerialChannel.hpp"

namespace cardia {
  namespace test {

    /**
 * @class FakeSerialChannel
 * @brief `lines` are handed out one per readLine(); `hangUpWhenDrained`
 *        simulates the sensor unplugging once they run out.
 */
    class FakeSerialChannel : public cardia::io::SerialChannel {
    public:
      bool open_called = false;
      bool open_success = true;
      bool hangUpWhenDrained = false;
      std::deque<std::string> lines;

      bool open(const std::string&, speed_t) override {
        open_called = true;
        is_open = open_success;
        return open_success;
      }

      bool writeLine(const std::string& line) override {
        last_written = line;
        return is_open;
      }

      std::optional<std::string> readLine(std::chrono::milliseconds) override {
        if (lines.empty()) {
          if (hangUpWhenDrained)
            is_open = false;
          return std::nullopt;
        }
        auto line = lines.front();
        lines.pop_front();
        return line;
      }

      bool isOpen() const override { return is_open; }

      const std::string& getLastWritten() const { return last_written; }

    private:
      bool is_open = false;
      std::string last_written;
    };

  } // namespace test
} // namespace cardia
