#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (poll/termios under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace cardia {
  namespace io {

    /// Map a numeric baud rate onto its termios constant; nullopt if unsupported.
    std::optional<speed_t> toSpeed(unsigned baud);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames input as text lines; LF and CRLF terminators are both accepted,
 *    output lines are CRLF terminated.
 *  * `lastErrno()` keeps the errno of the last failed call for the caller.
 *  * *Non-copyable*, but move-constructible.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      /// Complete line without terminator; nullopt on timeout, EOF or error.
      /// A zero timeout still performs one non-blocking read.
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      int lastErrno() const { return lastErrno_; }
      const std::string& lastError() const { return lastError_; }

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      std::optional<std::string> takeBufferedLine();
      void fail(const char* call);

      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string rx_buffer_{}; ///< bytes received but not yet returned as a line
      int lastErrno_{ 0 };
      std::string lastError_{};
    };
  } // namespace io
} // namespace cardia
