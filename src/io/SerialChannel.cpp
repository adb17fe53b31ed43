/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps a sensor tty - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// Cardia headers
#include "io/SerialChannel.hpp"

using namespace cardia::io;

std::optional<speed_t> cardia::io::toSpeed(unsigned baud) {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  case 230400:
    return B230400;
  case 460800:
    return B460800;
  case 921600:
    return B921600;
  default:
    return std::nullopt;
  }
}

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)),
      lastErrno_(other.lastErrno_), lastError_(std::move(other.lastError_)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
    lastErrno_ = other.lastErrno_;
    lastError_ = std::move(other.lastError_);
  }
  return *this;
}

void SerialChannel::fail(const char* call) {
  lastErrno_ = errno;
  lastError_ = std::string(call) + ": " + strerror(lastErrno_);
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();
  rx_buffer_.clear();

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    fail("open");
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    fail("tcgetattr");
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    fail("tcsetattr");
    close();
    return false;
  }
  lastErrno_ = 0;
  lastError_.clear();
  return true;
}

bool SerialChannel::writeLine(const std::string& line) {

  if (fd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\r\n")) {
    out += "\r\n";
  }

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      ::poll(&pfd, 1, 10);
      continue;
    } else {
      fail("write");
      return false;
    }
  }

  return true;
}

std::optional<std::string> SerialChannel::takeBufferedLine() {
  const auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;

  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return line;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto line = takeBufferedLine())
    return line;
  if (fd_ < 0)
    return std::nullopt;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  do {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = ms_left.count() > 0 ? static_cast<int>(ms_left.count()) : 0;

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      fail("poll");
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLHUP | POLLERR) && !(pfd.revents & POLLIN)) {
      close();
      return std::nullopt;
    }

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        fail("read");
        close();
        return std::nullopt;
      }

      if (auto line = takeBufferedLine())
        return line;
    }
  } while (std::chrono::steady_clock::now() < deadline);

  return std::nullopt; // timeout/partial
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
