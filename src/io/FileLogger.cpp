/* @file FileLogger.cpp
 * @brief buffered stdio writer, flushed in kChunkSize pieces
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

using namespace cardia::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)),
      written_(other.written_) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
    written_ = other.written_;
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_)
    return false;
  buffer_.clear();
  buffer_.reserve(kChunkSize);
  written_ = 0;
  return true;
}

bool FileLogger::write(const std::string& csv) {
  if (!fp_)
    return false;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunkSize)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t offset = 0;
  while (offset < buffer_.size()) {
    const std::size_t chunk = std::min(kChunkSize, buffer_.size() - offset);
    const std::size_t n = std::fwrite(buffer_.data() + offset, 1, chunk, fp_);
    if (n != chunk) {
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset + n));
      written_ += offset + n;
      return false;
    }
    offset += n;
  }
  written_ += offset;
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}
