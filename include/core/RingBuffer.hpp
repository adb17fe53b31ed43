#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO used between log producers and the logger worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace cardia {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Mutex-guarded circular queue; producers never block, a full buffer
 *        rejects the push.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity ? capacity : 1) {}

      /// @returns false when the buffer is full (item not stored).
      bool tryPush(T item) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (count_ == slots_.size())
          return false;
        slots_[(head_ + count_) % slots_.size()] = std::move(item);
        ++count_;
        return true;
      }

      std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (count_ == 0)
          return std::nullopt;
        T item = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return item;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }

      std::size_t capacity() const { return slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace cardia
