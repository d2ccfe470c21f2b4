#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded FIFO between a producer thread and the logger worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace hvload {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity circular queue; producers never block.
 *
 *  * `tryPush()` refuses when full so the sampling thread is never stalled by I/O.
 *  * `popFor()` blocks the consumer up to a timeout.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be > 0");
      }

      bool tryPush(T item) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (size_ == slots_.size())
            return false;
          slots_[(head_ + size_) % slots_.size()] = std::move(item);
          ++size_;
        }
        cv_.notify_one();
        return true;
      }

      std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return size_ > 0; }))
          return std::nullopt;
        T item = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return item;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return size_;
      }

      std::size_t capacity() const { return slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 }; ///< oldest element
      std::size_t size_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace hvload
