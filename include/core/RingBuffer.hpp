#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded blocking FIFO between the decode loop and the log worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace uartdec {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity single-producer / single-consumer queue.
 *
 *  * `push()` blocks while full, `pop()` blocks while empty.
 *  * After `close()`, `push()` throws and `pop()` drains the remaining
 *    items then returns std::nullopt.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be positive");
      }

      void push(T item) {
        std::unique_lock<std::mutex> lock(mtx_);
        notFull_.wait(lock, [this] { return closed_ || size_ < slots_.size(); });
        if (closed_)
          throw std::runtime_error("[RingBuffer] push after close");
        slots_[tail_] = std::move(item);
        tail_ = (tail_ + 1) % slots_.size();
        ++size_;
        notEmpty_.notify_one();
      }

      std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mtx_);
        notEmpty_.wait(lock, [this] { return closed_ || size_ > 0; });
        if (size_ == 0)
          return std::nullopt; // closed and drained
        T item = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --size_;
        notFull_.notify_one();
        return item;
      }

      void close() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return size_;
      }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t tail_{ 0 };
      std::size_t size_{ 0 };
      bool closed_{ false };
      mutable std::mutex mtx_;
      std::condition_variable notEmpty_;
      std::condition_variable notFull_;
    };

  } // namespace core
} // namespace uartdec
