#pragma once
/**
 * @file delivery_queue.hpp
 * @brief Bounded, thread-safe FIFO between the receive loop and the consumer.
 *
 * @details
 * The receive loop pushes; application threads pop. Storage is a
 * fixed-capacity `etl::deque`, so memory use is set at compile time no matter
 * how far behind the consumer falls.
 *
 * Overflow policy: **drop oldest**. A full queue evicts its front element to
 * make room, and push() returns false so the caller can count the loss. The
 * producer never blocks: a slow consumer costs old packets, never fresh ones,
 * and never stalls byte ingestion.
 *
 * pop() timeouts:
 *   - pop(0ms)   : poll; returns immediately
 *   - pop(d)     : waits up to d for an element
 *   - pop()      : waits until an element arrives
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

#include "etl/deque.h"

namespace zetta {

template <typename T, size_t CAPACITY>
class DeliveryQueue {
public:
  static constexpr size_t capacity() { return CAPACITY; }

  /// @brief Append @p item. @return false if the oldest element had to be evicted.
  bool push(const T& item) {
    bool kept_all = true;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (items_.full()) {
        items_.pop_front();               // drop-oldest
        kept_all = false;
      }
      items_.push_back(item);
    }
    cv_.notify_one();
    return kept_all;
  }

  /// @brief Take the front element, waiting up to @p timeout.
  std::optional<T> pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); })) return std::nullopt;
    return take_front();
  }

  /// @brief Take the front element, waiting as long as it takes.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return !items_.empty(); });
    return take_front();
  }

  /// @brief Discard everything queued. @return number of elements dropped.
  size_t flush() {
    std::lock_guard<std::mutex> lock(mtx_);
    const size_t n = items_.size();
    items_.clear();
    return n;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
  }

  bool empty() const { return size() == 0; }

private:
  // PRE: mtx_ held and items_ not empty
  std::optional<T> take_front() {
    std::optional<T> out(items_.front());
    items_.pop_front();
    return out;
  }

  mutable std::mutex         mtx_;
  std::condition_variable    cv_;
  etl::deque<T, CAPACITY>    items_;
};

} // namespace zetta
