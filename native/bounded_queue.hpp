/**
 * tcpgraph — Bounded blocking queue.
 * The two channels of the pipeline: captured frames (capture thread ->
 * aggregation thread) and bandwidth samples (aggregation thread -> consumer).
 * Never grows past its capacity. After close(), pushes fail and pops drain
 * what is left, then report kClosed.
 */

#ifndef TCPGRAPH_BOUNDED_QUEUE_HPP
#define TCPGRAPH_BOUNDED_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace tcpgraph {

enum class PopResult {
  kItem,
  kTimeout,
  kClosed,  // closed and empty
};

template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("BoundedQueue capacity must be > 0");
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  /** Block while full. Returns false if the queue is (or becomes) closed. */
  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  /** Never blocks. Returns false when full or closed. */
  bool try_push(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || items_.size() >= capacity_) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  /** Never blocks: evicts the oldest item when full. Returns false only when closed. */
  bool push_drop_oldest(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    if (items_.size() >= capacity_) {
      items_.pop_front();
      dropped_++;
    }
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  /** Block until an item arrives or the queue is closed and empty. */
  PopResult pop(T& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    return take_locked(out);
  }

  template <typename Clock, typename Duration>
  PopResult pop_until(T& out, const std::chrono::time_point<Clock, Duration>& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_until(lock, deadline, [this] { return closed_ || !items_.empty(); })) {
      return PopResult::kTimeout;
    }
    return take_locked(out);
  }

  template <typename Rep, typename Period>
  PopResult pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    return pop_until(out, std::chrono::steady_clock::now() + timeout);
  }

  /** Wake every waiter; further pushes fail. Idempotent. */
  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t capacity() const { return capacity_; }

  /** Items evicted by push_drop_oldest. */
  uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

 private:
  PopResult take_locked(T& out) {
    if (items_.empty()) return PopResult::kClosed;
    out = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return PopResult::kItem;
  }

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_{false};
  uint64_t dropped_{0};
};

}  // namespace tcpgraph

#endif  // TCPGRAPH_BOUNDED_QUEUE_HPP
