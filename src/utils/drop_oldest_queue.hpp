#ifndef DROP_OLDEST_QUEUE_HPP
#define DROP_OLDEST_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

// Bounded queue that never rejects a push: when full, the longest-queued
// element is discarded to make room. Producers never wait on consumers.
template <typename T> class DropOldestQueue {
public:
  explicit DropOldestQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

  // Returns true when an older element had to be dropped
  bool push(T value) {
    bool dropped = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      if (queue_.size() >= capacity_) {
        queue_.pop_front();
        dropped = true;
        dropped_count_++;
      }
      queue_.push_back(std::move(value));
    }
    cond_.notify_one();
    return dropped;
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
      return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Blocks until an element arrives, the timeout passes or the queue closes
  std::optional<T> wait_and_pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty())
      return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Releases the buffered elements and wakes every waiter
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      queue_.clear();
      queue_.shrink_to_fit();
    }
    cond_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t capacity() const { return capacity_; }

  size_t dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_count_;
  }

  std::vector<T> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<T>(queue_.begin(), queue_.end());
  }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cond_;
  std::deque<T> queue_;
  size_t dropped_count_ = 0;
  bool closed_ = false;
};

#endif // DROP_OLDEST_QUEUE_HPP
