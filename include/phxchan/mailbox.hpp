#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace phxchan {

/// Unbounded FIFO shared between threads. post() never waits for a reader.
template <typename T> class mailbox {
public:
  using clock = std::chrono::steady_clock;

  /// Returns false once the mailbox is closed; the item is dropped.
  bool post(T item) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_)
        return false;
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  /// Blocks until an item arrives. Empty only after close() and drain.
  std::optional<T> take() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
    return pop_locked();
  }

  std::optional<T> take_until(clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_until(lock, deadline,
                   [this]() { return !queue_.empty() || closed_; });
    return pop_locked();
  }

  template <typename Rep, typename Period>
  std::optional<T> take_for(std::chrono::duration<Rep, Period> timeout) {
    return take_until(clock::now() +
                      std::chrono::duration_cast<clock::duration>(timeout));
  }

  /// Items already queued stay readable; later posts are refused.
  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

private:
  std::optional<T> pop_locked() {
    if (queue_.empty())
      return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    return item;
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool closed_ = false;
};

} // namespace phxchan
