/**
 * @file concurrent_queue.hpp
 * @brief Thread-safe FIFO used as the analysis event channel
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace wenjiao {

template <class T> class ConcurrentQueue {
public:
  ConcurrentQueue() = default;

  ConcurrentQueue(const ConcurrentQueue &) = delete;
  ConcurrentQueue &operator=(const ConcurrentQueue &) = delete;

  void push(T value) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      q_.push_back(std::move(value));
    }
    cv_.notify_one();
  }

  [[nodiscard]] std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mu_);
    if (q_.empty()) {
      return std::nullopt;
    }
    T value = std::move(q_.front());
    q_.pop_front();
    return value;
  }

  /// Blocks until a value arrives or a stop is requested
  [[nodiscard]] std::optional<T> pop_wait(std::stop_token st) {
    std::unique_lock<std::mutex> lock(mu_);

    cv_.wait(lock, st, [this] { return !q_.empty(); });

    if (q_.empty()) {
      return std::nullopt;
    }

    T value = std::move(q_.front());
    q_.pop_front();
    return value;
  }

  /// Blocks for at most @p timeout
  template <class Rep, class Period>
  [[nodiscard]] std::optional<T>
  pop_wait_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mu_);

    if (!cv_.wait_for(lock, timeout, [this] { return !q_.empty(); })) {
      return std::nullopt;
    }

    T value = std::move(q_.front());
    q_.pop_front();
    return value;
  }

  /// Removes and returns everything currently queued
  [[nodiscard]] std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<T> out;
    out.reserve(q_.size());
    for (auto &value : q_) {
      out.push_back(std::move(value));
    }
    q_.clear();
    return out;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

  [[nodiscard]] bool empty() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.empty();
  }

private:
  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<T> q_;
};

} // namespace wenjiao
