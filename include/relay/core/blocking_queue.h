#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace relay {

/**
 * @brief Bounded FIFO channel between threads
 *
 * push() suspends the producer while the queue is full, tryPush() refuses
 * instead (drop-newest). close() wakes every waiter; items already queued
 * can still be popped after close.
 */
template <typename T>
class BlockingQueue {
 public:
  enum class PopStatus { Ok, Timeout, Closed };

  explicit BlockingQueue(size_t capacity) : capacity_(capacity) {}

  BlockingQueue(const BlockingQueue&) = delete;
  BlockingQueue& operator=(const BlockingQueue&) = delete;

  // Returns false if the queue was closed before space became available.
  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock,
                   [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool tryPush(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || items_.size() >= capacity_) {
        return false;
      }
      items_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    return true;
  }

  // Re-queues an item ahead of everything else, ignoring capacity.
  void pushFront(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      items_.push_front(std::move(item));
    }
    not_empty_.notify_one();
  }

  template <typename Rep, typename Period>
  PopStatus popFor(T& out, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout,
                             [this] { return closed_ || !items_.empty(); })) {
      return PopStatus::Timeout;
    }
    if (items_.empty()) {
      return PopStatus::Closed;
    }
    out = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return PopStatus::Ok;
  }

  bool tryPop(T& out) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (items_.empty()) {
        return false;
      }
      out = std::move(items_.front());
      items_.pop_front();
    }
    not_full_.notify_one();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Drops queued items; returns how many were discarded.
  size_t clear() {
    size_t dropped = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      dropped = items_.size();
      items_.clear();
    }
    not_full_.notify_all();
    return dropped;
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

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_{false};
};

}  // namespace relay
