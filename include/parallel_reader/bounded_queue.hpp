#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace pr {

// Fixed-capacity MPMC queue with blocking push/pop and an explicit close.
// pop() keeps returning items after close() until the queue is drained.
template <class T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity) : cap_(capacity ? capacity : 1) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Blocks while full. Returns false (and leaves `item` untouched) if the
  // queue was closed.
  bool push(T&& item) {
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, [&]{ return closed_ || q_.size() < cap_; });
    if (closed_) return false;
    q_.push_back(std::move(item));
    lk.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Blocks while empty and open. Returns false once closed and drained.
  bool pop(T& out) {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, [&]{ return closed_ || !q_.empty(); });
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

  std::size_t capacity() const noexcept { return cap_; }

private:
  const std::size_t cap_;
  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> q_;
  bool closed_{false};
};

}
