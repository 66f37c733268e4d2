#include "parallel_reader/buffer_pool.hpp"
#include <utility>

namespace pr {

BufferPool::BufferPool(std::size_t max_idle, std::size_t buffer_size)
  : max_idle_(max_idle), buffer_size_(buffer_size) {
  free_.reserve(max_idle_);
}

Buffer BufferPool::borrow() {
  {
    std::unique_lock<std::mutex> lk(mu_, std::try_to_lock);
    if (lk.owns_lock() && !free_.empty()) {
      Buffer b = std::move(free_.back());
      free_.pop_back();
      lk.unlock();
      b.resize(buffer_size_);
      reused_.fetch_add(1, std::memory_order_relaxed);
      return b;
    }
  }
  allocated_.fetch_add(1, std::memory_order_relaxed);
  return Buffer(buffer_size_);
}

void BufferPool::give_back(Buffer buf) {
  // Oversized buffers (grown for a long record) are not worth caching.
  if (buf.capacity() < buffer_size_ || buf.capacity() > buffer_size_ * 2) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  std::unique_lock<std::mutex> lk(mu_, std::try_to_lock);
  if (!lk.owns_lock() || free_.size() >= max_idle_) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  free_.push_back(std::move(buf));
}

std::size_t BufferPool::idle() const {
  std::lock_guard<std::mutex> lk(mu_);
  return free_.size();
}

}
