#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace pr {

using Buffer = std::vector<char>;

// Bounded cache of reusable byte buffers shared by the producer and workers.
// Neither borrow() nor give_back() ever waits: a contended or empty free list
// means a fresh allocation, a contended or full one means the buffer is
// dropped.
class BufferPool {
public:
  BufferPool(std::size_t max_idle, std::size_t buffer_size);

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  Buffer borrow();
  void give_back(Buffer buf);

  std::size_t buffer_size() const noexcept { return buffer_size_; }
  std::size_t max_idle() const noexcept { return max_idle_; }
  std::size_t idle() const;

  std::uint64_t allocated() const noexcept { return allocated_.load(std::memory_order_relaxed); }
  std::uint64_t reused() const noexcept { return reused_.load(std::memory_order_relaxed); }
  std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
  const std::size_t max_idle_;
  const std::size_t buffer_size_;
  mutable std::mutex mu_;
  std::vector<Buffer> free_;

  std::atomic<std::uint64_t> allocated_{0};
  std::atomic<std::uint64_t> reused_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}
