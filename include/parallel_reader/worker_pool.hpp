#pragma once
#include "parallel_reader/bounded_queue.hpp"
#include "parallel_reader/buffer_pool.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace pr {

class MetricsRegistry;

// A borrowed buffer plus the length a worker should look at.
struct Chunk {
  Buffer buffer;
  std::size_t readable_size = 0;

  std::string_view bytes() const noexcept {
    return std::string_view(buffer.data(), readable_size);
  }
};

using ChunkQueue = BoundedQueue<Chunk>;

// Fixed set of threads draining a ChunkQueue. Each chunk goes to exactly one
// worker, which runs the callback and hands the buffer back to the pool.
// Threads exit once the queue is closed and empty; the destructor closes the
// queue and joins.
class WorkerPool {
public:
  using Work = std::function<void(std::string_view)>;

  struct Config {
    std::size_t threads = 1;
    bool recover_faults = false;  // keep calling back after a throw
  };

  WorkerPool(Config cfg, ChunkQueue& queue, BufferPool& pool,
             const Work& work, MetricsRegistry& metrics);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void join();

  // True once a callback threw and recovery is off.
  bool aborted() const noexcept { return aborted_.load(std::memory_order_acquire); }
  std::uint64_t faults() const noexcept { return faults_.load(std::memory_order_relaxed); }
  std::string first_fault() const;

private:
  void run();
  void record_fault(std::string what);

  Config cfg_;
  ChunkQueue& queue_;
  BufferPool& pool_;
  const Work& work_;
  MetricsRegistry& metrics_;

  std::vector<std::thread> threads_;
  std::atomic<bool> aborted_{false};
  std::atomic<std::uint64_t> faults_{0};
  mutable std::mutex fault_mu_;
  std::string first_fault_;
};

}
