#include "parallel_reader/worker_pool.hpp"
#include "parallel_reader/metrics.hpp"

#include <exception>
#include <utility>

namespace pr {

WorkerPool::WorkerPool(Config cfg, ChunkQueue& queue, BufferPool& pool,
                       const Work& work, MetricsRegistry& metrics)
  : cfg_(cfg), queue_(queue), pool_(pool), work_(work), metrics_(metrics) {
  const std::size_t n = cfg_.threads ? cfg_.threads : 1;
  threads_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) threads_.emplace_back([this]{ run(); });
}

WorkerPool::~WorkerPool() {
  queue_.close();
  join();
}

void WorkerPool::join() {
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

std::string WorkerPool::first_fault() const {
  std::lock_guard<std::mutex> lk(fault_mu_);
  return first_fault_;
}

void WorkerPool::record_fault(std::string what) {
  faults_.fetch_add(1, std::memory_order_relaxed);
  metrics_.add_callback_fault();
  {
    std::lock_guard<std::mutex> lk(fault_mu_);
    if (first_fault_.empty()) first_fault_ = what.empty() ? "callback threw" : std::move(what);
  }
  if (!cfg_.recover_faults) aborted_.store(true, std::memory_order_release);
}

void WorkerPool::run() {
  Chunk c;
  while (queue_.pop(c)) {
    // After an unrecovered fault the rest of the queue is drained unprocessed.
    if (!aborted()) {
      try {
        work_(c.bytes());
        metrics_.add_chunk(c.readable_size);
      } catch (const std::exception& e) {
        record_fault(e.what());
      } catch (...) {
        record_fault("non-standard exception");
      }
    }
    pool_.give_back(std::move(c.buffer));
    c = Chunk{};
  }
}

}
