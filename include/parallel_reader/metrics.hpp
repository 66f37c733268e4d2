#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pr {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;            // delivered to callbacks
  std::uint64_t bytes_in = 0;         // pulled from the source
  std::uint64_t discarded_bytes = 0;  // junk / unterminated tails
  std::uint64_t callback_faults = 0;
  std::uint64_t pool_allocated = 0;
  std::uint64_t pool_reused = 0;
  std::uint64_t pool_dropped = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;
  double chunks_per_sec = 0.0;

  std::vector<StageTiming> stages;
};

// Per-call counters. Chunk/byte/fault counters are bumped from worker
// threads; stage timing is producer-only.
class MetricsRegistry {
public:
  void reset();
  void add_chunk(std::uint64_t bytes) noexcept {
    chunks_.fetch_add(1, std::memory_order_relaxed);
    bytes_.fetch_add(bytes, std::memory_order_relaxed);
  }
  void add_bytes_in(std::uint64_t b) noexcept { bytes_in_.fetch_add(b, std::memory_order_relaxed); }
  void add_discarded(std::uint64_t b) noexcept { discarded_.fetch_add(b, std::memory_order_relaxed); }
  void add_callback_fault() noexcept { faults_.fetch_add(1, std::memory_order_relaxed); }
  void set_pool_stats(std::uint64_t allocated, std::uint64_t reused, std::uint64_t dropped) noexcept;

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::atomic<std::uint64_t> chunks_{0};
  std::atomic<std::uint64_t> bytes_{0};
  std::atomic<std::uint64_t> bytes_in_{0};
  std::atomic<std::uint64_t> discarded_{0};
  std::atomic<std::uint64_t> faults_{0};
  std::uint64_t pool_allocated_{0};
  std::uint64_t pool_reused_{0};
  std::uint64_t pool_dropped_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
