#include "parallel_reader/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace pr {

void MetricsRegistry::reset() {
  chunks_ = bytes_ = bytes_in_ = discarded_ = faults_ = 0;
  pool_allocated_ = pool_reused_ = pool_dropped_ = 0;
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::set_pool_stats(std::uint64_t allocated, std::uint64_t reused,
                                     std::uint64_t dropped) noexcept {
  pool_allocated_ = allocated;
  pool_reused_ = reused;
  pool_dropped_ = dropped;
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.chunks = chunks_.load();
  r.bytes = bytes_.load();
  r.bytes_in = bytes_in_.load();
  r.discarded_bytes = discarded_.load();
  r.callback_faults = faults_.load();
  r.pool_allocated = pool_allocated_;
  r.pool_reused = pool_reused_;
  r.pool_dropped = pool_dropped_;
  r.wall_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (r.bytes_in / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;
  r.chunks_per_sec = (wall_ms > 0.0) ? r.chunks / (wall_ms / 1000.0) : 0.0;

  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    r.stages.push_back(StageTiming{name, it == stage_accum_ms_.end() ? 0 : it->second});
  }
  return r;
}

}
