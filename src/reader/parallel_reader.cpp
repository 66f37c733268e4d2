#include "parallel_reader/parallel_reader.hpp"
#include "parallel_reader/boundary_scanner.hpp"
#include "parallel_reader/buffer_pool.hpp"
#include "parallel_reader/byte_source.hpp"
#include "parallel_reader/worker_pool.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pr {

namespace {

// A source that keeps returning nothing is treated as broken.
constexpr int kMaxEmptyReads = 100;

constexpr std::size_t kDefaultWindowFactor = 8;

std::string source_error(int sys_errno) {
  return sys_errno ? std::string(std::strerror(sys_errno)) : std::string("source read error");
}

}

std::size_t default_concurrency() noexcept {
  const unsigned n = std::thread::hardware_concurrency();
  return n ? static_cast<std::size_t>(n) : 1;
}

const char* to_string(ReadErrc c) noexcept {
  switch (c) {
    case ReadErrc::None:            return "none";
    case ReadErrc::InvalidConfig:   return "invalid config";
    case ReadErrc::SourceReadFault: return "source read fault";
    case ReadErrc::ScanOverflow:    return "scan overflow";
    case ReadErrc::CallbackFault:   return "callback fault";
  }
  return "unknown";
}

struct ParallelReader::Impl {
  Config cfg;
  ReadError err;
  MetricsRegistry metrics;
  double wall_ms{0.0};

  std::size_t max_window() const {
    return cfg.max_window_bytes ? cfg.max_window_bytes : cfg.chunk_size * kDefaultWindowFactor;
  }

  bool fail(ReadErrc code, std::string msg, int sys_errno = 0) {
    err.code = code;
    err.message = std::move(msg);
    err.sys_errno = sys_errno;
    if (cfg.verbose) std::cerr << "[read] " << to_string(code) << ": " << err.message << "\n";
    return false;
  }

  bool validate() {
    if (cfg.chunk_size == 0) return fail(ReadErrc::InvalidConfig, "chunk_size must be positive");
    if (cfg.boundary.empty()) return fail(ReadErrc::InvalidConfig, "boundary must not be empty");
    if (max_window() < cfg.chunk_size)
      return fail(ReadErrc::InvalidConfig, "max_window_bytes is smaller than chunk_size");
    return true;
  }

  void begin() {
    err = ReadError{};
    metrics.reset();
    wall_ms = 0.0;
  }

  // Shared tail of both entry points: close the queue, wait for every
  // worker, then decide which failure (if any) to surface.
  bool finish(ChunkQueue& queue, WorkerPool& workers, const BufferPool& pool,
              ReadError producer_err,
              std::chrono::steady_clock::time_point t0) {
    metrics.end_stage("produce");
    metrics.start_stage("drain");
    queue.close();
    workers.join();
    metrics.end_stage("drain");

    metrics.set_pool_stats(pool.allocated(), pool.reused(), pool.dropped());
    wall_ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - t0).count();

    if (producer_err)
      return fail(producer_err.code, std::move(producer_err.message), producer_err.sys_errno);
    if (workers.aborted())
      return fail(ReadErrc::CallbackFault, workers.first_fault());
    return true;
  }

  bool read(ByteSource& src, const Work& work) {
    begin();
    if (!validate()) return false;

    const auto t0 = std::chrono::steady_clock::now();
    const std::size_t n = cfg.concurrency ? cfg.concurrency : default_concurrency();
    const std::size_t limit = max_window();

    BoundarySpec spec;
    spec.chunk_size = cfg.chunk_size;
    spec.boundary = cfg.boundary;
    spec.start = cfg.boundary_start;
    spec.require_boundary = cfg.require_boundary;

    BufferPool pool(n, cfg.chunk_size);
    ChunkQueue queue(n);
    metrics.start_stage("produce");
    WorkerPool workers(WorkerPool::Config{n, cfg.recover_callback_faults},
                       queue, pool, work, metrics);

    // The window is only filled up to `want`; it passes chunk_size only while
    // a record is still missing its boundary.
    std::vector<char> win(cfg.chunk_size);
    std::size_t want = cfg.chunk_size;
    std::size_t head = 0, tail = 0;
    bool eof = false;
    int empty_reads = 0;
    ReadError perr;

    while (!workers.aborted()) {
      const std::string_view view(win.data() + head, tail - head);
      const ScanResult r = scan_chunk(view, eof, spec);

      if (r.action == ScanAction::Done) break;

      if (r.action == ScanAction::Emit) {
        const std::size_t len = r.end - r.begin;
        Chunk c;
        c.buffer = pool.borrow();
        if (c.buffer.size() < len) c.buffer.resize(len);
        c.readable_size = copy_spans(view.substr(r.begin, len), spec, c.buffer.data());
        metrics.add_discarded(r.advance - c.readable_size);
        head += r.advance;
        want = cfg.chunk_size;
        if (c.readable_size == 0) { pool.give_back(std::move(c.buffer)); continue; }
        if (!queue.push(std::move(c))) break;
        continue;
      }

      if (r.action == ScanAction::Skip) {
        metrics.add_discarded(r.advance);
        head += r.advance;
        want = cfg.chunk_size;
        continue;
      }

      // NeedMore: slide the unconsumed bytes down, grow if still full.
      if (head > 0) {
        std::memmove(win.data(), win.data() + head, tail - head);
        tail -= head;
        head = 0;
      }
      if (tail >= want) {
        if (tail >= limit) {
          perr = ReadError{ReadErrc::ScanOverflow,
                           "no boundary within " + std::to_string(limit) + " bytes", 0};
          break;
        }
        want = std::min(limit, std::max(want, tail) * 2);
      }
      if (win.size() < want) win.resize(want);

      const ReadResult rr = src.read(win.data() + tail, want - tail);
      tail += rr.bytes;
      metrics.add_bytes_in(rr.bytes);
      if (rr.status == ReadResult::Status::Error) {
        perr = ReadError{ReadErrc::SourceReadFault, source_error(rr.sys_errno), rr.sys_errno};
        break;
      }
      if (rr.status == ReadResult::Status::Eof) {
        eof = true;
      } else if (rr.bytes == 0) {
        if (++empty_reads >= kMaxEmptyReads) {
          perr = ReadError{ReadErrc::SourceReadFault, "source made no progress", 0};
          break;
        }
      } else {
        empty_reads = 0;
      }
    }

    return finish(queue, workers, pool, std::move(perr), t0);
  }

  bool read_fixed(ByteSource& src, const Work& work) {
    begin();
    if (!validate()) return false;

    const auto t0 = std::chrono::steady_clock::now();
    const std::size_t n = cfg.concurrency ? cfg.concurrency : default_concurrency();

    BufferPool pool(n, cfg.chunk_size);
    ChunkQueue queue(n);
    metrics.start_stage("produce");
    WorkerPool workers(WorkerPool::Config{n, cfg.recover_callback_faults},
                       queue, pool, work, metrics);

    bool eof = false;
    ReadError perr;

    while (!eof && !workers.aborted()) {
      Chunk c;
      c.buffer = pool.borrow();

      // Fill the whole buffer unless the stream ends first.
      std::size_t got = 0;
      int empty_reads = 0;
      while (got < cfg.chunk_size) {
        const ReadResult rr = src.read(c.buffer.data() + got, cfg.chunk_size - got);
        got += rr.bytes;
        metrics.add_bytes_in(rr.bytes);
        if (rr.status == ReadResult::Status::Error) {
          perr = ReadError{ReadErrc::SourceReadFault, source_error(rr.sys_errno), rr.sys_errno};
          break;
        }
        if (rr.status == ReadResult::Status::Eof) { eof = true; break; }
        if (rr.bytes == 0 && ++empty_reads >= kMaxEmptyReads) {
          perr = ReadError{ReadErrc::SourceReadFault, "source made no progress", 0};
          break;
        }
      }

      if (perr || got == 0) {
        pool.give_back(std::move(c.buffer));
        if (perr) break;
        continue;
      }
      c.readable_size = got;
      if (!queue.push(std::move(c))) break;
    }

    return finish(queue, workers, pool, std::move(perr), t0);
  }
};

ParallelReader::ParallelReader()
  : ParallelReader(Config{}) {}

ParallelReader::ParallelReader(Config cfg)
  : p_(new Impl{std::move(cfg), {}, {}, 0.0}) {}

ParallelReader::~ParallelReader() { delete p_; }

bool ParallelReader::read(ByteSource& src, const Work& work) { return p_->read(src, work); }
bool ParallelReader::read_fixed(ByteSource& src, const Work& work) { return p_->read_fixed(src, work); }

const ParallelReader::Config& ParallelReader::config() const noexcept { return p_->cfg; }
const ReadError& ParallelReader::last_error() const noexcept { return p_->err; }
RunStats ParallelReader::last_stats() const { return p_->metrics.snapshot(p_->wall_ms); }

}
