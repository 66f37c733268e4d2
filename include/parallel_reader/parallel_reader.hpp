#pragma once
#include "parallel_reader/metrics.hpp"
#include "parallel_reader/read_error.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace pr {

class ByteSource;

// Splits a byte stream into chunks and hands each chunk to one of
// `concurrency` worker threads. Chunks arrive in no particular order.
//
// read() cuts only after a record boundary; read_fixed() cuts every
// chunk_size bytes. Both return once every chunk has been processed and all
// workers are joined; on false, last_error() says why.
class ParallelReader {
public:
  struct Config {
    std::size_t concurrency      = 0;          // 0 -> hardware threads
    std::size_t chunk_size       = 64 * 1024;  // 64 KiB target
    std::string boundary         = "\n";
    std::string boundary_start;                // empty = end-only records
    bool        require_boundary = false;      // drop unterminated tail
    std::size_t max_window_bytes = 0;          // 0 -> 8 * chunk_size
    bool        recover_callback_faults = false;
    bool        verbose          = false;      // log failures to stderr
  };

  using Work = std::function<void(std::string_view)>;

  ParallelReader();                    // uses default Config{}
  explicit ParallelReader(Config cfg);
  ~ParallelReader();

  ParallelReader(const ParallelReader&) = delete;
  ParallelReader& operator=(const ParallelReader&) = delete;

  bool read(ByteSource& src, const Work& work);
  bool read_fixed(ByteSource& src, const Work& work);

  const Config& config() const noexcept;
  const ReadError& last_error() const noexcept;
  RunStats last_stats() const;

private:
  struct Impl; Impl* p_;
};

std::size_t default_concurrency() noexcept;

}
