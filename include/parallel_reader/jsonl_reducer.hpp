#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace pr {

struct JsonlConfig {
  bool strict = true;        // count non-object lines as malformed
  bool skip_blank = true;    // ignore empty / whitespace-only lines
};

struct JsonlTotals {
  std::uint64_t lines = 0;
  std::uint64_t objects = 0;
  std::uint64_t fields = 0;      // top-level keys across all objects
  std::uint64_t malformed = 0;
};

// Per-chunk JSONL reduction. feed_chunk() is safe to call from several
// worker threads at once: parsing uses a thread-local simdjson parser and
// each chunk's counts are merged under a lock.
class JsonlReducer {
public:
  explicit JsonlReducer(JsonlConfig cfg = {});

  void feed_chunk(std::string_view chunk);

  // Reduce a single line into `out`. Returns false if the line is malformed.
  bool feed_line(std::string_view line, JsonlTotals& out) const;

  JsonlTotals totals() const;
  std::string first_error() const;

private:
  JsonlConfig cfg_;
  mutable std::mutex mu_;
  JsonlTotals totals_;
  std::string first_err_;
};

}
