#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace pr {

struct BoundarySpec {
  std::size_t chunk_size = 64 * 1024;  // greedy target, not a cap
  std::string boundary   = "\n";       // ends a record
  std::string start;                   // opens a record; empty = end-only
  bool require_boundary  = false;      // drop unterminated tail at EOF

  bool bracketed() const noexcept { return !start.empty(); }
};

enum class ScanAction {
  NeedMore,  // consume nothing, read more input
  Emit,      // deliver window[begin, end), consume `advance`
  Skip,      // consume `advance`, deliver nothing
  Done,      // window empty at EOF
};

struct ScanResult {
  ScanAction action = ScanAction::NeedMore;
  std::size_t begin = 0;
  std::size_t end = 0;
  std::size_t advance = 0;
};

// Decide what the next chunk is, given the unconsumed input `window` and
// whether the source is exhausted. Pure; never looks past `window`.
//
// End-only mode cuts after the last boundary in the window once the window
// holds at least chunk_size bytes (or EOF was seen). Bracketed mode emits the
// range from the first start sequence to the end of the last complete
// start...end span and skips everything that cannot belong to a span.
ScanResult scan_chunk(std::string_view window, bool at_eof, const BoundarySpec& spec);

// Copy an emitted bracketed range to `dst`, keeping only complete spans (the
// bytes between spans are left out). `dst` must hold token.size() bytes.
// Returns the number of bytes written.
std::size_t copy_spans(std::string_view token, const BoundarySpec& spec, char* dst);

}
