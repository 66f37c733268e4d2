#include "parallel_reader/boundary_scanner.hpp"
#include <cstring>

namespace pr {

namespace {

ScanResult need_more() { return ScanResult{}; }

ScanResult emit(std::size_t begin, std::size_t end, std::size_t advance) {
  return ScanResult{ScanAction::Emit, begin, end, advance};
}

ScanResult skip(std::size_t n) {
  ScanResult r;
  r.action = ScanAction::Skip;
  r.advance = n;
  return r;
}

ScanResult done() {
  ScanResult r;
  r.action = ScanAction::Done;
  return r;
}

ScanResult scan_end_only(std::string_view w, bool at_eof, const BoundarySpec& spec) {
  const std::size_t idx = w.rfind(spec.boundary);
  if (idx != std::string_view::npos) {
    const std::size_t cut = idx + spec.boundary.size();
    return emit(0, cut, cut);
  }

  // Chunk size is soft; never cut inside a record while input remains.
  if (!at_eof) return need_more();

  if (spec.require_boundary) return skip(w.size());
  return emit(0, w.size(), w.size());
}

ScanResult scan_bracketed(std::string_view w, bool at_eof, const BoundarySpec& spec) {
  const std::string_view open(spec.start);
  const std::string_view close(spec.boundary);

  const std::size_t first = w.find(open);
  if (first == std::string_view::npos) {
    if (at_eof) return skip(w.size());
    // Keep a tail that could still be the beginning of a start sequence.
    const std::size_t keep = open.size() - 1;
    if (w.size() > keep) return skip(w.size() - keep);
    return need_more();
  }
  if (first > 0) return skip(first);

  // Window starts on a start sequence; find the last complete span.
  std::size_t pos = 0;
  std::size_t last_end = 0;
  while (pos < w.size()) {
    const std::size_t s = w.find(open, pos);
    if (s == std::string_view::npos) break;
    const std::size_t e = w.find(close, s + open.size());
    if (e == std::string_view::npos) break;
    last_end = e + close.size();
    pos = last_end;
  }

  if (last_end > 0) return emit(0, last_end, last_end);

  // Open bracket with no close yet.
  if (!at_eof) return need_more();
  return skip(w.size());
}

}

ScanResult scan_chunk(std::string_view window, bool at_eof, const BoundarySpec& spec) {
  if (window.empty() && at_eof) return done();

  // Greedy: try to hold at least chunk_size bytes before cutting.
  if (!at_eof && window.size() < spec.chunk_size) return need_more();

  if (spec.bracketed()) return scan_bracketed(window, at_eof, spec);
  return scan_end_only(window, at_eof, spec);
}

std::size_t copy_spans(std::string_view token, const BoundarySpec& spec, char* dst) {
  if (!spec.bracketed()) {
    std::memcpy(dst, token.data(), token.size());
    return token.size();
  }

  const std::string_view open(spec.start);
  const std::string_view close(spec.boundary);
  std::size_t out = 0;
  std::size_t pos = 0;
  while (pos < token.size()) {
    const std::size_t s = token.find(open, pos);
    if (s == std::string_view::npos) break;
    const std::size_t e = token.find(close, s + open.size());
    if (e == std::string_view::npos) break;
    const std::size_t n = e + close.size() - s;
    std::memcpy(dst + out, token.data() + s, n);
    out += n;
    pos = e + close.size();
  }
  return out;
}

}
