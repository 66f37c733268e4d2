#include "parallel_reader/parallel_reader.hpp"
#include "parallel_reader/byte_source.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct Collected {
  bool ok = false;
  pr::ReadError err;
  pr::RunStats stats;
  std::vector<std::string> chunks;  // sorted
};

static Collected run(const pr::ParallelReader::Config& cfg, std::string input,
                     pr::StringSource::Config scfg = {}) {
  pr::ParallelReader r(cfg);
  pr::StringSource src(std::move(input), scfg);
  std::mutex mu;
  Collected out;
  out.ok = r.read(src, [&](std::string_view c){
    std::lock_guard<std::mutex> lk(mu);
    out.chunks.emplace_back(c);
  });
  out.err = r.last_error();
  out.stats = r.last_stats();
  std::sort(out.chunks.begin(), out.chunks.end());
  return out;
}

static pr::ParallelReader::Config cfg_with(std::size_t chunk, std::string boundary = "\n") {
  pr::ParallelReader::Config c;
  c.concurrency = 4;
  c.chunk_size = chunk;
  c.boundary = std::move(boundary);
  return c;
}

static bool same(std::vector<std::string> got, std::vector<std::string> want) {
  std::sort(want.begin(), want.end());
  return got == want;
}

// Lines are unique, so every chunk occurs exactly once in the input and the
// chunks can be put back in stream order.
static std::string reassemble(const std::string& input, const std::vector<std::string>& chunks) {
  std::vector<std::pair<std::size_t, const std::string*>> at;
  for (const auto& c : chunks) at.emplace_back(input.find(c), &c);
  std::sort(at.begin(), at.end());
  std::string out;
  for (auto& p : at) out += *p.second;
  return out;
}

static std::string make_lines(std::size_t n, std::size_t max_len, bool trailing_newline, unsigned seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<std::size_t> len{0, max_len};
  std::string s;
  for (std::size_t i = 0; i < n; ++i) {
    s += "r" + std::to_string(i) + ":";
    s.append(len(rng), static_cast<char>('a' + i % 26));
    if (i + 1 < n || trailing_newline) s += '\n';
  }
  return s;
}

int main(){
  // Reference scenarios.
  {
    auto r = run(cfg_with(6), "abc\ndef\n");
    expect(r.ok && same(r.chunks, {"abc\n", "def\n"}), "chunk_size 6 splits into two lines");

    r = run(cfg_with(1 << 16), "abc\ndef\n");
    expect(r.ok && same(r.chunks, {"abc\ndef\n"}), "chunk_size larger than input yields one chunk");

    r = run(cfg_with(16, "END"), "abcdefgENDhijklmnopEND");
    expect(r.ok && same(r.chunks, {"abcdefgEND", "hijklmnopEND"}), "multi-byte boundary");

    r = run(cfg_with(1 << 16, "|SPLIT|"), "abcdefg|SPLIT|hijklmnop|SPLIT|hello");
    expect(r.ok && same(r.chunks, {"abcdefg|SPLIT|hijklmnop|SPLIT|", "hello"}),
           "unterminated tail emitted when boundary not required");

    auto c = cfg_with(1 << 16, "|SPLIT|");
    c.require_boundary = true;
    r = run(c, "abcdefg|SPLIT|hijklmnop|SPLIT|hello");
    expect(r.ok && same(r.chunks, {"abcdefg|SPLIT|hijklmnop|SPLIT|"}),
           "unterminated tail discarded when boundary required");
    expect(r.stats.discarded_bytes == 5, "discarded tail is counted");

    c = cfg_with(1 << 16, "</FOO>");
    c.boundary_start = "<FOO>";
    c.require_boundary = true;
    r = run(c, "abcdefg<FOO>hijklmnop</FOO>hello");
    expect(r.ok && same(r.chunks, {"<FOO>hijklmnop</FOO>"}), "bracketed record");
  }

  // Empty input and boundary-free input.
  {
    auto r = run(cfg_with(8), "");
    expect(r.ok && r.chunks.empty(), "empty input yields no chunks");

    auto c = cfg_with(8);
    c.require_boundary = true;
    r = run(c, "never terminated");
    expect(r.ok && r.chunks.empty(), "no boundary + require_boundary yields no chunks");
  }

  // Properties over many lines with short reads.
  {
    const std::string input = make_lines(2000, 20, false, 7);
    pr::StringSource::Config sc;
    sc.max_read = 7;
    auto r = run(cfg_with(64), input, sc);
    expect(r.ok, "random lines read ok");

    std::size_t unterminated = 0, total = 0, oversize = 0;
    for (const auto& ch : r.chunks) {
      total += ch.size();
      if (ch.back() != '\n') ++unterminated;
      if (ch.size() > 64) ++oversize;
    }
    expect(total == input.size(), "no bytes lost or duplicated");
    expect(unterminated == 1, "only the final tail lacks a newline");
    expect(oversize == 0, "chunks stay within chunk_size when records fit");
    expect(reassemble(input, r.chunks) == input, "chunks reassemble to the input");
    expect(r.stats.chunks == r.chunks.size(), "stats count chunks");
    expect(r.stats.bytes_in == input.size(), "stats count source bytes");
    expect(r.stats.pool_allocated + r.stats.pool_reused == r.chunks.size(), "one borrow per chunk");

    auto again = run(cfg_with(64), input, sc);
    expect(again.chunks == r.chunks, "same input gives the same multiset of chunks");

    auto c = cfg_with(64);
    c.require_boundary = true;
    auto req = run(c, input, sc);
    expect(req.chunks.size() == r.chunks.size() - 1 ||
           (req.chunks.size() == r.chunks.size() && req.stats.bytes < r.stats.bytes),
           "require_boundary drops only the tail fragment");
    expect(req.stats.bytes + req.stats.discarded_bytes == input.size(), "tail accounted as discarded");
  }

  // Records longer than chunk_size grow the chunk instead of splitting.
  {
    const std::string input = make_lines(50, 300, true, 11);
    auto c = cfg_with(32);
    c.max_window_bytes = 4096;
    auto r = run(c, input);
    bool all_terminated = true;
    for (const auto& ch : r.chunks) all_terminated &= (ch.back() == '\n');
    expect(r.ok && all_terminated, "long records are never split");
    expect(reassemble(input, r.chunks) == input, "long records reassemble");
  }

  // After one long record the chunks shrink back to chunk_size and buffers are reused.
  {
    std::string input = "L" + std::string(1000, 'x') + "\n";
    for (int i = 0; i < 400; ++i) input += "s" + std::to_string(i) + "\n";
    auto c = cfg_with(32);
    c.concurrency = 2;
    c.max_window_bytes = 4096;
    auto r = run(c, input);
    expect(r.ok, "long record then short lines read ok");
    std::size_t biggest = 0;
    for (const auto& ch : r.chunks) {
      if (ch.find('L') == std::string::npos) biggest = std::max(biggest, ch.size());
    }
    expect(biggest > 0 && biggest <= 32, "short-line chunks back within chunk_size, got " +
           std::to_string(biggest));
    expect(r.chunks.size() > 50, "short lines spread over many chunks");
    expect(reassemble(input, r.chunks) == input, "grown window reassembles");
    expect(r.stats.pool_reused > 0, "pool reuses buffers after the window grew");
  }

  // Multi-byte boundary split across short reads.
  {
    std::string input;
    for (int i = 0; i < 200; ++i) input += "rec" + std::to_string(i) + "END";
    for (std::size_t max_read : {1, 2, 3, 5}) {
      pr::StringSource::Config sc;
      sc.max_read = max_read;
      auto r = run(cfg_with(16, "END"), input, sc);
      bool terminated = r.ok;
      for (const auto& ch : r.chunks) {
        terminated &= ch.size() >= 3 && ch.compare(ch.size() - 3, 3, "END") == 0;
      }
      const std::string tag = " (max_read " + std::to_string(max_read) + ")";
      expect(terminated, "every chunk ends on a whole END" + tag);
      expect(reassemble(input, r.chunks) == input, "END records reassemble" + tag);
    }
  }

  // Live buffers stay bounded by concurrency on a large input.
  {
    const std::string input = make_lines(20000, 12, true, 13);
    auto r = run(cfg_with(64), input);
    expect(r.ok && r.stats.chunks > 1000, "large input read ok");
    expect(r.stats.pool_allocated <= r.stats.chunks / 4,
           "buffers recycled, allocated " + std::to_string(r.stats.pool_allocated) +
           " for " + std::to_string(r.stats.chunks) + " chunks");
  }

  // Bracketed: only complete spans reach the callback.
  {
    std::string input;
    for (int i = 0; i < 300; ++i) {
      input += "junk" + std::to_string(i) + "<rec>" + std::to_string(i) + "</rec>";
    }
    input += "<rec>open-ended";
    auto c = cfg_with(100, "</rec>");
    c.boundary_start = "<rec>";
    auto r = run(c, input, pr::StringSource::Config{13, 0, 5});
    std::size_t spans = 0;
    bool clean = r.ok;
    for (const auto& ch : r.chunks) {
      clean &= ch.find("junk") == std::string::npos;
      clean &= ch.find("open-ended") == std::string::npos;
      clean &= ch.rfind("<rec>", 0) == 0;
      for (auto p = ch.find("</rec>"); p != std::string::npos; p = ch.find("</rec>", p + 1)) ++spans;
    }
    expect(clean, "bracketed chunks contain only complete spans");
    expect(spans == 300, "every span delivered once, got " + std::to_string(spans));
  }

  // Boundary never found within the window limit.
  {
    auto c = cfg_with(64);
    c.max_window_bytes = 256;
    std::atomic<int> calls{0};
    pr::ParallelReader rd(c);
    pr::StringSource src(std::string(10000, 'x'));
    bool ok = rd.read(src, [&](std::string_view){ ++calls; });
    expect(!ok && rd.last_error().code == pr::ReadErrc::ScanOverflow, "scan overflow reported");
    expect(calls.load() == 0, "nothing delivered on overflow");
  }

  // Source fault after some data has been dispatched.
  {
    pr::StringSource::Config sc;
    sc.fail_after = 1000;
    auto r = run(cfg_with(64), make_lines(500, 10, true, 3), sc);
    expect(!r.ok && r.err.code == pr::ReadErrc::SourceReadFault, "source fault reported");
    expect(r.err.sys_errno == 5, "source fault keeps errno");

    sc.fail_errno = 0;
    r = run(cfg_with(64), make_lines(500, 10, true, 3), sc);
    expect(!r.ok && r.err.code == pr::ReadErrc::SourceReadFault, "errno-less source fault reported");
    expect(r.err.message == "source read error", "errno-less fault has a fixed message, got " +
           r.err.message);
  }

  // Callback faults: fatal by default, counted in recovery mode.
  {
    const std::string input = make_lines(400, 10, true, 5);
    auto thrower = [](std::string_view c){
      if (c.find("r7:") != std::string_view::npos) throw std::runtime_error("bad record r7");
    };

    pr::ParallelReader fatal(cfg_with(64));
    pr::StringSource s1(input);
    bool ok = fatal.read(s1, thrower);
    expect(!ok && fatal.last_error().code == pr::ReadErrc::CallbackFault, "callback fault is fatal");
    expect(fatal.last_error().message == "bad record r7", "callback fault message kept");

    auto c = cfg_with(64);
    c.recover_callback_faults = true;
    pr::ParallelReader lenient(c);
    pr::StringSource s2(input);
    std::atomic<std::size_t> bytes{0};
    ok = lenient.read(s2, [&](std::string_view ch){ thrower(ch); bytes += ch.size(); });
    expect(ok, "recovery mode completes");
    expect(lenient.last_stats().callback_faults == 1, "recovered fault counted");
    expect(bytes.load() < input.size() && bytes.load() > 0, "other chunks still processed");
  }

  // Invalid configuration fails before any work.
  {
    auto c = cfg_with(64, "");
    pr::ParallelReader rd(c);
    pr::StringSource src("a\n");
    expect(!rd.read(src, [](std::string_view){}) &&
           rd.last_error().code == pr::ReadErrc::InvalidConfig, "empty boundary rejected");

    c = cfg_with(0);
    pr::ParallelReader rd2(c);
    expect(!rd2.read(src, [](std::string_view){}) &&
           rd2.last_error().code == pr::ReadErrc::InvalidConfig, "zero chunk_size rejected");
  }

  // Default config: hardware concurrency, newline records, 64 KiB chunks.
  {
    pr::ParallelReader rd;
    expect(rd.config().chunk_size == 64 * 1024 && rd.config().boundary == "\n",
           "default config");
    pr::StringSource src("one\ntwo\nthree\n");
    std::atomic<int> calls{0};
    expect(rd.read(src, [&](std::string_view){ ++calls; }) && calls.load() == 1, "default read");
  }

  if (failures) return 1;
  std::cout << "[PASS] parallel reader\n";
  return 0;
}
