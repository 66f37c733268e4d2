#include "parallel_reader/byte_source.hpp"
#include "parallel_reader/jsonl_reducer.hpp"
#include "parallel_reader/parallel_reader.hpp"
#include "parallel_reader/parse_util.hpp"
#include "parallel_reader/run_json.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

namespace {

struct Cli {
  std::size_t concurrency = 0;
  std::size_t chunk_size = 64 * 1024;
  std::size_t max_window = 0;
  std::string boundary = "\n";
  std::string boundary_start;
  bool require_boundary = false;
  bool fixed = false;
  bool recover = false;
  bool verbose = false;
  std::string work = "bytes";     // bytes|records|jsonl
  std::string stats_json;
  std::string input = "-";
};

[[noreturn]] void usage_and_exit(int rc) {
  std::cout <<
    "Usage: parallel-reader [--concurrency=N] [--chunk-size=SIZE] [--max-window=SIZE]\n"
    "                       [--boundary=STR] [--boundary-start=STR] [--require-boundary]\n"
    "                       [--fixed] [--work=bytes|records|jsonl] [--recover]\n"
    "                       [--stats-json=PATH] [-v] [FILE|-]\n"
    "SIZE accepts B/K/KiB/M/MiB/G/GiB suffixes (e.g. 64KiB, 1.5M).\n"
    "STR accepts \\n \\r \\t \\0 \\\\ escapes.\n"
    "Env: PR_CONCURRENCY, PR_CHUNK_SIZE are used when the flag is absent.\n";
  std::exit(rc);
}

std::size_t size_or_die(const std::string& flag, const std::string& v) {
  auto n = pr::parse_size(v);
  if (!n) { std::cerr << "[cli] bad value for " << flag << ": '" << v << "'\n"; std::exit(1); }
  return *n;
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  if (const char* e = std::getenv("PR_CONCURRENCY"); e && *e) c.concurrency = size_or_die("PR_CONCURRENCY", e);
  if (const char* e = std::getenv("PR_CHUNK_SIZE"); e && *e)  c.chunk_size  = size_or_die("PR_CHUNK_SIZE", e);

  bool have_input = false;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_size = [&](const char* pfx, std::size_t* out){
      if (a.rfind(pfx, 0) == 0) { *out = size_or_die(pfx, a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    std::string raw;
    if (eat_size("--concurrency=", &c.concurrency)) continue;
    if (eat_size("--chunk-size=", &c.chunk_size)) continue;
    if (eat_size("--max-window=", &c.max_window)) continue;
    if (eat("--boundary=", &raw))       { c.boundary = pr::unescape(raw); continue; }
    if (eat("--boundary-start=", &raw)) { c.boundary_start = pr::unescape(raw); continue; }
    if (eat("--work=", &c.work)) continue;
    if (eat("--stats-json=", &c.stats_json)) continue;
    if (a == "--require-boundary") { c.require_boundary = true; continue; }
    if (a == "--fixed")   { c.fixed = true; continue; }
    if (a == "--recover") { c.recover = true; continue; }
    if (a == "-v" || a == "--verbose") { c.verbose = true; continue; }
    if (a == "-h" || a == "--help") usage_and_exit(0);
    if (a.size() > 1 && a[0] == '-') { std::cerr << "[cli] unknown option: " << a << "\n"; usage_and_exit(1); }
    if (have_input) { std::cerr << "[cli] more than one input given\n"; usage_and_exit(1); }
    c.input = a;
    have_input = true;
  }

  if (c.work != "bytes" && c.work != "records" && c.work != "jsonl") {
    std::cerr << "[cli] unknown --work: " << c.work << "\n";
    usage_and_exit(1);
  }
  if (c.fixed && c.work != "bytes") {
    std::cerr << "[cli] --work=" << c.work << " needs record boundaries; drop --fixed\n";
    std::exit(1);
  }
  if (c.boundary.empty()) { std::cerr << "[cli] --boundary must not be empty\n"; std::exit(1); }
  return c;
}

bool write_text_file(const std::string& path, const std::string& body) {
  std::error_code ec;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  std::ofstream out(path, std::ios::binary);
  if (!out) return false;
  out.write(body.data(), static_cast<std::streamsize>(body.size()));
  return static_cast<bool>(out);
}

std::uint64_t count_occurrences(std::string_view hay, std::string_view needle) {
  std::uint64_t n = 0;
  for (std::size_t pos = hay.find(needle); pos != std::string_view::npos;
       pos = hay.find(needle, pos + needle.size())) ++n;
  return n;
}

}

int main(int argc, char** argv) {
  const Cli cli = parse_cli(argc, argv);

  pr::FileSource src(stdin);
  if (cli.input != "-" && !src.open(cli.input)) {
    std::cerr << "[cli] cannot open " << cli.input << ": " << std::strerror(src.last_error()) << "\n";
    return 2;
  }

  pr::ParallelReader::Config cfg;
  cfg.concurrency = cli.concurrency;
  cfg.chunk_size = cli.chunk_size;
  cfg.max_window_bytes = cli.max_window;
  cfg.boundary = cli.boundary;
  cfg.boundary_start = cli.boundary_start;
  cfg.require_boundary = cli.require_boundary;
  cfg.recover_callback_faults = cli.recover;
  cfg.verbose = cli.verbose;
  pr::ParallelReader reader(cfg);

  std::atomic<std::uint64_t> records{0};
  pr::JsonlReducer jsonl;

  pr::ParallelReader::Work work;
  if (cli.work == "records") {
    work = [&](std::string_view chunk){
      records.fetch_add(count_occurrences(chunk, cli.boundary), std::memory_order_relaxed);
    };
  } else if (cli.work == "jsonl") {
    work = [&](std::string_view chunk){ jsonl.feed_chunk(chunk); };
  } else {
    work = [](std::string_view){};
  }

  const bool ok = cli.fixed ? reader.read_fixed(src, work) : reader.read(src, work);
  const pr::RunStats stats = reader.last_stats();

  pr::RunJsonPayload p;
  p.mode = cli.fixed ? "fixed" : "boundary";
  p.work = cli.work;
  p.concurrency = cli.concurrency ? cli.concurrency : pr::default_concurrency();
  p.chunk_size = cli.chunk_size;
  p.boundary = cli.boundary;
  p.boundary_start = cli.boundary_start;
  p.require_boundary = cli.require_boundary;
  p.ok = ok;
  if (!ok) p.error = std::string(pr::to_string(reader.last_error().code)) + ": " + reader.last_error().message;
  p.filename = cli.input;
  if (cli.work == "records") {
    p.records = records.load();
  } else if (cli.work == "jsonl") {
    const auto t = jsonl.totals();
    p.records = t.lines;
    p.objects = t.objects;
    p.fields = t.fields;
    p.malformed = t.malformed;
  }

  if (!cli.stats_json.empty()) {
    if (!write_text_file(cli.stats_json, pr::RunJsonWriter::to_json(stats, p))) {
      std::cerr << "[cli] failed to write " << cli.stats_json << "\n";
      return 4;
    }
  }

  if (!ok) {
    std::cerr << "[cli] read failed: " << p.error << "\n";
    return 3;
  }

  std::cerr << "[cli] ok: " << cli.input
            << " chunks=" << stats.chunks
            << " bytes=" << stats.bytes
            << " discarded=" << stats.discarded_bytes
            << " wall_ms=" << stats.wall_ms
            << " mb/s=" << stats.throughput_mb_s;
  if (cli.work == "records") std::cerr << " records=" << p.records;
  if (cli.work == "jsonl") {
    std::cerr << " objects=" << p.objects << " malformed=" << p.malformed;
    if (p.malformed) std::cerr << " first_error=\"" << jsonl.first_error() << "\"";
  }
  std::cerr << "\n";
  return 0;
}
