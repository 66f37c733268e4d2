#include "parallel_reader/run_json.hpp"
#include "parallel_reader/metrics.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace pr {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunStats& s, const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"ok\":" << (p.ok ? "true" : "false") << ",";
  o << "\"error\":"; esc(o, p.error); o << ",";
  o << "\"mode\":"; esc(o, p.mode); o << ",";
  o << "\"work\":"; esc(o, p.work); o << ",";
  o << "\"concurrency\":" << p.concurrency << ",";
  o << "\"chunk_size\":" << p.chunk_size << ",";
  o << "\"boundary\":"; esc(o, p.boundary); o << ",";
  o << "\"boundary_start\":"; esc(o, p.boundary_start); o << ",";
  o << "\"require_boundary\":" << (p.require_boundary ? "true" : "false") << ",";

  o << "\"chunks\":" << s.chunks << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"bytes_in\":" << s.bytes_in << ",";
  o << "\"discarded_bytes\":" << s.discarded_bytes << ",";
  o << "\"callback_faults\":" << s.callback_faults << ",";
  o << "\"pool\":{"
    << "\"allocated\":" << s.pool_allocated << ","
    << "\"reused\":"    << s.pool_reused    << ","
    << "\"dropped\":"   << s.pool_dropped
    << "},";
  o << "\"wall_time_ms\":" << safe_num(s.wall_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"chunks_per_sec\":" << safe_num(s.chunks_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << s.stages[i].duration_ms << "}";
  }
  o << "],";

  o << "\"records\":" << p.records << ",";
  o << "\"objects\":" << p.objects << ",";
  o << "\"fields\":" << p.fields << ",";
  o << "\"malformed\":" << p.malformed << ",";
  o << "\"filename\":"; esc(o, p.filename);

  o << "}";
  return o.str();
}

}
