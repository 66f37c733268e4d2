#include "parallel_reader/jsonl_reducer.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>

namespace pr {

static bool is_blank(std::string_view s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\r') return false;
  }
  return true;
}

JsonlReducer::JsonlReducer(JsonlConfig cfg) : cfg_(cfg) {}

bool JsonlReducer::feed_line(std::string_view line, JsonlTotals& out) const {
  // thread-local scratch and parser
  thread_local simdjson::ondemand::parser parser;
  thread_local std::string scratch;

  ++out.lines;

  scratch.assign(line.data(), line.size());
  scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), line.size(), scratch.capacity());

  try {
    simdjson::ondemand::document doc = parser.iterate(view);
    simdjson::ondemand::json_type t = doc.type();

    if (t == simdjson::ondemand::json_type::object) {
      std::uint64_t n = 0;
      simdjson::ondemand::object obj = doc.get_object();
      for (auto field : obj) {
        std::string_view key = field.unescaped_key();
        (void)key;
        ++n;  // values are skipped by the iterator
      }
      // Trailing garbage after the object makes the line invalid.
      if (!doc.at_end()) { ++out.malformed; return false; }
      ++out.objects;
      out.fields += n;
      return true;
    }

    if (cfg_.strict) { ++out.malformed; return false; }
    return true;

  } catch (const simdjson::simdjson_error&) {
    ++out.malformed;
    return false;
  }
}

void JsonlReducer::feed_chunk(std::string_view chunk) {
  JsonlTotals local;
  std::string err;

  std::size_t start = 0;
  while (start < chunk.size()) {
    std::size_t pos = chunk.find('\n', start);
    if (pos == std::string_view::npos) pos = chunk.size();
    std::string_view line = chunk.substr(start, pos - start);
    start = pos + 1;

    if (cfg_.skip_blank && is_blank(line)) continue;
    if (!feed_line(line, local) && err.empty()) {
      err = "malformed JSONL line: " + std::string(line.substr(0, 80));
    }
  }

  std::lock_guard<std::mutex> lk(mu_);
  totals_.lines += local.lines;
  totals_.objects += local.objects;
  totals_.fields += local.fields;
  totals_.malformed += local.malformed;
  if (first_err_.empty() && !err.empty()) first_err_ = std::move(err);
}

JsonlTotals JsonlReducer::totals() const {
  std::lock_guard<std::mutex> lk(mu_);
  return totals_;
}

std::string JsonlReducer::first_error() const {
  std::lock_guard<std::mutex> lk(mu_);
  return first_err_;
}

}
