#pragma once
#include <cstdint>
#include <string>

namespace pr {

struct RunStats;

struct RunJsonPayload {
  // Reader configuration
  std::string mode;            // "boundary" | "fixed"
  std::string work;            // reducer name
  std::uint64_t concurrency = 0;
  std::uint64_t chunk_size = 0;
  std::string boundary;
  std::string boundary_start;
  bool require_boundary = false;

  // Outcome
  bool ok = true;
  std::string error;

  // Reducer results
  std::uint64_t records = 0;
  std::uint64_t objects = 0;
  std::uint64_t fields = 0;
  std::uint64_t malformed = 0;

  // Input metadata
  std::string filename;
};

class RunJsonWriter {
public:
  // Serialize stats + payload to a single JSON object.
  static std::string to_json(const RunStats& s, const RunJsonPayload& p);
};

}
