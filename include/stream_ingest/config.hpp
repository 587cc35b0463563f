#pragma once
#include "stream_ingest/record_reassembler.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace si {

// Upper bound on one read window.
constexpr std::size_t kMaxChunkBytes = std::size_t{256} << 20;

struct IngestConfig {
  std::size_t chunk_bytes = 512;
  ReassemblerConfig reassembly;
  std::int64_t timeout_ms = 0;          // 0 = no deadline
  bool digest = true;                   // SHA-256 over consumed bytes
  std::size_t max_reported_errors = 100;
};

// Reads a JSON object such as
//   {"chunk_bytes": 4096, "delimiter": "|", "comment": "#", "timeout_ms": 30000}
// into `cfg`; keys that are absent keep their current value.
bool load_config_file(const std::string& path, IngestConfig& cfg, std::string* err_out = nullptr);
bool load_config_json(const std::string& json, IngestConfig& cfg, std::string* err_out = nullptr);

bool validate(const IngestConfig& cfg, std::string* err_out = nullptr);

// Decimal digits only; a sign, trailing text or overflow is rejected.
bool parse_size(const std::string& s, std::size_t& out);

}
