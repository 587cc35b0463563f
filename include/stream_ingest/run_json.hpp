#pragma once
#include "stream_ingest/ingest_error.hpp"
#include "stream_ingest/metrics.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace si {

struct RunJsonPayload {
  // Outcome
  std::string status;
  std::string error;

  // Counters and KPIs
  RunStats stats;

  // Error log (possibly truncated) and the number left out
  std::vector<IngestError> errors;
  std::uint64_t errors_dropped = 0;

  // Input metadata
  std::string source;
  std::string sha256;
  char delimiter = ',';
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const RunJsonPayload& p);
};

// Writes `json` to `path`, creating parent directories.
bool write_run_summary(const std::string& path, const std::string& json,
                       std::string* err_out = nullptr);

}
