#pragma once
#include "stream_ingest/cancel_token.hpp"
#include "stream_ingest/config.hpp"
#include "stream_ingest/ingest_error.hpp"
#include "stream_ingest/metrics.hpp"
#include "stream_ingest/positional_reader.hpp"
#include "stream_ingest/record_reassembler.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace si {

enum class RunStatus { Ok, Cancelled, ReadError, ConfigError };

const char* to_string(RunStatus s) noexcept;

struct RunResult {
  RunStatus status = RunStatus::Ok;
  std::string error;                  // read/config failure text
  RunStats stats;
  std::vector<IngestError> errors;    // first max_reported_errors, in order
  std::uint64_t errors_dropped = 0;
  std::string sha256;                 // empty unless digest enabled and not cancelled

  bool ok() const noexcept { return status == RunStatus::Ok; }
};

// Chunk Source on a producer thread -> ChunkChannel -> RecordReassembler on
// the calling thread. One run per pipeline object.
class IngestPipeline {
public:
  IngestPipeline(PositionalReader& reader, IngestConfig cfg);

  // `on_error`, when set, sees every error as it happens (in addition to
  // RunResult::errors); the default logs to std::cerr.
  RunResult run(const RecordHandler& handler, const CancelToken& cancel,
                const ErrorCallback& on_error = log_error);

private:
  PositionalReader& reader_;
  IngestConfig cfg_;
};

}
