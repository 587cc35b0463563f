#pragma once
#include "stream_ingest/cancel_token.hpp"
#include "stream_ingest/chunk_channel.hpp"
#include "stream_ingest/delimited_parser.hpp"
#include "stream_ingest/ingest_error.hpp"
#include "stream_ingest/record_view.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace si {

struct ReassemblerConfig {
  ParseConfig parse;
  std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per record
};

// Returning false (optionally filling *err) reports a Handler error; the stream continues.
using RecordHandler = std::function<bool(const RecordView&, std::string* err)>;
using ChunkObserver = std::function<void(const Chunk&)>;

enum class ConsumeStatus { Completed, SourceFailed, Cancelled };

// Turns an ordered chunk sequence into complete records regardless of where
// chunk boundaries fall. Records are handed to the handler synchronously and
// in stream order.
class RecordReassembler {
public:
  RecordReassembler(ReassemblerConfig cfg, RecordHandler on_record,
                    ErrorCallback on_error = log_error);

  // Process one chunk. The view is not retained past this call.
  void feed(std::string_view chunk);

  // End of stream: emit whatever the carry holds. False if it could not be parsed.
  bool finish();

  // Receive and feed until the channel closes (then finish()) or `cancel` fires.
  // Cancelled runs and runs whose source failed are not flushed.
  ConsumeStatus consume(ChunkChannel& in, const CancelToken& cancel,
                        const ChunkObserver& observe = {});

  std::uint64_t records() const noexcept { return records_; }
  std::uint64_t chunks() const noexcept { return chunks_; }
  std::uint64_t bytes() const noexcept { return base_; }
  std::uint64_t parse_errors() const noexcept { return parse_errors_; }
  std::uint64_t handler_errors() const noexcept { return handler_errors_; }
  std::size_t carry_size() const noexcept { return carry_.size(); }
  std::size_t carry_high_water() const noexcept { return carry_high_water_; }
  bool flush_failed() const noexcept { return flush_failed_; }

private:
  bool reassemble_carry(bool at_eof);
  void stash(std::string_view tail, std::uint64_t offset);
  bool append_carry(std::string_view bytes, bool terminated);
  void emit(std::uint64_t offset);
  void report(IngestError::Kind kind, std::string message, std::uint64_t offset);

  ReassemblerConfig cfg_;
  RecordHandler on_record_;
  ErrorCallback on_error_;

  std::string carry_;
  std::uint64_t carry_offset_{0};
  bool skipping_{false};           // drop bytes until the next terminator
  bool flush_failed_{false};
  std::vector<std::string_view> fields_;

  std::uint64_t base_{0};          // stream offset of the next chunk
  std::uint64_t records_{0};
  std::uint64_t chunks_{0};
  std::uint64_t parse_errors_{0};
  std::uint64_t handler_errors_{0};
  std::size_t carry_high_water_{0};
};

}
