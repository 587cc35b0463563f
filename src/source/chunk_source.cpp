#include "stream_ingest/chunk_source.hpp"
#include <utility>

namespace si {

const char* to_string(SourceStatus s) noexcept {
  switch (s) {
    case SourceStatus::Exhausted:    return "exhausted";
    case SourceStatus::Cancelled:    return "cancelled";
    case SourceStatus::ConsumerGone: return "consumer_gone";
    case SourceStatus::ReadError:    return "read_error";
  }
  return "unknown";
}

ChunkSource::ChunkSource(PositionalReader& reader, Config cfg)
  : reader_(reader), cfg_(cfg) {}

SourceStatus ChunkSource::run(ChunkChannel& out, const CancelToken& cancel) {
  SourceStatus st = pump(out, cancel);
  if (st == SourceStatus::ReadError) out.fail();
  else out.close();
  return st;
}

SourceStatus ChunkSource::pump(ChunkChannel& out, const CancelToken& cancel) {
  if (cfg_.chunk_bytes == 0) {
    err_ = "chunk_bytes must be > 0";
    return SourceStatus::ReadError;
  }

  while (true) {
    if (cancel.cancelled()) return SourceStatus::Cancelled;

    Chunk c;
    c.bytes.resize(cfg_.chunk_bytes);
    c.offset = offset_;

    ReadResult r = reader_.read_at(c.bytes.data(), c.bytes.size(), offset_);
    if (!r.ok()) {
      err_ = r.message.empty() ? r.ec.message() : r.message;
      return SourceStatus::ReadError;
    }
    offset_ += r.bytes;

    if (r.bytes > 0) {
      c.bytes.resize(r.bytes);
      // A read may complete after cancellation; never publish it.
      if (cancel.cancelled()) return SourceStatus::Cancelled;
      if (!out.send(std::move(c), cancel)) {
        return cancel.cancelled() ? SourceStatus::Cancelled : SourceStatus::ConsumerGone;
      }
      ++published_;
    }

    if (r.eof) return SourceStatus::Exhausted;
    // Zero bytes without end-of-stream: treat as exhausted rather than spin.
    if (r.bytes == 0) return SourceStatus::Exhausted;
  }
}

}
