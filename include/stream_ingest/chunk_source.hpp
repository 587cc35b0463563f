#pragma once
#include "stream_ingest/cancel_token.hpp"
#include "stream_ingest/chunk_channel.hpp"
#include "stream_ingest/positional_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace si {

enum class SourceStatus {
  Exhausted,     // reached end of stream, every byte published
  Cancelled,     // cancellation observed before a read or publish
  ConsumerGone,  // channel closed by someone else while publishing
  ReadError,     // read failure or bad configuration; see last_error()
};

const char* to_string(SourceStatus s) noexcept;

// Tiles a positional reader into fixed-size chunks and publishes them in order.
class ChunkSource {
public:
  struct Config {
    std::size_t chunk_bytes = 512;
  };

  ChunkSource(PositionalReader& reader, Config cfg);

  // Runs to completion on the calling thread. Always closes `out` exactly once
  // (ChunkChannel::fail() on ReadError).
  SourceStatus run(ChunkChannel& out, const CancelToken& cancel);

  std::uint64_t offset() const noexcept { return offset_; }
  std::uint64_t chunks_published() const noexcept { return published_; }
  const std::string& last_error() const noexcept { return err_; }

private:
  SourceStatus pump(ChunkChannel& out, const CancelToken& cancel);

  PositionalReader& reader_;
  Config cfg_;
  std::uint64_t offset_{0};
  std::uint64_t published_{0};
  std::string err_;
};

}
