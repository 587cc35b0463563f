#pragma once
#include "stream_ingest/cancel_token.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace si {

// One window of the source stream. `offset` is the global position of bytes[0].
struct Chunk {
  std::vector<char> bytes;
  std::uint64_t offset = 0;

  std::string_view view() const noexcept { return std::string_view(bytes.data(), bytes.size()); }
  std::size_t size() const noexcept { return bytes.size(); }
};

// Single-producer/single-consumer handoff with one slot.
// send() returns only once the consumer has taken the chunk, so the producer
// can never run more than one chunk ahead of the consumer.
// close() unblocks all waiting threads.
class ChunkChannel {
public:
  enum class RecvStatus { Chunk, Closed, Failed, Cancelled };

  ChunkChannel() = default;
  ChunkChannel(const ChunkChannel&) = delete;
  ChunkChannel& operator=(const ChunkChannel&) = delete;

  // Returns false if the channel was closed or `cancel` fired before the
  // consumer took the chunk; the chunk is then withdrawn.
  bool send(Chunk&& chunk, const CancelToken& cancel);

  // Cancellation wins over a pending chunk: nothing is accepted once it fires.
  RecvStatus recv(Chunk& out, const CancelToken& cancel);

  void close();
  // Close because the producer failed; recv() then reports Failed instead of Closed.
  void fail();
  bool closed() const;

  std::uint64_t delivered() const;
  std::size_t peak_occupancy() const;

private:
  template <class Pred>
  void wait(std::unique_lock<std::mutex>& lk, const CancelToken& cancel, Pred pred);
  void wake();

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::optional<Chunk> slot_;
  bool closed_{false};
  bool failed_{false};
  std::uint64_t sent_{0};
  std::uint64_t taken_{0};
  std::size_t peak_{0};
};

}
