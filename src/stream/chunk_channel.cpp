#include "stream_ingest/chunk_channel.hpp"
#include <algorithm>
#include <utility>

namespace si {

template <class Pred>
void ChunkChannel::wait(std::unique_lock<std::mutex>& lk, const CancelToken& cancel, Pred pred) {
  auto ready = [&]{ return pred() || cancel.cancelled(); };
  if (auto dl = cancel.deadline()) {
    // Returns at the deadline at the latest; cancelled() is true from then on.
    cv_.wait_until(lk, *dl, ready);
  } else {
    cv_.wait(lk, ready);
  }
}

void ChunkChannel::wake() {
  { std::lock_guard<std::mutex> lk(mu_); }
  cv_.notify_all();
}

bool ChunkChannel::send(Chunk&& chunk, const CancelToken& cancel) {
  CancelRegistration reg(cancel, [this]{ wake(); });
  std::unique_lock<std::mutex> lk(mu_);

  wait(lk, cancel, [this]{ return closed_ || !slot_.has_value(); });
  if (closed_ || cancel.cancelled()) return false;

  slot_ = std::move(chunk);
  const std::uint64_t ticket = ++sent_;
  peak_ = std::max<std::size_t>(peak_, 1);
  cv_.notify_all();

  wait(lk, cancel, [this, ticket]{ return taken_ >= ticket || closed_; });
  if (taken_ >= ticket) return true;

  // Not taken: withdraw so the slot never outlives the producer's interest in it.
  slot_.reset();
  --sent_;
  cv_.notify_all();
  return false;
}

ChunkChannel::RecvStatus ChunkChannel::recv(Chunk& out, const CancelToken& cancel) {
  CancelRegistration reg(cancel, [this]{ wake(); });
  std::unique_lock<std::mutex> lk(mu_);

  wait(lk, cancel, [this]{ return slot_.has_value() || closed_; });
  if (cancel.cancelled()) return RecvStatus::Cancelled;
  if (!slot_) return failed_ ? RecvStatus::Failed : RecvStatus::Closed;

  out = std::move(*slot_);
  slot_.reset();
  ++taken_;
  cv_.notify_all();
  return RecvStatus::Chunk;
}

void ChunkChannel::close() {
  std::lock_guard<std::mutex> lk(mu_);
  closed_ = true;
  cv_.notify_all();
}

void ChunkChannel::fail() {
  std::lock_guard<std::mutex> lk(mu_);
  closed_ = true;
  failed_ = true;
  cv_.notify_all();
}

bool ChunkChannel::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::uint64_t ChunkChannel::delivered() const {
  std::lock_guard<std::mutex> lk(mu_);
  return taken_;
}

std::size_t ChunkChannel::peak_occupancy() const {
  std::lock_guard<std::mutex> lk(mu_);
  return peak_;
}

}
