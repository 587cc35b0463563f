#include "stream_ingest/cancel_token.hpp"
#include <atomic>
#include <map>
#include <mutex>

namespace si {

struct CancelToken::State {
  std::atomic<bool> flag{false};
  std::optional<Clock::time_point> deadline;

  std::mutex mu;
  std::map<std::size_t, Callback> callbacks;
  std::size_t next_id{1};
};

CancelToken::CancelToken() : st_(std::make_shared<State>()) {}

CancelToken CancelToken::with_timeout(std::chrono::milliseconds timeout) {
  return with_deadline(Clock::now() + timeout);
}

CancelToken CancelToken::with_deadline(Clock::time_point deadline) {
  CancelToken t;
  t.st_->deadline = deadline;
  return t;
}

void CancelToken::cancel() const {
  if (st_->flag.exchange(true)) return;
  // Callbacks run under the lock so remove_callback() cannot return while one is in flight.
  std::lock_guard<std::mutex> lk(st_->mu);
  for (auto& kv : st_->callbacks) kv.second();
}

bool CancelToken::cancel_requested() const noexcept {
  return st_->flag.load(std::memory_order_acquire);
}

bool CancelToken::cancelled() const noexcept {
  if (cancel_requested()) return true;
  return st_->deadline && Clock::now() >= *st_->deadline;
}

std::optional<CancelToken::Clock::time_point> CancelToken::deadline() const noexcept {
  return st_->deadline;
}

std::size_t CancelToken::on_cancel(Callback cb) const {
  std::lock_guard<std::mutex> lk(st_->mu);
  std::size_t id = st_->next_id++;
  st_->callbacks.emplace(id, std::move(cb));
  return id;
}

void CancelToken::remove_callback(std::size_t id) const {
  std::lock_guard<std::mutex> lk(st_->mu);
  st_->callbacks.erase(id);
}

}
