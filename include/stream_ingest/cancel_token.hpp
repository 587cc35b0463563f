#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace si {

// Shared cancellation/deadline signal. Copies refer to the same state.
class CancelToken {
public:
  using Clock = std::chrono::steady_clock;
  using Callback = std::function<void()>;

  CancelToken();

  static CancelToken with_timeout(std::chrono::milliseconds timeout);
  static CancelToken with_deadline(Clock::time_point deadline);

  // Idempotent; runs registered wake callbacks once.
  void cancel() const;

  // True after cancel() or once the deadline has passed.
  bool cancelled() const noexcept;
  bool cancel_requested() const noexcept;

  std::optional<Clock::time_point> deadline() const noexcept;

  std::size_t on_cancel(Callback cb) const;
  void remove_callback(std::size_t id) const;

private:
  struct State;
  std::shared_ptr<State> st_;
};

// Keeps a wake callback registered for the lifetime of the object.
class CancelRegistration {
public:
  CancelRegistration(const CancelToken& token, CancelToken::Callback cb)
    : token_(token), id_(token.on_cancel(std::move(cb))) {}
  ~CancelRegistration() { token_.remove_callback(id_); }

  CancelRegistration(const CancelRegistration&) = delete;
  CancelRegistration& operator=(const CancelRegistration&) = delete;

private:
  CancelToken token_;
  std::size_t id_;
};

}
