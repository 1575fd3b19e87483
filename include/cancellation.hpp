#ifndef SYNCORE_CANCELLATION_HPP
#define SYNCORE_CANCELLATION_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace syncore {

// Exception thrown by cancellation_token::throw_if_cancelled
struct cancelled_exception : std::exception {
  const char *what() const noexcept override { return "operation cancelled"; }
};

enum class cancellation_status { running, cancel_requested, terminated };

// Shared state for cancellation, one per cancellation_signal
class cancellation_state {
public:
  cancellation_state() = default;

  cancellation_state(const cancellation_state &) = delete;
  cancellation_state &operator=(const cancellation_state &) = delete;

  cancellation_status status() const {
    return status_.load(std::memory_order_acquire);
  }

  bool is_cancelled() const { return status() != cancellation_status::running; }

  // running -> cancel_requested. No-op in any other state.
  void request_cancel();

  // Any state -> terminated. Final; the state cannot be reused afterwards.
  void acknowledge_terminated();

  // Register a callback invoked once on cancellation. Returns an id for
  // removal. If already cancelled, fires immediately and returns 0.
  std::size_t register_callback(std::function<void()> cb);

  // Removes a pending callback. If the callback is running on another thread,
  // blocks until it returns. Must not be called from inside the callback.
  void unregister_callback(std::size_t id);

private:
  void fire_callbacks();

  std::atomic<cancellation_status> status_{cancellation_status::running};
  std::mutex mutex_;
  std::condition_variable callback_done_;
  std::vector<std::function<void()>> callbacks_;
  std::vector<std::size_t> callback_ids_;
  std::size_t next_id_{1};
  std::size_t running_id_{0};
};

class cancellation_signal;

// Lightweight copyable handle held by the worker. Does not own the state; a
// token whose signal has been destroyed reads as cancelled.
class cancellation_token {
public:
  cancellation_token() = default;

  bool is_cancelled() const {
    if (!bound_)
      return false;
    auto state = state_.lock();
    return !state || state->is_cancelled();
  }

  cancellation_status status() const {
    if (!bound_)
      return cancellation_status::running;
    auto state = state_.lock();
    return state ? state->status() : cancellation_status::terminated;
  }

  void throw_if_cancelled() const {
    if (is_cancelled())
      throw cancelled_exception{};
  }

  // Called by the worker once it has unwound after observing cancellation
  void acknowledge_terminated() const {
    if (auto state = state_.lock())
      state->acknowledge_terminated();
  }

  // False for a default-constructed token, which is never cancelled
  explicit operator bool() const { return bound_; }

  // Access to state for wait-point integration
  std::shared_ptr<cancellation_state> state() const { return state_.lock(); }

private:
  friend class cancellation_signal;
  explicit cancellation_token(std::weak_ptr<cancellation_state> state)
      : state_(std::move(state)), bound_(true) {}

  std::weak_ptr<cancellation_state> state_;
  bool bound_{false};
};

// Owns the cancellation state, creates tokens, triggers cancellation
class cancellation_signal {
public:
  cancellation_signal()
      : state_(std::make_shared<cancellation_state>()) {}

  cancellation_signal(const cancellation_signal &) = delete;
  cancellation_signal &operator=(const cancellation_signal &) = delete;
  cancellation_signal(cancellation_signal &&) = default;
  cancellation_signal &operator=(cancellation_signal &&) = default;

  cancellation_token token() const {
    return cancellation_token{state_};
  }

  void request_cancel() { state_->request_cancel(); }

  void acknowledge_terminated() { state_->acknowledge_terminated(); }

  bool is_cancelled() const { return state_->is_cancelled(); }

  cancellation_status status() const { return state_->status(); }

private:
  std::shared_ptr<cancellation_state> state_;
};

// RAII callback registration for the duration of a blocking wait. Holds the
// state alive while registered.
class cancellation_registration {
public:
  cancellation_registration() = default;

  cancellation_registration(const cancellation_token &token,
                            std::function<void()> cb)
      : state_(token.state()) {
    if (state_)
      id_ = state_->register_callback(std::move(cb));
  }

  ~cancellation_registration() { reset(); }

  cancellation_registration(const cancellation_registration &) = delete;
  cancellation_registration &operator=(const cancellation_registration &) = delete;

  cancellation_registration(cancellation_registration &&other) noexcept
      : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

  cancellation_registration &operator=(cancellation_registration &&other) noexcept {
    if (this != &other) {
      reset();
      state_ = std::move(other.state_);
      id_ = std::exchange(other.id_, 0);
    }
    return *this;
  }

  void reset() {
    if (state_) {
      state_->unregister_callback(id_);
      state_.reset();
    }
    id_ = 0;
  }

private:
  std::shared_ptr<cancellation_state> state_;
  std::size_t id_{0};
};

} // namespace syncore

#endif // SYNCORE_CANCELLATION_HPP
