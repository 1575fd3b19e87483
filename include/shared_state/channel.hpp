#ifndef SYNCORE_SHARED_STATE_CHANNEL_HPP
#define SYNCORE_SHARED_STATE_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <memory_resource>
#include <optional>
#include <stdexcept>
#include <utility>

#include "../allocator.hpp"
#include "../cancellation.hpp"
#include "concepts.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"

namespace syncore {

// =============================================================================
// Channel Result - Result type for channel operations
// =============================================================================

enum class channel_op_status {
  success,
  closed,
  would_block,
  timeout,
  cancelled
};

// open: accepting puts. draining: closed with items left. closed: closed and
// empty.
enum class channel_state { open, draining, closed };

template <typename T>
struct channel_result {
  std::optional<T> value;
  channel_op_status status;

  explicit operator bool() const { return status == channel_op_status::success; }

  // True once the channel is closed and every buffered item has been taken
  bool end_of_channel() const { return status == channel_op_status::closed; }

  T &operator*() { return *value; }
  const T &operator*() const { return *value; }
};

// =============================================================================
// Bounded Channel - Fixed-capacity blocking FIFO shared between threads
// =============================================================================
//
// Monitor: mutex_ guards buffer_ and closed_. cv_ (inherited) is not_empty,
// not_full_ is the producers' condition. Every blocking call accepts a
// cancellation_token and returns channel_op_status::cancelled without touching
// the buffer when the token fires.

template <typename T, typename LockPolicy = mutex_lock_policy>
class bounded_channel
    : public sync_primitive_base<bounded_channel<T, LockPolicy>, LockPolicy> {
  using base_type =
      sync_primitive_base<bounded_channel<T, LockPolicy>, LockPolicy>;
  using lock_type = typename base_type::lock_type;

  friend base_type;

  std::pmr::deque<T> buffer_;
  const std::size_t capacity_;
  std::condition_variable_any not_full_;
  // Written with mutex_ held, read lock-free by is_closed()
  std::atomic<bool> closed_{false};

  void on_wake_all() {
    this->notify_all();
    not_full_.notify_all();
  }

  bool is_full() const { return buffer_.size() >= capacity_; }

  bool closed_locked() const { return closed_.load(std::memory_order_relaxed); }

  void push_locked(T &&value) {
    buffer_.push_back(std::move(value));
    this->notify_one();
  }

  T pop_locked() {
    T value = std::move(buffer_.front());
    buffer_.pop_front();
    not_full_.notify_one();
    return value;
  }

  // A waiter that leaves without using its wakeup hands it to the next one
  void pass_on_locked() {
    if (!buffer_.empty())
      this->notify_one();
    if (!is_full())
      not_full_.notify_one();
  }

  cancellation_registration wake_on_cancel(const cancellation_token &token) {
    if (!token)
      return {};
    return cancellation_registration(token, [this] { this->wake_all_waiters(); });
  }

  template <typename Clock, typename Duration>
  channel_op_status put_until(T &value, const cancellation_token &token,
                              const std::chrono::time_point<Clock, Duration> *deadline) {
    auto registration = wake_on_cancel(token);
    lock_type lock(this->mutex_);

    auto ready = [this, &token] {
      return closed_locked() || !is_full() || token.is_cancelled();
    };
    if (deadline) {
      if (!wait_not_full_until(lock, ready, *deadline)) {
        pass_on_locked();
        return channel_op_status::timeout;
      }
    } else {
      while (!ready()) {
        not_full_.wait(lock);
      }
    }

    if (token.is_cancelled()) {
      pass_on_locked();
      return channel_op_status::cancelled;
    }
    if (closed_locked()) {
      return channel_op_status::closed;
    }
    push_locked(std::move(value));
    return channel_op_status::success;
  }

  template <typename Predicate, typename Clock, typename Duration>
  bool wait_not_full_until(lock_type &lock, Predicate pred,
                           std::chrono::time_point<Clock, Duration> deadline) {
    while (!pred()) {
      if (not_full_.wait_until(lock, deadline) == std::cv_status::timeout) {
        return pred();
      }
    }
    return true;
  }

  template <typename Clock, typename Duration>
  channel_result<T> take_until(const cancellation_token &token,
                               const std::chrono::time_point<Clock, Duration> *deadline) {
    auto registration = wake_on_cancel(token);
    lock_type lock(this->mutex_);

    auto ready = [this, &token] {
      return !buffer_.empty() || closed_locked() || token.is_cancelled();
    };
    if (deadline) {
      if (!this->wait_for_condition_until(lock, ready, *deadline)) {
        pass_on_locked();
        return {std::nullopt, channel_op_status::timeout};
      }
    } else {
      this->wait_for_condition(lock, ready);
    }

    if (token.is_cancelled()) {
      pass_on_locked();
      return {std::nullopt, channel_op_status::cancelled};
    }
    if (buffer_.empty()) {
      return {std::nullopt, channel_op_status::closed};
    }
    return {pop_locked(), channel_op_status::success};
  }

  using no_deadline = const std::chrono::steady_clock::time_point *;

public:
  using value_type = T;
  using lock_policy = LockPolicy;

  explicit bounded_channel(std::size_t capacity,
                           std::pmr::memory_resource *resource = mi_resource())
      : buffer_(resource), capacity_(capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("bounded_channel capacity must be at least 1");
    }
  }

  std::size_t capacity() const noexcept { return capacity_; }

  // Blocks while the channel is full. Fails with closed once close() was
  // called, or cancelled when the token fires first.
  channel_op_status put(T value, const cancellation_token &token = {}) {
    return put_until(value, token, no_deadline{nullptr});
  }

  // Try to put without blocking
  channel_op_status try_put(T value) {
    lock_type lock(this->mutex_);
    if (closed_locked()) {
      return channel_op_status::closed;
    }
    if (is_full()) {
      return channel_op_status::would_block;
    }
    push_locked(std::move(value));
    return channel_op_status::success;
  }

  // Put with timeout
  template <typename Rep, typename Period>
  channel_op_status put_for(T value, std::chrono::duration<Rep, Period> timeout,
                            const cancellation_token &token = {}) {
    auto deadline = deadline_after(timeout);
    return put_until(value, token, &deadline);
  }

  // Blocks while the channel is open and empty. Returns end-of-channel
  // (status closed) once the channel is closed and drained.
  channel_result<T> take(const cancellation_token &token = {}) {
    return take_until(token, no_deadline{nullptr});
  }

  // Try to take without blocking
  channel_result<T> try_take() {
    lock_type lock(this->mutex_);
    if (!buffer_.empty()) {
      return {pop_locked(), channel_op_status::success};
    }
    if (closed_locked()) {
      return {std::nullopt, channel_op_status::closed};
    }
    return {std::nullopt, channel_op_status::would_block};
  }

  // Take with timeout
  template <typename Rep, typename Period>
  channel_result<T> take_for(std::chrono::duration<Rep, Period> timeout,
                             const cancellation_token &token = {}) {
    auto deadline = deadline_after(timeout);
    return take_until(token, &deadline);
  }

  // open -> draining. Blocked producers fail with closed, blocked consumers
  // drain the remaining items and then see end-of-channel.
  void close() {
    lock_type lock(this->mutex_);
    closed_.store(true, std::memory_order_release);
    on_wake_all();
    // lock released by RAII after notify
  }

  // Closes and drops every buffered item. Returns how many were dropped.
  std::size_t close_and_discard() {
    lock_type lock(this->mutex_);
    closed_.store(true, std::memory_order_release);
    std::size_t dropped = buffer_.size();
    buffer_.clear();
    on_wake_all();
    return dropped;
  }

  bool is_closed() const { return closed_.load(std::memory_order_acquire); }

  channel_state state() const {
    lock_type lock(this->mutex_);
    if (!closed_locked()) {
      return channel_state::open;
    }
    return buffer_.empty() ? channel_state::closed : channel_state::draining;
  }

  // Check current buffer size
  std::size_t size() const {
    lock_type lock(this->mutex_);
    return buffer_.size();
  }

  // Check if empty
  bool empty() const {
    lock_type lock(this->mutex_);
    return buffer_.empty();
  }
};

// =============================================================================
// Type Aliases
// =============================================================================

template <typename T>
using channel = bounded_channel<T, mutex_lock_policy>;

template <typename T>
using spinlock_channel = bounded_channel<T, spinlock_policy>;

// Channels are shared by every producer and consumer holding the pointer
template <typename T, typename LockPolicy = mutex_lock_policy>
std::shared_ptr<bounded_channel<T, LockPolicy>>
make_bounded_channel(std::size_t capacity,
                     std::pmr::memory_resource *resource = mi_resource()) {
  return std::make_shared<bounded_channel<T, LockPolicy>>(capacity, resource);
}

} // namespace syncore

#endif // SYNCORE_SHARED_STATE_CHANNEL_HPP
