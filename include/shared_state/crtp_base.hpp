#ifndef SYNCORE_SHARED_STATE_CRTP_BASE_HPP
#define SYNCORE_SHARED_STATE_CRTP_BASE_HPP

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <utility>

#include "concepts.hpp"
#include "policies.hpp"

namespace syncore {

// Absolute steady_clock deadline timeout from now. Saturates at
// time_point::max() instead of overflowing; non-positive timeouts give now.
template <typename Rep, typename Period>
std::chrono::steady_clock::time_point
deadline_after(std::chrono::duration<Rep, Period> timeout) {
  using clock = std::chrono::steady_clock;
  auto now = clock::now();
  if (timeout <= timeout.zero()) {
    return now;
  }
  // Compared in floating point; the margin absorbs rounding near the limit
  auto remaining = clock::time_point::max() - now - std::chrono::seconds(1);
  if (std::chrono::duration<double>(timeout) >=
      std::chrono::duration<double>(remaining)) {
    return clock::time_point::max();
  }
  return now + std::chrono::duration_cast<clock::duration>(timeout);
}

// =============================================================================
// Sync Primitive Base - Provides mutex + condition_variable pattern
// =============================================================================

template <typename Derived, typename LockPolicy = mutex_lock_policy>
class sync_primitive_base {
protected:
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  mutable mutex_type mutex_;
  std::condition_variable_any cv_;

  // Predicate is re-evaluated after every wakeup, spurious or not
  template <typename Predicate>
  void wait_for_condition(lock_type &lock, Predicate pred) {
    while (!pred()) {
      cv_.wait(lock);
    }
  }

  template <typename Predicate, typename Clock, typename Duration>
  bool wait_for_condition_until(lock_type &lock, Predicate pred,
                                std::chrono::time_point<Clock, Duration> deadline) {
    while (!pred()) {
      if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
        return pred();
      }
    }
    return true;
  }

  void notify_one() { cv_.notify_one(); }

  void notify_all() { cv_.notify_all(); }

  // Wakes every waiter of the derived primitive. Used by cancellation
  // callbacks, which run on the cancelling thread.
  void wake_all_waiters() {
    lock_type lock(mutex_);
    derived().on_wake_all();
  }

  // CRTP access to derived class
  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  sync_primitive_base() = default;
  ~sync_primitive_base() = default;

  sync_primitive_base(const sync_primitive_base &) = delete;
  sync_primitive_base &operator=(const sync_primitive_base &) = delete;
  sync_primitive_base(sync_primitive_base &&) = delete;
  sync_primitive_base &operator=(sync_primitive_base &&) = delete;
};

// =============================================================================
// Result Holder - Carries the outcome of a body run on another thread
// =============================================================================

class result_holder {
  std::exception_ptr exception_;

public:
  void set_exception(std::exception_ptr e) { exception_ = std::move(e); }

  void get() {
    if (exception_) {
      std::rethrow_exception(std::exchange(exception_, nullptr));
    }
  }
};

} // namespace syncore

#endif // SYNCORE_SHARED_STATE_CRTP_BASE_HPP
