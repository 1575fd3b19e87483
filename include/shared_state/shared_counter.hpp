#ifndef SYNCORE_SHARED_STATE_SHARED_COUNTER_HPP
#define SYNCORE_SHARED_STATE_SHARED_COUNTER_HPP

#include <atomic>
#include <cstdint>

#include "concepts.hpp"
#include "policies.hpp"

namespace syncore {

// =============================================================================
// Shared Counter - Integer accumulator, synchronization chosen by policy
// =============================================================================
//
// All realizations expose the same surface:
//   increment(delta) -> new value
//   decrement(delta) -> new value
//   get()            -> current value, never torn
//
// Select the realization with a counter policy from policies.hpp. Call sites
// that do not care use syncore::counter, whose policy is fixed by the build.

template <typename CounterPolicy = default_counter_policy> class shared_counter;

// -----------------------------------------------------------------------------
// Mutex-protected
// -----------------------------------------------------------------------------

template <typename LockPolicy>
class shared_counter<locked_counter_policy<LockPolicy>> {
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  mutable mutex_type mutex_;
  std::int64_t value_;

public:
  using counter_policy = locked_counter_policy<LockPolicy>;
  static constexpr bool is_lock_free = false;

  explicit shared_counter(std::int64_t initial = 0) : value_(initial) {}

  shared_counter(const shared_counter &) = delete;
  shared_counter &operator=(const shared_counter &) = delete;

  std::int64_t increment(std::int64_t delta = 1) {
    lock_type lock(mutex_);
    value_ += delta;
    return value_;
  }

  std::int64_t decrement(std::int64_t delta = 1) { return increment(-delta); }

  // Reads take the mutex too, otherwise the happens-before edge is lost
  std::int64_t get() const {
    lock_type lock(mutex_);
    return value_;
  }
};

// -----------------------------------------------------------------------------
// Lock-free, fetch_add
// -----------------------------------------------------------------------------

template <typename MemoryOrderPolicy>
class shared_counter<atomic_counter_policy<MemoryOrderPolicy>> {
  std::atomic<std::int64_t> value_;

public:
  using counter_policy = atomic_counter_policy<MemoryOrderPolicy>;
  static constexpr bool is_lock_free = std::atomic<std::int64_t>::is_always_lock_free;

  explicit shared_counter(std::int64_t initial = 0) : value_(initial) {}

  shared_counter(const shared_counter &) = delete;
  shared_counter &operator=(const shared_counter &) = delete;

  std::int64_t increment(std::int64_t delta = 1) {
    return value_.fetch_add(delta, MemoryOrderPolicy::rmw_order) + delta;
  }

  std::int64_t decrement(std::int64_t delta = 1) { return increment(-delta); }

  std::int64_t get() const { return value_.load(MemoryOrderPolicy::load_order); }
};

// -----------------------------------------------------------------------------
// Lock-free, compare-and-swap retry loop
// -----------------------------------------------------------------------------

template <typename MemoryOrderPolicy>
class shared_counter<cas_counter_policy<MemoryOrderPolicy>> {
  std::atomic<std::int64_t> value_;

public:
  using counter_policy = cas_counter_policy<MemoryOrderPolicy>;
  static constexpr bool is_lock_free = std::atomic<std::int64_t>::is_always_lock_free;

  explicit shared_counter(std::int64_t initial = 0) : value_(initial) {}

  shared_counter(const shared_counter &) = delete;
  shared_counter &operator=(const shared_counter &) = delete;

  std::int64_t increment(std::int64_t delta = 1) {
    std::int64_t current = value_.load(MemoryOrderPolicy::load_order);
    // On failure current is reloaded with the value that beat us
    while (!value_.compare_exchange_weak(current, current + delta,
                                         MemoryOrderPolicy::rmw_order,
                                         MemoryOrderPolicy::load_order)) {
    }
    return current + delta;
  }

  std::int64_t decrement(std::int64_t delta = 1) { return increment(-delta); }

  std::int64_t get() const { return value_.load(MemoryOrderPolicy::load_order); }
};

#ifdef SYNCORE_ENABLE_UNSYNCHRONIZED_COUNTER
// -----------------------------------------------------------------------------
// Unsynchronized - INCORRECT, loses updates under contention
// -----------------------------------------------------------------------------
//
// Read and write are separate relaxed operations, so two threads can read the
// same value and both store value + 1. Relaxed atomics keep the race a logic
// error instead of undefined behaviour.

template <> class shared_counter<unsynchronized_counter_policy> {
  std::atomic<std::int64_t> value_;

public:
  using counter_policy = unsynchronized_counter_policy;
  static constexpr bool is_lock_free = true;

  explicit shared_counter(std::int64_t initial = 0) : value_(initial) {}

  shared_counter(const shared_counter &) = delete;
  shared_counter &operator=(const shared_counter &) = delete;

  std::int64_t increment(std::int64_t delta = 1) {
    std::int64_t next = value_.load(std::memory_order_relaxed) + delta;
    value_.store(next, std::memory_order_relaxed);
    return next;
  }

  std::int64_t decrement(std::int64_t delta = 1) { return increment(-delta); }

  std::int64_t get() const { return value_.load(std::memory_order_relaxed); }
};

using unsynchronized_counter = shared_counter<unsynchronized_counter_policy>;
#endif

// =============================================================================
// Type Aliases
// =============================================================================

using counter = shared_counter<default_counter_policy>;

using locked_counter = shared_counter<locked_counter_policy<mutex_lock_policy>>;

using spinlock_counter = shared_counter<locked_counter_policy<spinlock_policy>>;

using atomic_counter =
    shared_counter<atomic_counter_policy<acquire_release_memory_order>>;

using cas_counter = shared_counter<cas_counter_policy<acquire_release_memory_order>>;

static_assert(Counter<locked_counter>);
static_assert(Counter<atomic_counter>);
static_assert(Counter<cas_counter>);

} // namespace syncore

#endif // SYNCORE_SHARED_STATE_SHARED_COUNTER_HPP
