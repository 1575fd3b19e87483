#ifndef SYNCORE_SHARED_STATE_POLICIES_HPP
#define SYNCORE_SHARED_STATE_POLICIES_HPP

#include <atomic>
#include <cstddef>
#include <mutex>

namespace syncore {

// =============================================================================
// Lock Policies
// =============================================================================

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
        // Spin with relaxed ordering for cache efficiency
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

// =============================================================================
// Memory Ordering Policies
// =============================================================================

struct seq_cst_memory_order {
  static constexpr std::memory_order load_order = std::memory_order_seq_cst;
  static constexpr std::memory_order store_order = std::memory_order_seq_cst;
  static constexpr std::memory_order rmw_order = std::memory_order_seq_cst;
};

struct acquire_release_memory_order {
  static constexpr std::memory_order load_order = std::memory_order_acquire;
  static constexpr std::memory_order store_order = std::memory_order_release;
  static constexpr std::memory_order rmw_order = std::memory_order_acq_rel;
};

// =============================================================================
// Counter Policies
// =============================================================================

// Every operation takes the policy's mutex
template <typename LockPolicy = mutex_lock_policy> struct locked_counter_policy {
  using lock_policy = LockPolicy;
  static constexpr bool is_synchronized = true;
};

// Single fetch_add per operation
template <typename MemoryOrderPolicy = acquire_release_memory_order>
struct atomic_counter_policy {
  using memory_order_policy = MemoryOrderPolicy;
  static constexpr bool is_synchronized = true;
};

// compare_exchange_weak retry loop per operation
template <typename MemoryOrderPolicy = acquire_release_memory_order>
struct cas_counter_policy {
  using memory_order_policy = MemoryOrderPolicy;
  static constexpr bool is_synchronized = true;
};

#ifdef SYNCORE_ENABLE_UNSYNCHRONIZED_COUNTER
// Loses updates under contention. Only for demonstrating the race.
struct unsynchronized_counter_policy {
  static constexpr bool is_synchronized = false;
};
#endif

// =============================================================================
// Default Policy Bundles
// =============================================================================

#if defined(SYNCORE_DEFAULT_COUNTER_MUTEX)
using default_counter_policy = locked_counter_policy<mutex_lock_policy>;
#else
using default_counter_policy = atomic_counter_policy<acquire_release_memory_order>;
#endif

struct default_sync_policies {
  using lock_policy = mutex_lock_policy;
  using memory_order_policy = acquire_release_memory_order;
  using counter_policy = default_counter_policy;
};

struct high_contention_policies {
  using lock_policy = spinlock_policy;
  using memory_order_policy = acquire_release_memory_order;
  using counter_policy = atomic_counter_policy<acquire_release_memory_order>;
};

} // namespace syncore

#endif // SYNCORE_SHARED_STATE_POLICIES_HPP
