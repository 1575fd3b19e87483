#ifndef SYNCORE_SHARED_STATE_LOCK_ORDERING_HPP
#define SYNCORE_SHARED_STATE_LOCK_ORDERING_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "../cancellation.hpp"
#include "concepts.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"

/*
  Deadlock avoidance by a global acquisition order. Every ranked_mutex carries
  a fixed rank; a thread holding several of them must have taken them in
  strictly ascending rank and gives them back in descending rank. With every
  multi-lock acquisition going through acquire_ordered no cycle can form in
  the wait-for graph, so circular wait is impossible.

  The order validator (SYNCORE_LOCK_ORDER_CHECKS, defaults to on when NDEBUG
  is not defined) keeps the ranks each thread holds and throws
  lock_order_violation when a ranked_mutex is locked out of order by any
  path, including a plain std::lock_guard.
*/

#ifndef SYNCORE_LOCK_ORDER_CHECKS
#ifdef NDEBUG
#define SYNCORE_LOCK_ORDER_CHECKS 0
#else
#define SYNCORE_LOCK_ORDER_CHECKS 1
#endif
#endif

namespace syncore {

// Programming error: a lock was taken outside the declared total order
class lock_order_violation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

enum class lock_op_status { success, timeout, cancelled };

class ranked_mutex;

// =============================================================================
// Lock Order Validator - per-thread record of held ranks
// =============================================================================

struct lock_order_validator {
  // Whether the library was built with the validator
  static bool enabled() noexcept;

  // Throws lock_order_violation if the calling thread holds a lock whose
  // rank is not lower than m's
  static void check_acquire(const ranked_mutex &m);

  static void on_acquired(const ranked_mutex &m);
  static void on_released(const ranked_mutex &m);

  // Number of ranked locks the calling thread holds
  static std::size_t held_count();
};

// =============================================================================
// Ranked Mutex - lock handle with a fixed rank, cancellable waits
// =============================================================================

class ranked_mutex
    : public sync_primitive_base<ranked_mutex, mutex_lock_policy> {
  using base_type = sync_primitive_base<ranked_mutex, mutex_lock_policy>;
  friend base_type;

  const std::uint64_t rank_;
  const std::string name_;
  bool locked_{false};
  std::thread::id owner_;

  void on_wake_all() { this->notify_all(); }

public:
  explicit ranked_mutex(std::uint64_t rank, std::string name = {});

  std::uint64_t rank() const noexcept { return rank_; }
  const std::string &name() const noexcept { return name_; }

  // Blocking, not cancellable
  void lock();

  // Blocking until acquired or the token fires
  lock_op_status lock(const cancellation_token &token);

  bool try_lock();

  template <typename Rep, typename Period>
  bool try_lock_for(std::chrono::duration<Rep, Period> timeout) {
    return acquire_until(deadline_after(timeout), {}) == lock_op_status::success;
  }

  template <typename Clock, typename Duration>
  bool try_lock_until(std::chrono::time_point<Clock, Duration> deadline) {
    return acquire_until(to_steady(deadline), {}) == lock_op_status::success;
  }

  // Bounded, cancellable acquisition. State is unchanged unless success.
  lock_op_status acquire_until(std::chrono::steady_clock::time_point deadline,
                               const cancellation_token &token);

  void unlock();

  // True while any thread holds the lock
  bool is_locked() const;

  // True if the calling thread holds the lock
  bool held_by_current_thread() const;

private:
  lock_op_status acquire(const std::chrono::steady_clock::time_point *deadline,
                         const cancellation_token &token);

  template <typename Clock, typename Duration>
  static std::chrono::steady_clock::time_point
  to_steady(std::chrono::time_point<Clock, Duration> deadline) {
    if constexpr (std::is_same_v<Clock, std::chrono::steady_clock>) {
      return std::chrono::time_point_cast<std::chrono::steady_clock::duration>(
          deadline);
    } else {
      return deadline_after(deadline - Clock::now());
    }
  }
};

static_assert(RankedLockable<ranked_mutex>);

// =============================================================================
// Ordered Guard - holds locks taken in ascending rank, releases descending
// =============================================================================

class ordered_guard {
public:
  ordered_guard() = default;
  ~ordered_guard() { unlock(); }

  ordered_guard(const ordered_guard &) = delete;
  ordered_guard &operator=(const ordered_guard &) = delete;

  ordered_guard(ordered_guard &&other) noexcept;
  ordered_guard &operator=(ordered_guard &&other) noexcept;

  // Releases every held lock, highest rank first
  void unlock() noexcept;

  bool owns_lock() const noexcept { return !held_.empty(); }
  std::size_t size() const noexcept { return held_.size(); }

  // Held locks in acquisition (ascending rank) order
  const std::vector<ranked_mutex *> &locks() const noexcept { return held_; }

private:
  friend struct ordered_acquirer;

  // Takes ownership of a lock the caller just acquired
  void adopt(ranked_mutex *m) { held_.push_back(m); }

  std::vector<ranked_mutex *> held_;
};

struct ordered_lock_result {
  std::optional<ordered_guard> guard;
  lock_op_status status;

  explicit operator bool() const { return status == lock_op_status::success; }
};

// =============================================================================
// Ordered Acquisition
// =============================================================================

// Sorts by rank, drops repeated handles, throws std::invalid_argument for two
// distinct locks sharing a rank or a null handle
std::vector<ranked_mutex *> sort_by_rank(std::vector<ranked_mutex *> locks);

ordered_guard acquire_ordered(std::vector<ranked_mutex *> locks);

ordered_lock_result acquire_ordered(std::vector<ranked_mutex *> locks,
                                    const cancellation_token &token);

// Bounded-wait variant. On timeout or cancellation every lock taken so far is
// released again.
ordered_lock_result try_acquire_ordered(std::vector<ranked_mutex *> locks,
                                        std::chrono::steady_clock::duration timeout,
                                        const cancellation_token &token = {});

// =============================================================================
// Lock Set - a family of ranked locks with a fixed order
// =============================================================================

class lock_set {
public:
  // Throws std::invalid_argument on duplicate ranks
  explicit lock_set(std::vector<ranked_mutex *> ranked_locks);

  // Members in ascending rank order
  const std::vector<ranked_mutex *> &locks() const noexcept { return locks_; }
  std::size_t size() const noexcept { return locks_.size(); }
  bool contains(const ranked_mutex &m) const;

  // Subset acquisition; throws std::invalid_argument for non-members
  ordered_guard acquire(std::vector<ranked_mutex *> subset) const;
  ordered_lock_result acquire(std::vector<ranked_mutex *> subset,
                              const cancellation_token &token) const;
  ordered_lock_result try_acquire(std::vector<ranked_mutex *> subset,
                                  std::chrono::steady_clock::duration timeout,
                                  const cancellation_token &token = {}) const;

  ordered_guard acquire_all() const { return acquire(locks_); }

private:
  void require_members(const std::vector<ranked_mutex *> &subset) const;

  std::vector<ranked_mutex *> locks_;
};

} // namespace syncore

#endif // SYNCORE_SHARED_STATE_LOCK_ORDERING_HPP
