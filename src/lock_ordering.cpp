#include "shared_state/lock_ordering.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace syncore {

// =============================================================================
// lock_order_validator
// =============================================================================

namespace {

// Ranks held by this thread, ascending
thread_local std::vector<const ranked_mutex *> t_held;

std::string describe(const ranked_mutex &m) {
  std::ostringstream out;
  out << '\'' << (m.name().empty() ? "<unnamed>" : m.name()) << "' (rank "
      << m.rank() << ')';
  return out.str();
}

} // namespace

bool lock_order_validator::enabled() noexcept {
  return SYNCORE_LOCK_ORDER_CHECKS != 0;
}

void lock_order_validator::check_acquire(const ranked_mutex &m) {
  if (!enabled() || t_held.empty())
    return;
  const ranked_mutex &highest = *t_held.back();
  if (highest.rank() >= m.rank()) {
    throw lock_order_violation("lock order violation: acquiring " +
                               describe(m) + " while holding " +
                               describe(highest));
  }
}

void lock_order_validator::on_acquired(const ranked_mutex &m) {
  if (enabled())
    t_held.push_back(&m);
}

void lock_order_validator::on_released(const ranked_mutex &m) {
  if (!enabled())
    return;
  // Usually the last entry; manual unlock may release out of order
  auto it = std::find(t_held.rbegin(), t_held.rend(), &m);
  if (it != t_held.rend())
    t_held.erase(std::next(it).base());
}

std::size_t lock_order_validator::held_count() { return t_held.size(); }

// =============================================================================
// ranked_mutex
// =============================================================================

ranked_mutex::ranked_mutex(std::uint64_t rank, std::string name)
    : rank_(rank), name_(std::move(name)) {}

void ranked_mutex::lock() {
  // Without a token or deadline acquire only returns on success
  acquire(nullptr, cancellation_token{});
}

lock_op_status ranked_mutex::lock(const cancellation_token &token) {
  return acquire(nullptr, token);
}

bool ranked_mutex::try_lock() {
  lock_order_validator::check_acquire(*this);
  {
    lock_type lock(this->mutex_);
    if (locked_)
      return false;
    locked_ = true;
    owner_ = std::this_thread::get_id();
  }
  lock_order_validator::on_acquired(*this);
  return true;
}

lock_op_status
ranked_mutex::acquire_until(std::chrono::steady_clock::time_point deadline,
                            const cancellation_token &token) {
  return acquire(&deadline, token);
}

lock_op_status
ranked_mutex::acquire(const std::chrono::steady_clock::time_point *deadline,
                      const cancellation_token &token) {
  lock_order_validator::check_acquire(*this);

  cancellation_registration registration;
  if (token) {
    registration =
        cancellation_registration(token, [this] { this->wake_all_waiters(); });
  }

  {
    lock_type lock(this->mutex_);
    auto ready = [this, &token] { return !locked_ || token.is_cancelled(); };

    if (deadline) {
      if (!this->wait_for_condition_until(lock, ready, *deadline)) {
        return lock_op_status::timeout;
      }
    } else {
      this->wait_for_condition(lock, ready);
    }

    if (token.is_cancelled()) {
      // Hand the wakeup on if the lock is free
      if (!locked_)
        this->notify_one();
      return lock_op_status::cancelled;
    }

    locked_ = true;
    owner_ = std::this_thread::get_id();
  }

  lock_order_validator::on_acquired(*this);
  return lock_op_status::success;
}

void ranked_mutex::unlock() {
  lock_order_validator::on_released(*this);
  lock_type lock(this->mutex_);
  locked_ = false;
  owner_ = std::thread::id{};
  this->notify_one();
}

bool ranked_mutex::is_locked() const {
  lock_type lock(this->mutex_);
  return locked_;
}

bool ranked_mutex::held_by_current_thread() const {
  lock_type lock(this->mutex_);
  return locked_ && owner_ == std::this_thread::get_id();
}

// =============================================================================
// ordered_guard
// =============================================================================

ordered_guard::ordered_guard(ordered_guard &&other) noexcept
    : held_(std::exchange(other.held_, {})) {}

ordered_guard &ordered_guard::operator=(ordered_guard &&other) noexcept {
  if (this != &other) {
    unlock();
    held_ = std::exchange(other.held_, {});
  }
  return *this;
}

void ordered_guard::unlock() noexcept {
  while (!held_.empty()) {
    held_.back()->unlock();
    held_.pop_back();
  }
}

// =============================================================================
// Ordered acquisition
// =============================================================================

std::vector<ranked_mutex *> sort_by_rank(std::vector<ranked_mutex *> locks) {
  if (std::find(locks.begin(), locks.end(), nullptr) != locks.end()) {
    throw std::invalid_argument("ordered acquisition of a null lock handle");
  }

  std::sort(locks.begin(), locks.end(),
            [](const ranked_mutex *a, const ranked_mutex *b) {
              return a->rank() < b->rank();
            });
  locks.erase(std::unique(locks.begin(), locks.end()), locks.end());

  auto clash = std::adjacent_find(locks.begin(), locks.end(),
                                  [](const ranked_mutex *a, const ranked_mutex *b) {
                                    return a->rank() == b->rank();
                                  });
  if (clash != locks.end()) {
    throw std::invalid_argument("ranked locks '" + (*clash)->name() + "' and '" +
                                (*std::next(clash))->name() +
                                "' share rank " +
                                std::to_string((*clash)->rank()));
  }
  return locks;
}

struct ordered_acquirer {
  // Takes sorted locks one by one. The guard releases the prefix already
  // held on failure or when the validator throws.
  static ordered_lock_result
  run(const std::vector<ranked_mutex *> &sorted,
      const std::chrono::steady_clock::time_point *deadline,
      const cancellation_token &token) {
    ordered_guard guard;
    for (ranked_mutex *m : sorted) {
      lock_op_status status =
          deadline ? m->acquire_until(*deadline, token) : m->lock(token);
      if (status != lock_op_status::success) {
        return {std::nullopt, status};
      }
      guard.adopt(m);
    }
    return {std::move(guard), lock_op_status::success};
  }
};

ordered_guard acquire_ordered(std::vector<ranked_mutex *> locks) {
  auto result = ordered_acquirer::run(sort_by_rank(std::move(locks)), nullptr,
                                      cancellation_token{});
  // An unbound token never cancels and there is no deadline
  return std::move(*result.guard);
}

ordered_lock_result acquire_ordered(std::vector<ranked_mutex *> locks,
                                    const cancellation_token &token) {
  return ordered_acquirer::run(sort_by_rank(std::move(locks)), nullptr, token);
}

ordered_lock_result try_acquire_ordered(std::vector<ranked_mutex *> locks,
                                        std::chrono::steady_clock::duration timeout,
                                        const cancellation_token &token) {
  auto deadline = deadline_after(timeout);
  return ordered_acquirer::run(sort_by_rank(std::move(locks)), &deadline, token);
}

// =============================================================================
// lock_set
// =============================================================================

lock_set::lock_set(std::vector<ranked_mutex *> ranked_locks)
    : locks_(sort_by_rank(std::move(ranked_locks))) {}

bool lock_set::contains(const ranked_mutex &m) const {
  return std::find(locks_.begin(), locks_.end(), &m) != locks_.end();
}

void lock_set::require_members(const std::vector<ranked_mutex *> &subset) const {
  for (const ranked_mutex *m : subset) {
    if (m == nullptr || !contains(*m)) {
      throw std::invalid_argument("lock is not a member of this lock_set");
    }
  }
}

ordered_guard lock_set::acquire(std::vector<ranked_mutex *> subset) const {
  require_members(subset);
  return acquire_ordered(std::move(subset));
}

ordered_lock_result lock_set::acquire(std::vector<ranked_mutex *> subset,
                                      const cancellation_token &token) const {
  require_members(subset);
  return acquire_ordered(std::move(subset), token);
}

ordered_lock_result lock_set::try_acquire(std::vector<ranked_mutex *> subset,
                                          std::chrono::steady_clock::duration timeout,
                                          const cancellation_token &token) const {
  require_members(subset);
  return try_acquire_ordered(std::move(subset), timeout, token);
}

} // namespace syncore
