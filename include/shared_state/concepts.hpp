#ifndef SYNCORE_SHARED_STATE_CONCEPTS_HPP
#define SYNCORE_SHARED_STATE_CONCEPTS_HPP

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace syncore {

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

template <typename T>
concept TimedLockable =
    Lockable<T> && requires(T m, std::chrono::milliseconds d,
                            std::chrono::steady_clock::time_point t) {
      { m.try_lock_for(d) } -> std::convertible_to<bool>;
      { m.try_lock_until(t) } -> std::convertible_to<bool>;
    };

template <typename T>
concept RankedLockable = TimedLockable<T> && requires(const T m) {
  { m.rank() } -> std::convertible_to<std::uint64_t>;
};

// =============================================================================
// Shared State Concepts
// =============================================================================

template <typename C>
concept Counter = requires(C c, const C cc, std::int64_t delta) {
  { c.increment(delta) } -> std::same_as<std::int64_t>;
  { c.decrement(delta) } -> std::same_as<std::int64_t>;
  { cc.get() } -> std::same_as<std::int64_t>;
};

template <typename C, typename T>
concept ChannelSender = requires(C c, T value) {
  { c.put(std::move(value)) };
  { c.try_put(std::move(value)) };
};

template <typename C, typename T>
concept ChannelReceiver = requires(C c) {
  { c.take() };
  { c.try_take() };
};

template <typename C, typename T>
concept Channel = ChannelSender<C, T> && ChannelReceiver<C, T> && requires(C c) {
  { c.close() } -> std::same_as<void>;
  { c.is_closed() } -> std::convertible_to<bool>;
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept LockPolicy = requires {
  typename P::mutex_type;
  typename P::lock_type;
};

template <typename P>
concept MemoryOrderPolicy = requires {
  { P::load_order } -> std::convertible_to<std::memory_order>;
  { P::store_order } -> std::convertible_to<std::memory_order>;
  { P::rmw_order } -> std::convertible_to<std::memory_order>;
};

template <typename P>
concept CounterPolicy = requires {
  { P::is_synchronized } -> std::convertible_to<bool>;
};

} // namespace syncore

#endif // SYNCORE_SHARED_STATE_CONCEPTS_HPP
