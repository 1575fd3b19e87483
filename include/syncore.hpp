#ifndef SYNCORE_HPP
#define SYNCORE_HPP

// =============================================================================
// syncore - Shared-memory concurrency core
// =============================================================================
//
// Thread-safe primitives for OS threads sharing one process:
//
// - shared_counter: integer accumulator, mutex or lock-free by policy
// - bounded_channel: fixed-capacity blocking FIFO with close/drain
// - ranked_mutex / lock_set / acquire_ordered: deadlock-free multi-lock
//   acquisition by a fixed global rank order
// - cancellation_signal / cancellation_token: cooperative cancellation that
//   wakes threads blocked in any of the above
// - supervised_thread: joined, cancellable background worker
// - byte_pipe: thread-to-thread byte stream
//
// =============================================================================

// Foundation headers
#include "shared_state/concepts.hpp"
#include "shared_state/policies.hpp"
#include "shared_state/crtp_base.hpp"
#include "allocator.hpp"
#include "cancellation.hpp"

// Primitive headers
#include "shared_state/shared_counter.hpp"
#include "shared_state/channel.hpp"
#include "shared_state/lock_ordering.hpp"

// Built on the primitives
#include "supervised_thread.hpp"
#include "byte_pipe.hpp"

#endif // SYNCORE_HPP
