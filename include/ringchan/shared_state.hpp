#ifndef RINGCHAN_SHARED_STATE_HPP
#define RINGCHAN_SHARED_STATE_HPP

// =============================================================================
// ringchan Shared State Library
// =============================================================================
//
// A bounded multi-producer multi-consumer channel built from two layers:
//
// - ring_buffer: fixed-capacity FIFO over raw slot storage with non-blocking
//   try_push / try_pop under a single lock (policy-selected)
// - channel: sender / receiver handles around a shared ring buffer, FIFO
//   wait-lists of suspended producers and consumers, liveness counters and
//   resumable send / receive operations usable with co_await, poll() or the
//   blocking wrappers
//
// =============================================================================

// Foundation headers
#include "shared_state/concepts.hpp"
#include "shared_state/policies.hpp"
#include "shared_state/crtp_base.hpp"

// Primitive headers
#include "shared_state/ring_buffer.hpp"
#include "shared_state/waker.hpp"
#include "shared_state/wait_list.hpp"
#include "shared_state/channel.hpp"

#endif // RINGCHAN_SHARED_STATE_HPP
