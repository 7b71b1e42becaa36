#pragma once

#include <atomic>
#include <cstdint>

/*
 * Atomic cell types used to store per-edge search statistics.
 *
 * The tree owns these cells and mutates them during backpropagation; the selection code only reads
 * them. All accesses use std::memory_order_relaxed: each counter is independently
 * eventually-consistent, and no ordering is implied between two counters of the same edge.
 *
 * Both types must be lock-free 64-bit atomics. A target without native 64-bit atomics would need a
 * different numeric layout for the edge statistics (e.g. 32-bit visit counts with a fixed-point
 * reward sum), so we refuse to build there rather than silently falling back to a locked
 * implementation.
 */
namespace core {

using AtomicU64 = std::atomic<uint64_t>;
using AtomicF64 = std::atomic<double>;

static_assert(AtomicU64::is_always_lock_free,
              "64-bit integer atomics are not lock-free on this target; edge statistics need an "
              "alternative layout");
static_assert(AtomicF64::is_always_lock_free,
              "64-bit floating-point atomics are not lock-free on this target; edge statistics need "
              "an alternative layout");

constexpr std::memory_order kRelaxed = std::memory_order_relaxed;

}  // namespace core
