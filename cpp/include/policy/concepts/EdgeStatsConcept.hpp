#pragma once

#include <concepts>
#include <cstdint>
#include <ranges>

namespace policy {
namespace concepts {

/*
 * Read-only view of the statistics of a single candidate edge.
 *
 * visits() and sum_rewards() may be mutated concurrently by other threads, and may be observed at
 * different points of their respective update histories.
 */
template <class E>
concept EdgeStats = requires(const E& e) {
  { e.visits() } -> std::convertible_to<uint64_t>;
  { e.sum_rewards() } -> std::convertible_to<double>;
  e.move_evaluation();
};

/*
 * EdgeStats whose prior evaluation can be read as a number.
 */
template <class E>
concept NumericEdgeStats = EdgeStats<E> && requires(const E& e) {
  { e.move_evaluation() } -> std::convertible_to<double>;
};

/*
 * The candidate set passed to a tree policy: a forward range of edges, iterated more than once per
 * call. Re-iteration must visit the same edges in the same order.
 */
template <class R>
concept CandidateRange =
    std::ranges::forward_range<R> && std::is_lvalue_reference_v<std::ranges::range_reference_t<R>> &&
    EdgeStats<std::ranges::range_value_t<R>>;

}  // namespace concepts
}  // namespace policy
