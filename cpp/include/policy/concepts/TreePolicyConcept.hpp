#pragma once

#include "policy/MoveInfo.hpp"
#include "policy/SearchHandle.hpp"
#include "policy/ThreadData.hpp"
#include "policy/concepts/SelectionRngConcept.hpp"

#include <concepts>
#include <span>
#include <vector>

namespace policy {
namespace concepts {

/*
 * A TreePolicy decides which child edge a search thread descends into. It must name:
 *
 * - MoveEvaluation: the type of the prior stored on each edge.
 * - ThreadLocalData: the SelectionRng each search thread owns for use by this policy.
 *
 * and provide:
 *
 * - choose_child(moves, handle): a template over the candidate range and the search handle. The
 *   concept can only check one instantiation, so it checks the reference edge record: a vector of
 *   MoveInfo<int, MoveEvaluation>, with a SearchHandle over ThreadData<ThreadLocalData>. The result
 *   must point into the range.
 * - validate_evaluations(), which checks the priors of a newly expanded node.
 * - exploration_constant().
 */
template <class P>
concept TreePolicy = requires(
    const P& policy, std::span<const typename P::MoveEvaluation> evals,
    const std::vector<MoveInfo<int, typename P::MoveEvaluation>>& moves,
    SearchHandle<ThreadData<typename P::ThreadLocalData>> handle) {
  typename P::MoveEvaluation;
  typename P::ThreadLocalData;
  requires SelectionRng<typename P::ThreadLocalData>;
  {
    policy.choose_child(moves, handle)
  } -> std::same_as<const MoveInfo<int, typename P::MoveEvaluation>*>;
  { policy.exploration_constant() } -> std::convertible_to<double>;
  policy.validate_evaluations(evals);
};

/*
 * A handle through which a tree policy reaches the calling thread's PolicyData.
 */
template <class H, class PolicyData>
concept SearchHandleFor = requires(const H& handle) {
  { handle.thread_data().policy_data } -> std::same_as<PolicyData&>;
};

}  // namespace concepts
}  // namespace policy
