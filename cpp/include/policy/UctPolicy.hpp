#pragma once

#include "policy/PolicyRng.hpp"
#include "policy/concepts/EdgeStatsConcept.hpp"
#include "policy/concepts/SelectionRngConcept.hpp"
#include "policy/concepts/TreePolicyConcept.hpp"

#include <ranges>
#include <span>

namespace policy {

/*
 * UctPolicy scores each candidate edge with the UCB1 bound:
 *
 *   c * sqrt(ln(N) / n) + W / n
 *
 * where c is the exploration constant, n the edge's visit count, W its reward sum, and N the
 * parent's visit count. An unvisited edge scores +inf, so every sibling is tried once before any
 * exploitation happens. Ties (including several unvisited siblings) are broken uniformly at
 * random by the calling thread's PolicyRng.
 *
 * NOTE: N is defined as the sum of the candidates' visit counts, not as a separately-tracked parent
 * counter. This differs from the textbook formulation at low visit counts, and can read
 * transiently low while sibling counters are being updated by other threads. When every candidate
 * is unvisited, N is 0, but ln(N) is never evaluated in that case.
 *
 * The prior evaluations stored on the edges are ignored, so MoveEvaluation can be any type.
 *
 * Rng is the per-thread SelectionRng that picks among the scored edges. PolicyRng gives the
 * classic max-with-random-tie-break; WeightedRng samples in proportion to the scores instead.
 *
 * See: http://mcts.ai/pubs/mcts-survey-master.pdf
 */
template <typename MoveEvaluation_, concepts::SelectionRng Rng = PolicyRng>
class UctPolicy {
 public:
  using MoveEvaluation = MoveEvaluation_;
  using ThreadLocalData = Rng;

  // Throws util::CleanException if exploration_constant is not a positive finite number.
  explicit UctPolicy(double exploration_constant);

  double exploration_constant() const { return exploration_constant_; }

  /*
   * Returns a pointer to the chosen element of moves, or nullptr if moves is empty.
   *
   * moves is iterated twice.
   */
  template <concepts::CandidateRange Moves, concepts::SearchHandleFor<Rng> Handle>
  const std::ranges::range_value_t<Moves>* choose_child(const Moves& moves, Handle handle) const;

  // UCT does not use priors, so there is nothing to check.
  void validate_evaluations(std::span<const MoveEvaluation>) const {}

 private:
  const double exploration_constant_;
};

}  // namespace policy

#include "inline/policy/UctPolicy.inl"
