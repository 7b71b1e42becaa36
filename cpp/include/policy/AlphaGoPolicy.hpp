#pragma once

#include "policy/PolicyRng.hpp"
#include "policy/ReciprocalTable.hpp"
#include "policy/concepts/EdgeStatsConcept.hpp"
#include "policy/concepts/SelectionRngConcept.hpp"
#include "policy/concepts/TreePolicyConcept.hpp"

#include <cstdint>
#include <ranges>
#include <span>

namespace policy {

/*
 * BasicAlphaGoPolicy is the prior-weighted (PUCT-style) tree policy. Each edge carries a prior P,
 * supplied by the evaluator when its node was expanded, and is scored as:
 *
 *   (W + c * sqrt(N + 1) * P) / n
 *
 * where W is the edge's reward sum, n its visit count, N the sum of the candidates' visit counts,
 * and c the exploration constant. The +1 accounts for the parent's own visit. The division is done
 * via ReciprocalTable, which maps n = 0 to 2.0: an unvisited edge gets a large but finite bonus
 * proportional to its prior, rather than being forced first as in UctPolicy.
 *
 * validate_evaluations() requires the priors of each expanded node to approximate a probability
 * distribution.
 *
 * Most code wants the AlphaGoPolicy alias, which breaks ties uniformly with PolicyRng.
 */
template <concepts::SelectionRng Rng>
class BasicAlphaGoPolicy {
 public:
  using MoveEvaluation = double;
  using ThreadLocalData = Rng;

  // Throws util::CleanException if exploration_constant is not a positive finite number.
  explicit BasicAlphaGoPolicy(double exploration_constant);

  double exploration_constant() const { return exploration_constant_; }
  double reciprocal(uint64_t x) const { return reciprocals_.get(x); }

  /*
   * Returns a pointer to the chosen element of moves, or nullptr if moves is empty.
   *
   * moves is iterated twice.
   */
  template <concepts::CandidateRange Moves, concepts::SearchHandleFor<Rng> Handle>
    requires concepts::NumericEdgeStats<std::ranges::range_value_t<Moves>>
  const std::ranges::range_value_t<Moves>* choose_child(const Moves& moves, Handle handle) const;

  /*
   * Throws EvaluatorContractError unless every prior is >= kMinPriorEvaluation and, for a
   * non-empty span, the priors sum to within kPriorSumTolerance of 1.
   */
  void validate_evaluations(std::span<const MoveEvaluation> evaluations) const;

 private:
  const double exploration_constant_;
  const ReciprocalTable reciprocals_;
};

using AlphaGoPolicy = BasicAlphaGoPolicy<PolicyRng>;

}  // namespace policy

#include "inline/policy/AlphaGoPolicy.inl"
