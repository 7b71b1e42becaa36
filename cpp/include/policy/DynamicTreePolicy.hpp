#pragma once

#include "policy/AlphaGoPolicy.hpp"
#include "policy/Constants.hpp"
#include "policy/Params.hpp"
#include "policy/PolicyRng.hpp"
#include "policy/UctPolicy.hpp"
#include "policy/concepts/EdgeStatsConcept.hpp"
#include "policy/concepts/TreePolicyConcept.hpp"

#include <ranges>
#include <span>
#include <variant>

namespace policy {

/*
 * DynamicTreePolicy holds one of the built-in tree policies, chosen at construction time (usually
 * from Params, i.e. from the command line), and forwards to it.
 *
 * Both alternatives use PolicyRng as their per-thread state and double as their MoveEvaluation,
 * so a search can be written once against DynamicTreePolicy without knowing which policy it runs.
 * Code that fixes its policy at compile-time should use UctPolicy/AlphaGoPolicy directly.
 */
class DynamicTreePolicy {
 public:
  using MoveEvaluation = double;
  using ThreadLocalData = PolicyRng;
  using variant_t = std::variant<UctPolicy<double>, AlphaGoPolicy>;

  // Throws util::CleanException on an invalid policy name or exploration constant.
  explicit DynamicTreePolicy(const Params& params);
  DynamicTreePolicy(TreePolicyType type, double exploration_constant);

  TreePolicyType type() const { return TreePolicyType(policy_.index()); }
  double exploration_constant() const;

  template <concepts::CandidateRange Moves, concepts::SearchHandleFor<PolicyRng> Handle>
    requires concepts::NumericEdgeStats<std::ranges::range_value_t<Moves>>
  const std::ranges::range_value_t<Moves>* choose_child(const Moves& moves, Handle handle) const;

  void validate_evaluations(std::span<const MoveEvaluation> evaluations) const;

 private:
  static variant_t make(TreePolicyType type, double exploration_constant);

  const variant_t policy_;
};

}  // namespace policy

#include "inline/policy/DynamicTreePolicy.inl"
