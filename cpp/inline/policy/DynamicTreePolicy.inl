#include "policy/DynamicTreePolicy.hpp"

#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <magic_enum/magic_enum.hpp>

namespace policy {

inline DynamicTreePolicy::DynamicTreePolicy(const Params& params)
    : DynamicTreePolicy(params.tree_policy_type(), params.exploration_constant) {}

inline DynamicTreePolicy::DynamicTreePolicy(TreePolicyType type, double exploration_constant)
    : policy_(make(type, exploration_constant)) {
  LOG_INFO("Tree policy: {} (exploration constant {})", magic_enum::enum_name(type),
           exploration_constant);
}

inline double DynamicTreePolicy::exploration_constant() const {
  return std::visit([](const auto& p) { return p.exploration_constant(); }, policy_);
}

template <concepts::CandidateRange Moves, concepts::SearchHandleFor<PolicyRng> Handle>
  requires concepts::NumericEdgeStats<std::ranges::range_value_t<Moves>>
const std::ranges::range_value_t<Moves>* DynamicTreePolicy::choose_child(const Moves& moves,
                                                                         Handle handle) const {
  return std::visit([&](const auto& p) { return p.choose_child(moves, handle); }, policy_);
}

inline void DynamicTreePolicy::validate_evaluations(std::span<const double> evaluations) const {
  std::visit([&](const auto& p) { p.validate_evaluations(evaluations); }, policy_);
}

inline DynamicTreePolicy::variant_t DynamicTreePolicy::make(TreePolicyType type,
                                                            double exploration_constant) {
  switch (type) {
    case kUct:
      return variant_t(std::in_place_type<UctPolicy<double>>, exploration_constant);
    case kAlphaGo:
      return variant_t(std::in_place_type<AlphaGoPolicy>, exploration_constant);
  }
  throw util::Exception("Unknown TreePolicyType: {}", int(type));
}

}  // namespace policy
