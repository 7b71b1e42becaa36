#include "policy/AlphaGoPolicy.hpp"

#include "policy/Constants.hpp"
#include "policy/Exceptions.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <cmath>
#include <memory>

namespace policy {

template <concepts::SelectionRng Rng>
BasicAlphaGoPolicy<Rng>::BasicAlphaGoPolicy(double exploration_constant)
    : exploration_constant_(exploration_constant) {
  if (!(exploration_constant > 0) || !std::isfinite(exploration_constant)) {
    throw util::CleanException("exploration constant is {} (must be positive)",
                               exploration_constant);
  }
  LOG_DEBUG("BasicAlphaGoPolicy<{}>: exploration_constant={}", util::get_typename<Rng>(),
            exploration_constant_);
}

template <concepts::SelectionRng Rng>
template <concepts::CandidateRange Moves, concepts::SearchHandleFor<Rng> Handle>
  requires concepts::NumericEdgeStats<std::ranges::range_value_t<Moves>>
const std::ranges::range_value_t<Moves>* BasicAlphaGoPolicy<Rng>::choose_child(
    const Moves& moves, Handle handle) const {
  uint64_t total_visits = 1;
  for (const auto& mov : moves) {
    total_visits += mov.visits();
  }
  const double explore_coef = exploration_constant_ * std::sqrt(double(total_visits));

  auto it = handle.thread_data().policy_data.select_by_key(moves, [&](const auto& mov) {
    double sum_rewards = mov.sum_rewards();
    uint64_t child_visits = mov.visits();
    double prior = mov.move_evaluation();
    return (sum_rewards + explore_coef * prior) * reciprocals_.get(child_visits);
  });

  if (it == std::ranges::end(moves)) return nullptr;
  return std::addressof(*it);
}

template <concepts::SelectionRng Rng>
void BasicAlphaGoPolicy<Rng>::validate_evaluations(std::span<const double> evaluations) const {
  for (double x : evaluations) {
    if (!(x >= kMinPriorEvaluation)) {
      LOG_ERROR("AlphaGoPolicy: rejecting move evaluation {}", x);
      throw EvaluatorContractError("Move evaluation is {} (must be non-negative)", x);
    }
  }
  if (evaluations.empty()) return;

  double sum = 0;
  for (double x : evaluations) {
    sum += x;
  }
  if (!(std::abs(sum - 1.0) < kPriorSumTolerance)) {
    LOG_ERROR("AlphaGoPolicy: rejecting {} move evaluations summing to {}", evaluations.size(),
              sum);
    throw EvaluatorContractError("Sum of evaluations is {} (should sum to 1)", sum);
  }
}

}  // namespace policy
