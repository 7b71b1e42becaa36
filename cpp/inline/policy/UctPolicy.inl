#include "policy/UctPolicy.hpp"

#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>

namespace policy {

template <typename MoveEvaluation, concepts::SelectionRng Rng>
UctPolicy<MoveEvaluation, Rng>::UctPolicy(double exploration_constant)
    : exploration_constant_(exploration_constant) {
  if (!(exploration_constant > 0) || !std::isfinite(exploration_constant)) {
    throw util::CleanException("exploration constant is {} (must be positive)",
                               exploration_constant);
  }
  LOG_DEBUG("UctPolicy<{}, {}>: exploration_constant={}", util::get_typename<MoveEvaluation>(),
            util::get_typename<Rng>(), exploration_constant_);
}

template <typename MoveEvaluation, concepts::SelectionRng Rng>
template <concepts::CandidateRange Moves, concepts::SearchHandleFor<Rng> Handle>
const std::ranges::range_value_t<Moves>* UctPolicy<MoveEvaluation, Rng>::choose_child(
    const Moves& moves, Handle handle) const {
  uint64_t parent_visits = 0;
  for (const auto& mov : moves) {
    parent_visits += mov.visits();
  }

  // ln(0) is never taken. A child that reads as visited here while the sum above read 0 (another
  // thread updated it in between) just gets no exploration bonus.
  const double log_parent_visits = parent_visits ? std::log(double(parent_visits)) : 0;

  auto it = handle.thread_data().policy_data.select_by_key(moves, [&](const auto& mov) {
    uint64_t child_visits = mov.visits();
    if (child_visits == 0) {
      return std::numeric_limits<double>::infinity();
    }
    double sum_rewards = mov.sum_rewards();
    double n = child_visits;
    double explore_term = std::sqrt(log_parent_visits / n);
    double mean_action_value = sum_rewards / n;
    return exploration_constant_ * explore_term + mean_action_value;
  });

  if (it == std::ranges::end(moves)) return nullptr;
  return std::addressof(*it);
}

}  // namespace policy
