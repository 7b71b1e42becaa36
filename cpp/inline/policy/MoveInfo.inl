#include "policy/MoveInfo.hpp"

namespace policy {

template <typename Move, typename MoveEvaluation>
MoveInfo<Move, MoveEvaluation>::MoveInfo(const MoveInfo& other)
    : move_(other.move_),
      move_evaluation_(other.move_evaluation_),
      visits_(other.visits()),
      sum_rewards_(other.sum_rewards()) {}

template <typename Move, typename MoveEvaluation>
void MoveInfo<Move, MoveEvaluation>::record_visit(double reward) {
  visits_.fetch_add(1, core::kRelaxed);
  sum_rewards_.fetch_add(reward, core::kRelaxed);
}

}  // namespace policy
