#pragma once

#include "core/Atomics.hpp"

#include <cstdint>

namespace policy {

/*
 * A MoveInfo is the record the search tree keeps for each edge out of a node: the move itself, the
 * prior evaluation supplied by the evaluator when the node was expanded, and the running
 * statistics of the playouts that have gone through the edge.
 *
 * The statistics are independent relaxed atomics. Backpropagation (which lives with the tree, not
 * here) calls record_visit() or the finer-grained add_visits()/add_reward(); the tree policies
 * call visits()/sum_rewards() concurrently, with no lock and no atomic snapshot of the pair.
 *
 * NOTE: the copy constructor reads the counters with relaxed loads. It is intended for building a
 * node's edge array before the node is published to other threads; copying an edge that is being
 * concurrently updated produces a snapshot whose two counters may come from different moments.
 */
template <typename Move, typename MoveEvaluation>
class MoveInfo {
 public:
  MoveInfo(const Move& move, const MoveEvaluation& move_evaluation)
      : move_(move), move_evaluation_(move_evaluation) {}

  MoveInfo(const MoveInfo& other);
  MoveInfo& operator=(const MoveInfo&) = delete;

  const Move& move() const { return move_; }
  const MoveEvaluation& move_evaluation() const { return move_evaluation_; }

  uint64_t visits() const { return visits_.load(core::kRelaxed); }
  double sum_rewards() const { return sum_rewards_.load(core::kRelaxed); }

  void add_visits(uint64_t n) { visits_.fetch_add(n, core::kRelaxed); }
  void add_reward(double reward) { sum_rewards_.fetch_add(reward, core::kRelaxed); }

  // Counts one playout through this edge that produced the given reward.
  void record_visit(double reward);

 private:
  const Move move_;
  const MoveEvaluation move_evaluation_;
  core::AtomicU64 visits_ = 0;
  core::AtomicF64 sum_rewards_ = 0;
};

}  // namespace policy

#include "inline/policy/MoveInfo.inl"
