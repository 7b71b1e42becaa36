#pragma once

#include <cstdint>
#include <random>
#include <ranges>
#include <vector>

namespace policy {

/*
 * WeightedRng is an alternative SelectionRng: instead of taking the max, it samples an element
 * with probability proportional to its (shifted) key.
 *
 * Keys may be negative, so they are shifted before sampling. If the minimum key is negative, the
 * shift is its absolute value, which gives the minimal element zero weight. Otherwise the shift is
 * kWeightShiftFloor, so that all-zero keys still produce strictly positive weights.
 *
 * If the shifted weights cannot be sampled from (a non-finite weight, or a zero total), we fall
 * back to a uniform pick and log a warning. A non-empty range always produces a choice.
 */
class WeightedRng {
 public:
  WeightedRng();
  explicit WeightedRng(uint64_t seed);

  /*
   * Returns an iterator to the chosen element of elts, or elts.end() if elts is empty.
   *
   * key_fn is evaluated exactly once per element.
   */
  template <std::ranges::forward_range Range, typename KeyFunc>
  std::ranges::iterator_t<const Range> select_by_key(const Range& elts, KeyFunc&& key_fn);

  // The amount added to every score before sampling. scores must be non-empty.
  static double weight_shift(const std::vector<double>& scores);

 private:
  static bool sampleable(const std::vector<double>& weights);

  std::mt19937 prng_;
};

}  // namespace policy

#include "inline/policy/WeightedRng.inl"
