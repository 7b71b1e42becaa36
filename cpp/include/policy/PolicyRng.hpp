#pragma once

#include <cstdint>
#include <random>
#include <ranges>

namespace policy {

/*
 * PolicyRng is the SelectionRng used by both built-in tree policies: it picks the element with the
 * maximum key, breaking ties uniformly at random.
 *
 * The tie-break is a single-pass reservoir sample restricted to the maximal class. We keep a
 * running count of the elements tied at the best key seen so far. A strictly better element resets
 * the count to 1 and becomes the current choice; an equal element bumps the count to n and
 * replaces the current choice with probability 1/n. The result is uniform over all elements tied
 * for the maximum, regardless of where they sit in the range.
 *
 * Given a fixed seed and a fixed input (order included), the result is reproducible.
 */
class PolicyRng {
 public:
  PolicyRng();
  explicit PolicyRng(uint64_t seed);

  /*
   * Returns an iterator to the chosen element of elts, or elts.end() if elts is empty.
   *
   * key_fn maps an element to a double. +inf and -inf are valid keys. An element with a NaN key is
   * never chosen, so a range whose keys are all NaN also yields elts.end().
   */
  template <std::ranges::forward_range Range, typename KeyFunc>
  std::ranges::iterator_t<const Range> select_by_key(const Range& elts, KeyFunc&& key_fn);

 private:
  std::mt19937 prng_;
};

}  // namespace policy

#include "inline/policy/PolicyRng.inl"
