#pragma once

#include "policy/concepts/SelectionRngConcept.hpp"

#include <cstdint>

namespace policy {

/*
 * State private to one search thread. Created once per thread (or once per search, if threads are
 * reused) and never shared.
 *
 * policy_data is the tree policy's per-thread SelectionRng. Default construction draws a random
 * seed; pass an explicit seed wherever reproducibility matters.
 */
template <concepts::SelectionRng PolicyData>
struct ThreadData {
  ThreadData() = default;
  explicit ThreadData(uint64_t seed) : policy_data(seed) {}

  PolicyData policy_data;
};

}  // namespace policy
