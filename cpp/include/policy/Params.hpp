#pragma once

#include "core/BasicTypes.hpp"
#include "policy/Constants.hpp"
#include "policy/ThreadData.hpp"
#include "policy/concepts/SelectionRngConcept.hpp"

#include <cstdint>
#include <string>

namespace policy {

/*
 * Params pertains to the tree policy of a single search: which policy to use, how strongly it
 * explores, and how the per-thread selection state is seeded.
 *
 * It is created once per search, before any search thread starts, and is read-only afterwards.
 */
struct Params {
  auto make_options_description();

  // Parses tree_policy_str. Throws util::CleanException on an unrecognized value.
  TreePolicyType tree_policy_type() const;

  /*
   * Seed for the selection state of the given search thread.
   *
   * If seed is 0, draws a fresh random seed, making the search non-reproducible. Otherwise the
   * result depends only on (seed, thread_index), and distinct threads get unrelated streams.
   */
  uint64_t thread_seed(core::thread_index_t thread_index) const;

  template <concepts::SelectionRng PolicyData>
  ThreadData<PolicyData> make_thread_data(core::thread_index_t thread_index) const {
    return ThreadData<PolicyData>(thread_seed(thread_index));
  }

  std::string tree_policy_str = "uct";
  double exploration_constant = 1.0;
  uint64_t seed = 0;
};

}  // namespace policy

#include "inline/policy/Params.inl"
