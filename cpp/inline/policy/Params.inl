#include "policy/Params.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/Math.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

namespace policy {

inline auto Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Tree policy options");

  return desc
      .template add_option<"tree-policy">(
          po::value<std::string>(&tree_policy_str)->default_value(tree_policy_str),
          "tree policy (uct|alphago)")
      .template add_option<"exploration-constant", 'c'>(
          po2::default_value("{:.3f}", &exploration_constant),
          "exploration constant (must be positive)")
      .template add_hidden_option<"policy-seed">(
          po::value<uint64_t>(&seed)->default_value(seed),
          "seed for per-thread selection state (default: 0 means seed randomly)");
}

inline TreePolicyType Params::tree_policy_type() const {
  if (tree_policy_str == "uct") return kUct;
  if (tree_policy_str == "alphago") return kAlphaGo;
  throw util::CleanException("Unknown --tree-policy: \"{}\" (expected uct or alphago)",
                             tree_policy_str);
}

inline uint64_t Params::thread_seed(core::thread_index_t thread_index) const {
  if (!seed) return util::Random::random_seed();
  return math::splitmix64(seed + uint64_t(thread_index));
}

}  // namespace policy
