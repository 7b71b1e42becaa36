#include "policy/PolicyRng.hpp"

#include "util/Random.hpp"

#include <cstdint>
#include <limits>

namespace policy {

inline PolicyRng::PolicyRng() : PolicyRng(util::Random::random_seed()) {}

inline PolicyRng::PolicyRng(uint64_t seed) { util::Random::seed_prng(prng_, seed); }

template <std::ranges::forward_range Range, typename KeyFunc>
std::ranges::iterator_t<const Range> PolicyRng::select_by_key(const Range& elts,
                                                               KeyFunc&& key_fn) {
  auto choice = std::ranges::end(elts);
  uint32_t num_optimal = 0;
  double best_so_far = -std::numeric_limits<double>::infinity();

  for (auto it = std::ranges::begin(elts); it != std::ranges::end(elts); ++it) {
    double score = key_fn(*it);
    if (score > best_so_far) {
      choice = it;
      num_optimal = 1;
      best_so_far = score;
    } else if (score == best_so_far) {
      ++num_optimal;
      if (util::Random::uniform_sample(prng_, uint32_t(0), num_optimal) == 0) {
        choice = it;
      }
    }
  }
  return choice;
}

}  // namespace policy
