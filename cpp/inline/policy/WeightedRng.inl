#include "policy/WeightedRng.hpp"

#include "policy/Constants.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>

namespace policy {

inline WeightedRng::WeightedRng() : WeightedRng(util::Random::random_seed()) {}

inline WeightedRng::WeightedRng(uint64_t seed) { util::Random::seed_prng(prng_, seed); }

template <std::ranges::forward_range Range, typename KeyFunc>
std::ranges::iterator_t<const Range> WeightedRng::select_by_key(const Range& elts,
                                                                 KeyFunc&& key_fn) {
  using iterator_t = std::ranges::iterator_t<const Range>;

  std::vector<iterator_t> options;
  std::vector<double> scores;
  for (auto it = std::ranges::begin(elts); it != std::ranges::end(elts); ++it) {
    options.push_back(it);
    scores.push_back(key_fn(*it));
  }

  if (options.empty()) return std::ranges::end(elts);

  double shift = weight_shift(scores);
  std::vector<double> weights;
  weights.reserve(scores.size());
  for (double score : scores) {
    weights.push_back(score + shift);
  }

  if (sampleable(weights)) {
    int k = util::Random::weighted_sample(prng_, weights.begin(), weights.end());
    return options[k];
  }

  LOG_WARN("No weighted choice found, {} moves found, choosing uniformly at random. Scores: [{}]",
           options.size(), fmt::join(scores, ", "));
  return options[util::Random::uniform_sample(prng_, size_t(0), options.size())];
}

inline double WeightedRng::weight_shift(const std::vector<double>& scores) {
  RELEASE_ASSERT(!scores.empty());

  // NaN scores are skipped here; they make the weights unsampleable further down.
  double minimal = std::numeric_limits<double>::infinity();
  for (double score : scores) {
    if (score < minimal) minimal = score;
  }
  return minimal < 0 ? -minimal : kWeightShiftFloor;
}

inline bool WeightedRng::sampleable(const std::vector<double>& weights) {
  double total = 0;
  for (double w : weights) {
    if (!std::isfinite(w) || w < 0) return false;
    total += w;
  }
  return std::isfinite(total) && total > 0;
}

}  // namespace policy
