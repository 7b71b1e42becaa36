#include "util/Random.hpp"

#include "util/Exception.hpp"

#include <type_traits>

namespace util {

inline void Random::seed_prng(std::mt19937& prng, uint64_t seed) {
  std::seed_seq seq{uint32_t(seed), uint32_t(seed >> 32)};
  prng.seed(seq);
}

inline uint64_t Random::random_seed() {
  thread_local std::random_device device;
  uint64_t hi = device();
  uint64_t lo = device();
  return (hi << 32) | lo;
}

template <std::integral T, std::integral U>
inline auto Random::uniform_sample(std::mt19937& prng, T lower, U upper) {
  if (lower >= upper) {
    throw util::Exception("Random::uniform_sample() - invalid range [{}, {})", lower, upper);
  }
  using V = std::common_type_t<T, U>;
  std::uniform_int_distribution<V> dist{(V)lower, (V)(upper - 1)};
  return dist(prng);
}

template <typename InputIt>
inline int Random::weighted_sample(std::mt19937& prng, InputIt begin, InputIt end) {
  std::discrete_distribution<int> dist(begin, end);
  return dist(prng);
}

}  // namespace util
