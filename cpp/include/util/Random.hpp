#pragma once

#include <concepts>
#include <cstdint>
#include <random>

/*
 * A wrapper around STL's random machinery.
 *
 * Every function takes the std::mt19937 to draw from as its first argument. There is no shared
 * default prng: each search thread owns its selection state, and with it its own prng, so that
 * threads never contend and a seeded search replays exactly.
 *
 * std::mt19937 prng;
 * util::Random::seed_prng(prng, seed);
 * int k = util::Random::uniform_sample(prng, 0, n);
 */
namespace util {

class Random {
 public:
  /*
   * Seeds prng using all 64 bits of seed. std::mt19937::seed() on its own would truncate to 32.
   */
  static void seed_prng(std::mt19937& prng, uint64_t seed);

  /*
   * Draws a non-deterministic 64-bit seed from std::random_device. Safe to call from any thread.
   *
   * Intended for the outermost construction boundary only. Anything that needs to be reproducible
   * should be handed an explicit seed instead.
   */
  static uint64_t random_seed();

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * T and U should be integral types, and lower must be less than upper.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  /*
   * Given an array A of n values, produces a random integer on the interval [0, n), where integer i
   * is chosen with probability proportional to A[i].
   *
   * The begin/end of the array is passed in as the two arguments. The weights must be finite and
   * non-negative with a positive sum; callers that cannot guarantee that should check first.
   *
   * Example:
   *
   * std::array<double, 3> arr = {1, 2, 3};
   * int k = util::Random::weighted_sample(prng, arr.begin(), arr.end());
   */
  template <typename InputIt>
  static int weighted_sample(std::mt19937& prng, InputIt begin, InputIt end);
};

}  // namespace util

#include "inline/util/Random.inl"
