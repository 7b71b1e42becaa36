#pragma once

#include <concepts>
#include <cstdint>
#include <vector>

namespace policy {
namespace concepts {

namespace detail {

struct IdentityKey {
  double operator()(const double& x) const { return x; }
};

}  // namespace detail

/*
 * A SelectionRng is per-thread state that picks the "best" element of a range under a key
 * function. It must be default-constructible (random seed) and constructible from an explicit
 * uint64_t seed.
 *
 * select_by_key() returns an iterator into the range, or the range's end() if the range is empty.
 */
template <class R>
concept SelectionRng =
    std::default_initializable<R> && std::constructible_from<R, uint64_t> &&
    requires(R& rng, const std::vector<double>& elts) {
      {
        rng.select_by_key(elts, detail::IdentityKey{})
      } -> std::same_as<std::vector<double>::const_iterator>;
    };

}  // namespace concepts
}  // namespace policy
