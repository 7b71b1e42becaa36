#pragma once

#include "policy/Constants.hpp"

#include <array>
#include <cstdint>

namespace policy {

/*
 * ReciprocalTable::get(x) returns 1.0 / x, avoiding a division for x < kReciprocalTableLen.
 *
 * get(0) returns kUnvisitedReciprocal (2.0) rather than infinity. AlphaGoPolicy relies on this to
 * give unvisited edges a bounded bonus.
 *
 * The table is filled in the constructor and never mutated afterwards, so a single instance can be
 * read from any number of threads without synchronization.
 */
class ReciprocalTable {
 public:
  ReciprocalTable();

  double get(uint64_t x) const {
    return x < kReciprocalTableLen ? values_[x] : 1.0 / static_cast<double>(x);
  }

 private:
  std::array<double, kReciprocalTableLen> values_;
};

}  // namespace policy

#include "inline/policy/ReciprocalTable.inl"
