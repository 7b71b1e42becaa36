#pragma once

#include <cstdint>

namespace policy {

enum TreePolicyType : int8_t { kUct, kAlphaGo };

// Size of AlphaGoPolicy's precomputed reciprocal table. Visit counts below this avoid a division.
constexpr int kReciprocalTableLen = 128;

// reciprocal(0). Gives an unvisited edge a strong but bounded bonus proportional to its prior.
constexpr double kUnvisitedReciprocal = 2.0;

// WeightedRng shifts all scores by this much when the minimum score is non-negative, so that
// every weight is strictly positive even if all scores are exactly zero.
constexpr double kWeightShiftFloor = 0.01;

// Prior-evaluation validation bounds for AlphaGoPolicy.
constexpr double kMinPriorEvaluation = -1e-6;
constexpr double kPriorSumTolerance = 0.1;

}  // namespace policy
