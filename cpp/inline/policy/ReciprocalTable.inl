#include "policy/ReciprocalTable.hpp"

namespace policy {

inline ReciprocalTable::ReciprocalTable() {
  values_[0] = kUnvisitedReciprocal;
  for (int x = 1; x < kReciprocalTableLen; ++x) {
    values_[x] = 1.0 / x;
  }
}

}  // namespace policy
