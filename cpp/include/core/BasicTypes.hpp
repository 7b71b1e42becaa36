#pragma once

#include <cstdint>

namespace core {

// Zero-indexed id of a search thread within a single search. Used to derive per-thread seeds.
using thread_index_t = int16_t;

}  // namespace core
