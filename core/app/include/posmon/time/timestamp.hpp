#pragma once

#include <chrono>

namespace posmon {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock instant used by snapshots, normalized states and events.
// std::chrono::system_clock::time_point rather than time_t so resolution and
// arithmetic are type-checked. Converted to/from epoch milliseconds by the
// helpers in time_utils.hpp.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

}  // namespace posmon
