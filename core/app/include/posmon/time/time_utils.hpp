#pragma once

#include "posmon/time/timestamp.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace posmon {

// -----------------------------------------------------------------------------
// Time conversion and formatting utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridges between ITimeProvider's int64_t milliseconds, Timestamp
//         (system_clock::time_point) and the two textual forms the monitor
//         writes to disk.
//
// Thread-safety: Stateless — safe to call from any thread. The formatters use
// gmtime_r, never the shared-buffer gmtime.
// -----------------------------------------------------------------------------

// Epoch milliseconds → Timestamp. Inverse of timestamp_to_ms().
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// Timestamp → epoch milliseconds (truncating).
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// formatIso8601Utc
// -------------------------------------------------------------------------
// @brief  "2025-10-09T08:53:20Z" — second resolution, UTC, 'Z' suffix.
//
// @details
// This is the exact form written into the "timestamp" field of every
// LogRecord line. Sub-second precision is dropped, not rounded.
// -------------------------------------------------------------------------
std::string formatIso8601Utc(std::int64_t epoch_ms);

// -------------------------------------------------------------------------
// formatFileStamp
// -------------------------------------------------------------------------
// @brief  "20251009_085320" — UTC, second resolution, safe in file names.
//
// @details
// Used for snapshot artifact names (positions_<stamp>.png). Two changes
// within the same second map to the same name; the later write replaces the
// earlier one atomically.
// -------------------------------------------------------------------------
std::string formatFileStamp(std::int64_t epoch_ms);

}  // namespace posmon
