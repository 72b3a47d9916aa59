#pragma once

#include <cstdint>

namespace posmon {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock.
//
// @details
// The monitor stamps three things with the current time: the capture time of
// a snapshot, the detection time of a ChangeEvent, and the LogRecord /
// snapshot-file names derived from it. Reading system_clock directly would
// make those values impossible to assert in tests, so every component that
// needs "now" receives a `const ITimeProvider&` instead:
//   - LiveTimeProvider       → system_clock (production).
//   - SimulationTimeProvider → a value the test sets explicitly.
//
// int64_t epoch milliseconds rather than a time_point: the renderer protocol
// carries integer milliseconds and the conversion helpers in time_utils.hpp
// bridge to Timestamp where a time_point is wanted.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. The poll thread and
//   sink worker threads may both read the clock.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since 1970-01-01 00:00:00 UTC.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace posmon
