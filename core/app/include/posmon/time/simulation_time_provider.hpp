#pragma once

#include "posmon/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace posmon {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever was last passed to
//         advance_time().
//
// @details
// Tests drive the engine with scripted snapshots and assert on the exact
// ISO-8601 timestamp written to the log and the exact snapshot file name.
// Both derive from now_ms(), so the test pins the clock before each
// iteration:
//
//   SimulationTimeProvider clock;
//   clock.advance_time(1'760'000'000'000);  // 2025-10-09T08:53:20Z
//   engine.runOnce();
//
// Storage is a std::atomic<int64_t>: the poll thread writes through the test
// and sink worker threads may read concurrently. Lock-free on 64-bit targets.
//
// Monotonicity is not enforced; tests are free to move the clock backwards.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // Convenience for fixtures that want a non-zero start time.
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Subsequent now_ms() calls from any thread return
  // new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace posmon
