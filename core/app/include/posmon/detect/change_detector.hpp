#pragma once

#include "posmon/domain/normalized_state.hpp"

#include <optional>

namespace posmon {

// -----------------------------------------------------------------------------
// ChangeDetector
// -----------------------------------------------------------------------------
//
// @brief  Two-state machine that owns the "last accepted state".
//
// @details
// States:
//   NO_BASELINE  baseline_ is empty. The first observed state becomes the
//                baseline and the decision is Baseline (never Changed).
//   TRACKING     baseline_ holds a state. A new state whose comparison_key is
//                byte-for-byte equal is Unchanged and the baseline is kept.
//                Any other key is Changed: the new state replaces the baseline
//                and the superseded one is returned in Observation::previous.
//
// Equality is std::string operator== on comparison_key and nothing else.
// Positions, aggregate P&L and capture time never influence the decision.
//
// Failed fetches never reach the detector, so they cannot move or corrupt the
// baseline.
//
// Thread model: poll thread only. Not internally synchronised; MonitorEngine
// serialises iterations, which is what makes the swap race-free.
// -----------------------------------------------------------------------------
class ChangeDetector {
 public:
  enum class Decision { Baseline, Unchanged, Changed };

  struct Observation {
    Decision decision{Decision::Baseline};
    // Superseded baseline; set only when decision == Changed.
    std::optional<domain::NormalizedState> previous;
  };

  // Feeds one normalized state. See class comment for the transitions.
  Observation observe(domain::NormalizedState state);

  bool hasBaseline() const { return baseline_.has_value(); }

  // Current baseline, std::nullopt before the first observation.
  const std::optional<domain::NormalizedState>& baseline() const {
    return baseline_;
  }

  // Back to NO_BASELINE.
  void reset() { baseline_.reset(); }

 private:
  std::optional<domain::NormalizedState> baseline_;
};

}  // namespace posmon
