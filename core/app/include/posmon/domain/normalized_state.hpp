#pragma once

#include "posmon/domain/position_entry.hpp"
#include "posmon/time/timestamp.hpp"

#include <optional>
#include <string>
#include <vector>

namespace posmon {
namespace domain {

// -----------------------------------------------------------------------------
// NormalizedState — canonical view of one snapshot
// -----------------------------------------------------------------------------
//
// @brief  Output of StateNormalizer; the unit the ChangeDetector compares.
//
// @details
// comparison_key is the ONLY field the detector looks at. It is built from
// the extracted position blocks (one whitespace-collapsed line per block, in
// page order), so page noise outside the blocks never changes it.
//
// A state with no positions is "degraded": the page had no recognisable
// structure. It is still a valid state and is compared like any other.
//
// aggregate_pnl is the sum of every entry's unrealized_pnl when at least one
// entry has one; otherwise it is empty.
//
// Ownership:
//   ChangeDetector owns the accepted baseline by value. Events copy it.
// -----------------------------------------------------------------------------
struct NormalizedState {
  std::string comparison_key;
  std::vector<PositionEntry> positions;
  std::optional<double> aggregate_pnl;
  Timestamp captured_at{};

  bool degraded() const { return positions.empty(); }
};

}  // namespace domain
}  // namespace posmon
