#pragma once

#include <optional>
#include <string>

namespace posmon {
namespace domain {

// -----------------------------------------------------------------------------
// Side — direction of one watched position
// -----------------------------------------------------------------------------
// Unknown is the default when the block carries no LONG/SHORT keyword. It is
// a legitimate value, not an error.
// -----------------------------------------------------------------------------
enum class Side { Long, Short, Unknown };

inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Long:    return "Long";
    case Side::Short:   return "Short";
    case Side::Unknown: return "";
  }
  return "";
}

// -----------------------------------------------------------------------------
// PositionEntry — one position block extracted from the watched page
// -----------------------------------------------------------------------------
//
// @brief  Plain value describing a single row of the ACTIVE POSITIONS display.
//
// @details
// Only `symbol` is guaranteed; every other field is best-effort and stays
// empty when the page does not show it (or shows it in a shape the
// normalizer does not recognise). Text fields are kept as the page printed
// them ("20X", "4,123.5") because they are displayed, never computed with.
// unrealized_pnl is parsed to a signed double because the engine sums it and
// diffs it.
//
// Thread model:
//   Value type. Constructed once by StateNormalizer and never mutated; events
//   carry copies across threads.
// -----------------------------------------------------------------------------
struct PositionEntry {
  std::string symbol;                      // e.g. "ETH", always upper-case
  Side side{Side::Unknown};
  std::optional<std::string> leverage;     // e.g. "20X"
  std::optional<std::string> entry_price;  // e.g. "4,123.5" (no '$')
  std::optional<double> unrealized_pnl;    // signed, e.g. -12.34
};

}  // namespace domain
}  // namespace posmon
