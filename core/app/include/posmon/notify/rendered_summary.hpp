#pragma once

#include "posmon/events/event_types.hpp"
#include "posmon/time/timestamp.hpp"

#include <optional>
#include <string>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// SummaryRow — one position, pre-formatted for display
// -----------------------------------------------------------------------------
struct SummaryRow {
  std::string symbol;
  std::string side;      // "Long", "Short" or ""
  std::string leverage;  // "20X" or ""
  std::string entry;     // "$4,123.5" or ""
  std::string pnl_text;  // "+$12.34", "-$5.00" or "N/A"
  std::optional<double> pnl;
};

// -----------------------------------------------------------------------------
// RenderedSummary
// -----------------------------------------------------------------------------
//
// @brief  Human-readable view of a ChangeEvent, built once per change and
//         shared read-only by every sink.
//
// @details
// headline   "Δ Unrealized P&L: +15.00" when the delta is known, otherwise
//            "Active positions changed". Desktop and audible sinks show this.
// rows       Sorted by P&L descending; rows with unknown P&L keep their page
//            order after all known ones.
// total      Sum of the known row P&Ls; empty when none is known.
//
// Immutable after renderSummary() returns, so worker threads read it without
// locking.
// -----------------------------------------------------------------------------
struct RenderedSummary {
  std::string title;
  std::string model;
  std::string headline;
  std::vector<SummaryRow> rows;
  std::optional<double> total;
  std::optional<double> pnl_delta;
  Timestamp detected_at{};

  // Fixed-width plain-text table used by the popup:
  //
  //   ==================================================
  //   Symbol     Side     Leverage   Entry Price     P&L
  //   ==================================================
  //   ETH        Short    20X        $4,123.5        +$25.00
  //   ==================================================
  //   Total P&L: +25.00
  std::string detailsTable() const;
};

// Builds the summary for `event`. `model` is the display name from config.
RenderedSummary renderSummary(const ChangeEvent& event,
                              const std::string& model);

// "+15.00" / "-3.50" — always signed, two decimals.
std::string formatSigned(double value);

// "+$12.34" / "-$12.34" / "N/A".
std::string formatPnl(const std::optional<double>& value);

}  // namespace posmon
