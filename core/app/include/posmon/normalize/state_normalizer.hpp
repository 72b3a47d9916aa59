#pragma once

#include "posmon/domain/normalized_state.hpp"
#include "posmon/domain/position_entry.hpp"
#include "posmon/source/i_page_source.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// StateNormalizer
// -----------------------------------------------------------------------------
//
// @brief  Turns a RawSnapshot into a NormalizedState: position entries, an
//         aggregate P&L and the canonical comparison key.
//
// @details
// Block detection:
//   The watched page prints one "Entry Time: HH:MM:SS" line per position.
//   When that marker is present the text is split on it and every segment
//   AFTER a marker is a candidate block (text before the first marker is page
//   chrome). Inside a segment only lines carrying a recognised field
//   (symbol, side, leverage, entry price, quantity, P&L) are kept, so a
//   footer after the last position never joins its block. Without markers, every non-empty line is a candidate block, which
//   covers compact renderings such as "ETH short 2.4 (pnl 10.0)".
//
// Per block (all matching is case-insensitive):
//   symbol       first whole-word hit from the known-symbol list. REQUIRED:
//                a block without one is not a position and is dropped.
//   side         "Side: LONG|SHORT", else a bare LONG/SHORT word, else Unknown.
//   leverage     "Leverage: 20X", else a bare "20x" token → "20X".
//   entry_price  "Entry Price: $4,123.5" → "4,123.5".
//   pnl          "Unrealized P&L: -$12.34", "P&L +$5", "pnl 10.0" → signed
//                double. The sign may sit before or after the '$'.
//
// Comparison key:
//   One line per accepted block, in page order, with every whitespace run
//   collapsed to a single space and the ends trimmed; lines joined by '\n'.
//   Noise outside accepted blocks (render timestamps, banners, headers) never
//   reaches the key. A degraded state has an empty key.
//
// Failure model:
//   normalize() never throws for content reasons. Unrecognised content yields
//   a degraded state (no positions, no aggregate).
//
// Thread model:
//   Immutable after construction; normalize() is const and may be called
//   from any thread. The compiled std::regex objects are shared read-only.
// -----------------------------------------------------------------------------
class StateNormalizer {
 public:
  StateNormalizer();

  // -------------------------------------------------------------------------
  // normalize(snapshot)
  // -------------------------------------------------------------------------
  // @brief  Pure function of the snapshot: the same input always yields the
  //         same key, positions and aggregate. captured_at is copied through.
  // -------------------------------------------------------------------------
  domain::NormalizedState normalize(const RawSnapshot& snapshot) const;

  // Collapses whitespace runs to one space and trims. Exposed for tests.
  static std::string collapseWhitespace(const std::string& text);

  // Parses "1,234.56" (thousands separators allowed) with an explicit sign.
  // Returns std::nullopt when the digits do not form a number.
  static std::optional<double> parseAmount(const std::string& sign,
                                           const std::string& digits);

 private:
  std::vector<std::string> splitBlocks(const std::string& text) const;

  std::string fieldLines(const std::string& block) const;
  bool isFieldLine(const std::string& line) const;

  std::optional<domain::PositionEntry> parseBlock(
      const std::string& block) const;

  std::regex entry_time_re_;
  std::regex symbol_re_;
  std::regex side_labeled_re_;
  std::regex side_bare_re_;
  std::regex leverage_labeled_re_;
  std::regex leverage_bare_re_;
  std::regex entry_price_re_;
  std::regex pnl_re_;
  std::regex quantity_re_;
};

}  // namespace posmon
