#include "posmon/normalize/state_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <initializer_list>
#include <sstream>

namespace posmon {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

// Instruments the watched dashboard trades. Whole-word, case-insensitive.
constexpr const char* kSymbolPattern =
    R"(\b(BTC|ETH|SOL|XRP|BNB|DOGE|ADA|AVAX|TON|LTC|DOT|LINK|ATOM|APE|NEAR|OP|)"
    R"(ARB|FTM|SUI|SEI|PEPE|SHIB|XLM|ETC|BCH|APT|TIA|INJ|RUNE|UNI|MATIC|POL|)"
    R"(WIF|ORDI)\b)";

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: compile every pattern once
// -----------------------------------------------------------------------------
StateNormalizer::StateNormalizer()
    : entry_time_re_(R"(Entry\s+Time:\s*\d{1,2}:\d{2}:\d{2})", kIcase),
      symbol_re_(kSymbolPattern, kIcase),
      side_labeled_re_(R"(Side:\s*(LONG|SHORT)\b)", kIcase),
      side_bare_re_(R"(\b(LONG|SHORT)\b)", kIcase),
      leverage_labeled_re_(R"(Leverage:\s*(\d+(?:\.\d+)?)\s*X\b)", kIcase),
      leverage_bare_re_(R"(\b(\d+(?:\.\d+)?)\s*X\b)", kIcase),
      entry_price_re_(R"(Entry\s+Price:\s*\$?\s*(\d[\d,]*(?:\.\d+)?))", kIcase),
      pnl_re_(R"((?:Unreali[sz]ed\s+P&L|Unreali[sz]ed|P&L|PnL)\s*:?\s*)"
              R"(([+-]?)\s*\$?\s*([+-]?)\s*(\d[\d,]*(?:\.\d+)?))",
              kIcase),
      quantity_re_(R"(Quantity:\s*\d[\d,]*(?:\.\d+)?)", kIcase) {}

// -----------------------------------------------------------------------------
// normalize()
// -----------------------------------------------------------------------------
domain::NormalizedState StateNormalizer::normalize(
    const RawSnapshot& snapshot) const {
  domain::NormalizedState state;
  state.captured_at = snapshot.captured_at;

  std::ostringstream key;
  bool any_pnl = false;
  double pnl_sum = 0.0;

  for (const auto& block : splitBlocks(snapshot.text)) {
    auto entry = parseBlock(block);
    if (!entry) {
      continue;
    }

    if (!state.positions.empty()) {
      key << '\n';
    }
    key << collapseWhitespace(block);

    if (entry->unrealized_pnl) {
      any_pnl = true;
      pnl_sum += *entry->unrealized_pnl;
    }
    state.positions.push_back(std::move(*entry));
  }

  state.comparison_key = key.str();
  if (any_pnl) {
    state.aggregate_pnl = pnl_sum;
  }
  return state;
}

// -----------------------------------------------------------------------------
// splitBlocks(): "Entry Time:" segments, or lines
// -----------------------------------------------------------------------------
std::vector<std::string> StateNormalizer::splitBlocks(
    const std::string& text) const {
  std::vector<std::string> blocks;

  if (std::regex_search(text, entry_time_re_)) {
    // Segments between markers; index 0 (before the first marker) is chrome.
    std::sregex_token_iterator it(text.begin(), text.end(), entry_time_re_, -1);
    std::sregex_token_iterator end;
    bool first = true;
    for (; it != end; ++it) {
      if (first) {
        first = false;
        continue;
      }
      blocks.push_back(fieldLines(it->str()));
    }
    return blocks;
  }

  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.find_first_not_of(" \t\r\f\v") != std::string::npos) {
      blocks.push_back(line);
    }
  }
  return blocks;
}

// -----------------------------------------------------------------------------
// fieldLines(): keep only the lines of a block that carry a position field
// -----------------------------------------------------------------------------
// The last block of a section runs to the end of the page text, so footers
// such as "Last refreshed 12:00:01" or holding-time counters would otherwise
// land in the comparison key.
// -----------------------------------------------------------------------------
std::string StateNormalizer::fieldLines(const std::string& block) const {
  std::istringstream lines(block);
  std::string line;
  std::string kept;
  while (std::getline(lines, line)) {
    if (!isFieldLine(line)) {
      continue;
    }
    if (!kept.empty()) {
      kept += '\n';
    }
    kept += line;
  }
  return kept;
}

bool StateNormalizer::isFieldLine(const std::string& line) const {
  for (const std::regex* re :
       {&symbol_re_, &side_labeled_re_, &side_bare_re_, &leverage_labeled_re_,
        &leverage_bare_re_, &entry_price_re_, &pnl_re_, &quantity_re_}) {
    if (std::regex_search(line, *re)) {
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// parseBlock(): extract one PositionEntry, or nothing if no symbol
// -----------------------------------------------------------------------------
std::optional<domain::PositionEntry> StateNormalizer::parseBlock(
    const std::string& block) const {
  std::smatch m;
  if (!std::regex_search(block, m, symbol_re_)) {
    return std::nullopt;
  }

  domain::PositionEntry entry;
  entry.symbol = toUpper(m[1].str());

  if (std::regex_search(block, m, side_labeled_re_) ||
      std::regex_search(block, m, side_bare_re_)) {
    entry.side = toUpper(m[1].str()) == "LONG" ? domain::Side::Long
                                               : domain::Side::Short;
  }

  if (std::regex_search(block, m, leverage_labeled_re_) ||
      std::regex_search(block, m, leverage_bare_re_)) {
    entry.leverage = m[1].str() + "X";
  }

  if (std::regex_search(block, m, entry_price_re_)) {
    entry.entry_price = m[1].str();
  }

  if (std::regex_search(block, m, pnl_re_)) {
    std::string sign = m[1].length() > 0 ? m[1].str() : m[2].str();
    entry.unrealized_pnl = parseAmount(sign, m[3].str());
  }

  return entry;
}

// -----------------------------------------------------------------------------
// collapseWhitespace()
// -----------------------------------------------------------------------------
std::string StateNormalizer::collapseWhitespace(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;

  for (unsigned char c : text) {
    if (std::isspace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out += ' ';
      pending_space = false;
    }
    out += static_cast<char>(c);
  }
  return out;
}

// -----------------------------------------------------------------------------
// parseAmount()
// -----------------------------------------------------------------------------
std::optional<double> StateNormalizer::parseAmount(const std::string& sign,
                                                   const std::string& digits) {
  std::string plain;
  plain.reserve(digits.size());
  std::copy_if(digits.begin(), digits.end(), std::back_inserter(plain),
               [](char c) { return c != ','; });
  if (plain.empty()) {
    return std::nullopt;
  }

  errno = 0;
  char* end = nullptr;
  double value = std::strtod(plain.c_str(), &end);
  if (end == plain.c_str() || *end != '\0' || errno == ERANGE) {
    return std::nullopt;
  }
  return sign == "-" ? -value : value;
}

}  // namespace posmon
