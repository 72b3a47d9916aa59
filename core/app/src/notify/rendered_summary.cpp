#include "posmon/notify/rendered_summary.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace posmon {

namespace {

const std::string kRule(50, '=');

}  // namespace

std::string formatSigned(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%+.2f", value);
  return buf;
}

std::string formatPnl(const std::optional<double>& value) {
  if (!value) {
    return "N/A";
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%c$%.2f", *value < 0 ? '-' : '+',
                std::fabs(*value));
  return buf;
}

// -----------------------------------------------------------------------------
// renderSummary()
// -----------------------------------------------------------------------------
RenderedSummary renderSummary(const ChangeEvent& event,
                              const std::string& model) {
  RenderedSummary summary;
  summary.model = model;
  summary.title = model.empty() ? "Positions Updated"
                                : model + " Positions Updated";
  summary.pnl_delta = event.pnl_delta;
  summary.detected_at = event.detected_at;
  summary.headline = event.pnl_delta
                         ? "Δ Unrealized P&L: " + formatSigned(*event.pnl_delta)
                         : "Active positions changed";

  double total = 0.0;
  bool any_pnl = false;

  for (const auto& p : event.current.positions) {
    SummaryRow row;
    row.symbol = p.symbol;
    row.side = domain::sideToString(p.side);
    row.leverage = p.leverage.value_or("");
    row.entry = p.entry_price ? "$" + *p.entry_price : "";
    row.pnl = p.unrealized_pnl;
    row.pnl_text = formatPnl(p.unrealized_pnl);
    if (p.unrealized_pnl) {
      total += *p.unrealized_pnl;
      any_pnl = true;
    }
    summary.rows.push_back(std::move(row));
  }

  std::stable_sort(summary.rows.begin(), summary.rows.end(),
                   [](const SummaryRow& a, const SummaryRow& b) {
                     if (a.pnl && b.pnl) return *a.pnl > *b.pnl;
                     return a.pnl.has_value() && !b.pnl.has_value();
                   });

  if (any_pnl) {
    summary.total = total;
  }
  return summary;
}

// -----------------------------------------------------------------------------
// detailsTable()
// -----------------------------------------------------------------------------
std::string RenderedSummary::detailsTable() const {
  std::ostringstream out;
  out << "Current Positions:\n";

  if (rows.empty()) {
    out << "Unable to parse positions\n";
    return out.str();
  }

  out << kRule << '\n'
      << std::left << std::setw(10) << "Symbol" << ' ' << std::setw(8)
      << "Side" << ' ' << std::setw(10) << "Leverage" << ' ' << std::setw(15)
      << "Entry Price" << ' ' << "P&L" << '\n'
      << kRule << '\n';

  for (const auto& r : rows) {
    out << std::left << std::setw(10) << r.symbol << ' ' << std::setw(8)
        << r.side << ' ' << std::setw(10) << r.leverage << ' '
        << std::setw(15) << (r.entry.empty() ? "N/A" : r.entry) << ' '
        << r.pnl_text << '\n';
  }

  out << kRule << '\n';
  if (total) {
    out << "Total P&L: " << formatSigned(*total) << '\n';
  }
  return out.str();
}

}  // namespace posmon
