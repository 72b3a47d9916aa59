#include "posmon/notify/sinks.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace posmon {

namespace {

constexpr const char* kGreen = "\033[32m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kBoldCyan = "\033[1;36m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kReset = "\033[0m";

SinkOutcome fromProcess(const ProcessResult& r) {
  return SinkOutcome{r.ok(), r.describe()};
}

const char* pnlColour(const std::optional<double>& pnl) {
  if (!pnl) return "";
  return *pnl >= 0 ? kGreen : kRed;
}

}  // namespace

// -----------------------------------------------------------------------------
// DesktopNotificationSink
// -----------------------------------------------------------------------------
DesktopNotificationSink::DesktopNotificationSink(CommandRunner run)
    : run_(std::move(run)) {}

std::vector<std::string> DesktopNotificationSink::command(
    const RenderedSummary& summary) const {
  return {"notify-send", "-t", "5000", summary.title, summary.headline};
}

SinkOutcome DesktopNotificationSink::notify(const RenderedSummary& summary) {
  return fromProcess(run_(command(summary)));
}

// -----------------------------------------------------------------------------
// AudibleAlertSink
// -----------------------------------------------------------------------------
AudibleAlertSink::AudibleAlertSink(std::string sound_file, CommandRunner run)
    : sound_file_(std::move(sound_file)), run_(std::move(run)) {}

std::vector<std::string> AudibleAlertSink::command() const {
  return {"aplay", "-q", sound_file_};
}

SinkOutcome AudibleAlertSink::notify(const RenderedSummary&) {
  return fromProcess(run_(command()));
}

// -----------------------------------------------------------------------------
// ModalPopupSink
// -----------------------------------------------------------------------------
ModalPopupSink::ModalPopupSink(CommandRunner launch)
    : launch_(std::move(launch)) {}

std::vector<std::string> ModalPopupSink::command(
    const RenderedSummary& summary) const {
  std::string text = "<b>" + escapeMarkup(summary.headline) + "</b>\n\n<tt>" +
                     escapeMarkup(summary.detailsTable()) + "</tt>";
  return {"zenity", "--info", "--title=" + summary.title, "--text=" + text,
          "--width=650", "--height=450"};
}

SinkOutcome ModalPopupSink::notify(const RenderedSummary& summary) {
  return fromProcess(launch_(command(summary)));
}

// -----------------------------------------------------------------------------
// VisualTableSink
// -----------------------------------------------------------------------------
VisualTableSink::VisualTableSink(std::ostream& out) : out_(out) {}

std::string VisualTableSink::render(const RenderedSummary& summary) {
  std::ostringstream t;
  t << '\n' << kBoldCyan << "⚡ " << summary.title << kReset << "\n\n";

  if (summary.rows.empty()) {
    t << "(no positions recognised)\n\n";
    return t.str();
  }

  t << kBold << std::left << std::setw(8) << "Symbol" << std::setw(8)
    << "Side" << std::setw(10) << "Leverage" << std::right << std::setw(16)
    << "Entry Price" << std::setw(18) << "Unrealized P&L" << kReset << '\n';
  t << std::string(60, '-') << '\n';

  for (const auto& r : summary.rows) {
    t << std::left << std::setw(8) << r.symbol << std::setw(8) << r.side
      << std::setw(10) << r.leverage << std::right << std::setw(16) << r.entry
      << pnlColour(r.pnl) << std::setw(18) << r.pnl_text
      << (r.pnl ? kReset : "") << '\n';
  }

  if (summary.total) {
    t << std::string(60, '-') << '\n';
    t << kBold << std::left << std::setw(42) << "TOTAL" << kReset
      << pnlColour(summary.total) << kBold << std::right << std::setw(18)
      << formatSigned(*summary.total) << kReset << '\n';
  }
  t << '\n';
  return t.str();
}

SinkOutcome VisualTableSink::notify(const RenderedSummary& summary) {
  // One insertion so lines from other threads cannot land inside the table.
  out_ << render(summary) << std::flush;
  if (!out_) {
    return SinkOutcome{false, "terminal stream in failed state"};
  }
  return SinkOutcome{true, "ok"};
}

// -----------------------------------------------------------------------------
// Variant helpers
// -----------------------------------------------------------------------------
domain::SinkKind sinkKindOf(const Sink& sink) {
  return std::visit([](const auto& s) { return s.kind; }, sink);
}

SinkOutcome notifySink(Sink& sink, const RenderedSummary& summary) {
  return std::visit([&](auto& s) { return s.notify(summary); }, sink);
}

Sink makeSink(domain::SinkKind kind, const domain::MonitorConfig& config,
              std::ostream& table_out) {
  auto bounded = [timeout = config.sink_timeout](
                     const std::vector<std::string>& argv) {
    return runCommand(argv, timeout);
  };

  switch (kind) {
    case domain::SinkKind::DesktopNotification:
      return DesktopNotificationSink(bounded);
    case domain::SinkKind::AudibleAlert:
      return AudibleAlertSink(config.sound_file, bounded);
    case domain::SinkKind::ModalPopup:
      return ModalPopupSink([](const std::vector<std::string>& argv) {
        return launchDetached(argv);
      });
    case domain::SinkKind::VisualTable:
      return VisualTableSink(table_out);
  }
  return DesktopNotificationSink(bounded);
}

std::vector<Sink> makeSinks(const domain::MonitorConfig& config,
                            std::ostream& table_out) {
  std::vector<Sink> sinks;
  for (domain::SinkKind kind : config.effectiveSinks()) {
    sinks.push_back(makeSink(kind, config, table_out));
  }
  return sinks;
}

std::string escapeMarkup(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      default:  out += c;
    }
  }
  return out;
}

}  // namespace posmon
