#pragma once

#include "posmon/domain/monitor_config.hpp"
#include "posmon/domain/sink_kind.hpp"
#include "posmon/notify/process_runner.hpp"
#include "posmon/notify/rendered_summary.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// SinkOutcome — what one notify() call reports
// -----------------------------------------------------------------------------
struct SinkOutcome {
  bool ok{false};
  std::string detail;
};

// Runs an external command and reports how it went. The production runners
// wrap runCommand()/launchDetached(); tests inject fakes.
using CommandRunner =
    std::function<ProcessResult(const std::vector<std::string>& argv)>;

// -----------------------------------------------------------------------------
// Sinks
// -----------------------------------------------------------------------------
//
// Four concrete types with the same shape, held in the Sink variant. No base
// class; the set is closed and chosen by configuration.
//
//   kind                       static SinkKind
//   notify(summary)            → SinkOutcome; may throw, the dispatcher
//                                converts exceptions into failures
//
// Every sink is driven from its own WorkerThread, one call at a time, so a
// sink needs no internal locking.
// -----------------------------------------------------------------------------

// notify-send -t 5000 <title> <headline>
class DesktopNotificationSink {
 public:
  static constexpr domain::SinkKind kind = domain::SinkKind::DesktopNotification;

  explicit DesktopNotificationSink(CommandRunner run);

  SinkOutcome notify(const RenderedSummary& summary);

  std::vector<std::string> command(const RenderedSummary& summary) const;

 private:
  CommandRunner run_;
};

// aplay -q <sound_file>
class AudibleAlertSink {
 public:
  static constexpr domain::SinkKind kind = domain::SinkKind::AudibleAlert;

  AudibleAlertSink(std::string sound_file, CommandRunner run);

  SinkOutcome notify(const RenderedSummary& summary);

  std::vector<std::string> command() const;

 private:
  std::string sound_file_;
  CommandRunner run_;
};

// zenity --info with the fixed-width details table. Launched detached: the
// outcome reflects the launch, not the dismissal.
class ModalPopupSink {
 public:
  static constexpr domain::SinkKind kind = domain::SinkKind::ModalPopup;

  explicit ModalPopupSink(CommandRunner launch);

  SinkOutcome notify(const RenderedSummary& summary);

  std::vector<std::string> command(const RenderedSummary& summary) const;

 private:
  CommandRunner launch_;
};

// ANSI-coloured table on a terminal stream (std::cout in production).
class VisualTableSink {
 public:
  static constexpr domain::SinkKind kind = domain::SinkKind::VisualTable;

  // `out` must outlive the sink.
  explicit VisualTableSink(std::ostream& out);

  SinkOutcome notify(const RenderedSummary& summary);

  // The exact text notify() writes. Exposed for tests.
  static std::string render(const RenderedSummary& summary);

 private:
  std::ostream& out_;
};

using Sink = std::variant<DesktopNotificationSink, AudibleAlertSink,
                          ModalPopupSink, VisualTableSink>;

domain::SinkKind sinkKindOf(const Sink& sink);

// Dispatches to the held alternative's notify().
SinkOutcome notifySink(Sink& sink, const RenderedSummary& summary);

// -----------------------------------------------------------------------------
// makeSink(kind, config, table_out)
// -----------------------------------------------------------------------------
// Production wiring: command sinks get runners bound to runCommand() with
// config.sink_timeout as the process deadline (the popup gets
// launchDetached()). The visual table writes to `table_out`.
// -----------------------------------------------------------------------------
Sink makeSink(domain::SinkKind kind, const domain::MonitorConfig& config,
              std::ostream& table_out);

// One sink per config.effectiveSinks() entry, in that order.
std::vector<Sink> makeSinks(const domain::MonitorConfig& config,
                            std::ostream& table_out);

// Escapes & < > for Pango markup (zenity --text).
std::string escapeMarkup(const std::string& text);

}  // namespace posmon
