#include "posmon/report/console_reporter.hpp"
#include "posmon/notify/rendered_summary.hpp"
#include "posmon/persist/log_record.hpp"
#include "posmon/time/time_utils.hpp"

#include <type_traits>

namespace posmon {

namespace {

const std::string kBannerRule(60, '=');

std::string payloadLine(const domain::NormalizedState& state, Timestamp when,
                        const std::string& model) {
  LogRecord record;
  record.timestamp = formatIso8601Utc(timestamp_to_ms(when));
  record.model = model;
  record.active_positions = state.comparison_key;
  return toJsonLine(record);
}

std::string seconds(std::int64_t ms) {
  if (ms % 1000 == 0) {
    return std::to_string(ms / 1000) + "s";
  }
  return std::to_string(ms) + "ms";
}

}  // namespace

ConsoleReporter::ConsoleReporter(EventBus& bus, std::string model_name,
                                 std::ostream& out, std::ostream& err)
    : bus_(bus),
      subscription_(0),
      model_name_(std::move(model_name)),
      out_(out),
      err_(err) {
  subscription_ = bus_.subscribe([this](const Event& e) { onEvent(e); });
}

ConsoleReporter::~ConsoleReporter() { bus_.unsubscribe(subscription_); }

// -----------------------------------------------------------------------------
// onEvent()
// -----------------------------------------------------------------------------
void ConsoleReporter::onEvent(const Event& event) {
  std::visit(
      [this](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, BaselineEvent>) {
          out_ << "Initialized. Baseline has " << e.state.positions.size()
               << " position(s).\n"
               << payloadLine(e.state, e.timestamp, model_name_) << '\n';
          if (e.state.degraded()) {
            err_ << "[StateNormalizer] warning: no position blocks recognised "
                    "on first load; the page layout may have changed\n";
          }
        } else if constexpr (std::is_same_v<T, ChangeEvent>) {
          out_ << "⚡ Positions updated!";
          if (e.pnl_delta) {
            out_ << " (Δ Unrealized P&L: " << formatSigned(*e.pnl_delta)
                 << ")";
          }
          out_ << '\n'
               << payloadLine(e.current, e.detected_at, model_name_) << '\n';
        } else if constexpr (std::is_same_v<T, HeartbeatEvent>) {
          out_ << "no change\n";
        } else if constexpr (std::is_same_v<T, FetchFailureEvent>) {
          err_ << "[MonitorEngine] fetch failed (" << e.consecutive
               << (e.consecutive == 1 ? " attempt" : " attempts")
               << (e.transient ? "" : ", non-transient") << "): " << e.reason
               << (e.retry_in_ms > 0 ? "; retrying in " + seconds(e.retry_in_ms)
                                     : std::string("; giving up"))
               << '\n';
        } else if constexpr (std::is_same_v<T, SinkFailureEvent>) {
          err_ << "[NotificationDispatcher] sink " << domain::sinkKindName(e.sink)
               << (e.timed_out ? " timed out: " : " failed: ") << e.detail
               << '\n';
        } else if constexpr (std::is_same_v<T, PersistenceFailureEvent>) {
          err_ << "[PersistenceWriter] " << e.target << " write to " << e.path
               << " failed: " << e.error << '\n';
        }
      },
      event);
  out_.flush();
}

// -----------------------------------------------------------------------------
// printBanner()
// -----------------------------------------------------------------------------
void ConsoleReporter::printBanner(std::ostream& out,
                                  const domain::MonitorConfig& config,
                                  const std::string& source_description) {
  out << kBannerRule << '\n'
      << "Positions Monitor Started: " << config.model_name << '\n'
      << kBannerRule << '\n'
      << "Target URL:  " << config.target_url << '\n'
      << "Source:      " << source_description << '\n'
      << "Log file:    " << config.log_path << '\n'
      << "Snapshots:   "
      << (config.write_snapshots ? config.snapshot_dir : "disabled") << '\n'
      << "Latest view: "
      << (config.write_latest_view ? config.latest_view_path : "disabled")
      << '\n'
      << "Interval:    " << config.poll_interval.count() << " ms (retry after "
      << config.retry_cooldown.count() << " ms)\n"
      << "Sinks:       ";

  const auto sinks = config.effectiveSinks();
  for (std::size_t i = 0; i < sinks.size(); ++i) {
    out << (i ? ", " : "") << domain::sinkKindName(sinks[i]);
  }
  if (config.enabled_sinks.empty()) {
    out << " (default)";
  }
  out << '\n' << kBannerRule << "\n\n";
  out.flush();
}

}  // namespace posmon
