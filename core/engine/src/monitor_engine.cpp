#include "posmon/engine/monitor_engine.hpp"
#include "posmon/detect/metric_differ.hpp"
#include "posmon/notify/rendered_summary.hpp"
#include "posmon/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace posmon {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(100);

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
MonitorEngine::MonitorEngine(IPageSource& source, const ITimeProvider& clock,
                             domain::MonitorConfig config,
                             std::vector<Sink> sinks)
    : source_(source),
      clock_(clock),
      config_(std::move(config)),
      persistence_(config_),
      dispatcher_(std::move(sinks), config_.sink_timeout) {}

Timestamp MonitorEngine::now() const { return ms_to_timestamp(clock_.now_ms()); }

// -----------------------------------------------------------------------------
// runOnce()
// -----------------------------------------------------------------------------
MonitorEngine::IterationResult MonitorEngine::runOnce() {
  ++sequence_;

  RawSnapshot snapshot;
  try {
    snapshot = source_.fetch();
  } catch (const FetchError& e) {
    ++consecutive_failures_;

    FetchFailureEvent failure;
    failure.reason = e.what();
    failure.transient = e.transient();
    failure.consecutive = consecutive_failures_;
    failure.retry_in_ms = giveUpOnStartup() ? 0 : config_.retry_cooldown.count();
    failure.timestamp = now();
    failure.sequence_id = sequence_;
    bus_.publish(failure);
    return IterationResult::FetchFailed;
  }
  consecutive_failures_ = 0;

  domain::NormalizedState state = normalizer_.normalize(snapshot);

  if (state.degraded() && !last_degraded_ && detector_.hasBaseline()) {
    std::cerr << "[StateNormalizer] warning: no position blocks recognised; "
                 "comparing the empty state\n";
  }
  last_degraded_ = state.degraded();

  ChangeDetector::Observation obs = detector_.observe(state);

  switch (obs.decision) {
    case ChangeDetector::Decision::Baseline:
      return handleBaseline(std::move(state));

    case ChangeDetector::Decision::Unchanged: {
      HeartbeatEvent heartbeat;
      heartbeat.position_count = state.positions.size();
      heartbeat.timestamp = now();
      heartbeat.sequence_id = sequence_;
      bus_.publish(heartbeat);
      return IterationResult::Unchanged;
    }

    case ChangeDetector::Decision::Changed:
      return handleChange(std::move(*obs.previous), std::move(state));
  }
  return IterationResult::Unchanged;
}

// -----------------------------------------------------------------------------
// handleBaseline(): announce, save the initial image, nothing else
// -----------------------------------------------------------------------------
MonitorEngine::IterationResult MonitorEngine::handleBaseline(
    domain::NormalizedState state) {
  BaselineEvent event;
  event.state = std::move(state);
  event.timestamp = now();
  event.sequence_id = sequence_;
  bus_.publish(event);

  auto image = captureImage(config_.snapshot_dir);
  publishFailures(persistence_.persistBaseline(event, image));
  return IterationResult::Baseline;
}

// -----------------------------------------------------------------------------
// handleChange(): dispatch and persist concurrently
// -----------------------------------------------------------------------------
MonitorEngine::IterationResult MonitorEngine::handleChange(
    domain::NormalizedState previous, domain::NormalizedState current) {
  ChangeEvent event;
  event.pnl_delta = pnlDelta(previous.aggregate_pnl, current.aggregate_pnl);
  event.previous = std::move(previous);
  event.current = std::move(current);
  event.detected_at = now();
  event.sequence_id = sequence_;
  bus_.publish(event);

  const RenderedSummary summary = renderSummary(event, config_.model_name);
  auto pending = dispatcher_.submit(summary);

  auto image = captureImage(
      persistence_.snapshotPath(timestamp_to_ms(event.detected_at)));
  PersistenceReport persisted = persistence_.persistChange(event, image);

  std::vector<SinkReport> sink_reports = dispatcher_.collect(pending);

  publishFailures(persisted);
  publishFailures(sink_reports);
  return IterationResult::Changed;
}

// -----------------------------------------------------------------------------
// captureImage()
// -----------------------------------------------------------------------------
std::optional<std::string> MonitorEngine::captureImage(const std::string& path) {
  if (!config_.write_snapshots) {
    return std::nullopt;
  }
  try {
    return source_.captureImage();
  } catch (const FetchError& e) {
    PersistenceFailureEvent failure;
    failure.target = "snapshot";
    failure.path = path;
    failure.error = std::string("image capture failed: ") + e.what();
    failure.timestamp = now();
    failure.sequence_id = sequence_;
    bus_.publish(failure);
    return std::nullopt;
  }
}

void MonitorEngine::publishFailures(const PersistenceReport& report) {
  for (const auto& r : report.results) {
    if (r.ok) {
      continue;
    }
    PersistenceFailureEvent failure;
    failure.target = r.target;
    failure.path = r.path;
    failure.error = r.error;
    failure.timestamp = now();
    failure.sequence_id = sequence_;
    bus_.publish(failure);
  }
}

void MonitorEngine::publishFailures(const std::vector<SinkReport>& reports) {
  for (const auto& r : reports) {
    if (r.ok) {
      continue;
    }
    SinkFailureEvent failure;
    failure.sink = r.sink;
    failure.timed_out = r.timed_out;
    failure.detail = r.detail;
    failure.timestamp = now();
    failure.sequence_id = sequence_;
    bus_.publish(failure);
  }
}

bool MonitorEngine::giveUpOnStartup() const {
  return !detector_.hasBaseline() && config_.max_startup_attempts > 0 &&
         consecutive_failures_ >= config_.max_startup_attempts;
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
MonitorEngine::RunResult MonitorEngine::run() {
  while (!stopRequested()) {
    IterationResult result = runOnce();

    if (result == IterationResult::FetchFailed) {
      if (giveUpOnStartup()) {
        std::cerr << "[MonitorEngine] no successful fetch from "
                  << source_.describe() << " after " << consecutive_failures_
                  << " attempt(s); giving up\n";
        return RunResult::StartupFailed;
      }
      if (!sleepFor(config_.retry_cooldown)) {
        break;
      }
      continue;
    }

    if (!sleepFor(config_.poll_interval)) {
      break;
    }
  }

  std::cout << "[MonitorEngine] Stopped.\n";
  return RunResult::Stopped;
}

// -----------------------------------------------------------------------------
// sleepFor(): sliced so stop() is noticed within ~100 ms
// -----------------------------------------------------------------------------
bool MonitorEngine::sleepFor(std::chrono::milliseconds duration) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  for (;;) {
    if (stopRequested()) {
      return false;
    }
    const auto remaining = deadline - std::chrono::steady_clock::now();
    if (remaining <= std::chrono::steady_clock::duration::zero()) {
      return true;
    }
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(remaining, kSleepSlice));
  }
}

}  // namespace posmon
