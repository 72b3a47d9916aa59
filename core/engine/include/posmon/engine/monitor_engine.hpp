#pragma once

#include "posmon/detect/change_detector.hpp"
#include "posmon/domain/monitor_config.hpp"
#include "posmon/eventbus/event_bus.hpp"
#include "posmon/normalize/state_normalizer.hpp"
#include "posmon/notify/notification_dispatcher.hpp"
#include "posmon/notify/sinks.hpp"
#include "posmon/persist/persistence_writer.hpp"
#include "posmon/source/i_page_source.hpp"
#include "posmon/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// MonitorEngine
// -----------------------------------------------------------------------------
//
// @brief  The poll loop: fetch → normalize → detect → (notify + persist).
//
// @details
// One iteration (runOnce):
//
//   1. source.fetch()
//        FetchError → FetchFailureEvent, baseline untouched, FetchFailed.
//   2. StateNormalizer::normalize()
//        never fails; a degraded state is compared like any other.
//   3. ChangeDetector::observe()
//        Baseline   first state accepted. BaselineEvent. The initial snapshot
//                   image is saved (debug_positions_full.png when degraded).
//                   No log line, no sink.
//        Unchanged  HeartbeatEvent.
//        Changed    ChangeEvent with pnl_delta from pnlDelta(). Then:
//                     a. RenderedSummary built once,
//                     b. dispatcher.submit() (sinks start on their workers),
//                     c. image captured and PersistenceWriter run here on the
//                        poll thread while the sinks work,
//                     d. dispatcher.collect() waits ≤ sink_timeout,
//                     e. every failed sink / persistence target becomes a
//                        SinkFailureEvent / PersistenceFailureEvent.
//
// Loop (run):
//   After a successful iteration the loop sleeps poll_interval; after a
//   failed fetch it sleeps retry_cooldown. Sleeps start only once the
//   iteration has finished, so iterations never overlap and missed ticks are
//   not queued. Retries are unbounded unless max_startup_attempts > 0, in
//   which case that many consecutive failures before any baseline make run()
//   return StartupFailed. Once a baseline exists, failures are retried
//   forever.
//
// Stop:
//   stop() is a single lock-free atomic store, safe from a signal handler.
//   Sleeps are taken in 100 ms slices and re-check the flag; an iteration in
//   progress always completes (no torn log line, no half-written file).
//
// Ownership:
//   MonitorEngine
//    ├── source_       (IPageSource&, non-owning; must outlive the engine)
//    ├── clock_        (const ITimeProvider&, non-owning)
//    ├── config_       (MonitorConfig, by value)
//    ├── normalizer_   (StateNormalizer)
//    ├── detector_     (ChangeDetector, owns the baseline)
//    ├── persistence_  (PersistenceWriter)
//    ├── bus_          (EventBus)
//    └── dispatcher_   (NotificationDispatcher, owns sinks + worker threads)
//
// Thread model:
//   runOnce()/run() on one thread (main's). Sink calls on dispatcher workers.
//   stop() from anywhere. Event subscribers run on the poll thread.
// -----------------------------------------------------------------------------
class MonitorEngine {
 public:
  enum class IterationResult { FetchFailed, Baseline, Unchanged, Changed };
  enum class RunResult { Stopped, StartupFailed };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  source  Page source adapter.
  // @param  clock   Stamps events, log lines and snapshot names.
  // @param  config  Scheduling, persistence and model settings.
  // @param  sinks   The sinks to drive, usually makeSinks(config, std::cout).
  //                 Worker threads start here.
  // -------------------------------------------------------------------------
  MonitorEngine(IPageSource& source, const ITimeProvider& clock,
                domain::MonitorConfig config, std::vector<Sink> sinks);

  MonitorEngine(const MonitorEngine&) = delete;
  MonitorEngine& operator=(const MonitorEngine&) = delete;
  MonitorEngine(MonitorEngine&&) = delete;
  MonitorEngine& operator=(MonitorEngine&&) = delete;

  // One full iteration. Never throws for fetch, sink or persistence failures.
  IterationResult runOnce();

  // Iterates until stop() or a startup failure.
  RunResult run();

  // Async-signal-safe.
  void stop() noexcept { stop_requested_.store(true); }

  bool stopRequested() const noexcept { return stop_requested_.load(); }

  EventBus& eventBus() { return bus_; }

  const std::optional<domain::NormalizedState>& baseline() const {
    return detector_.baseline();
  }

  const domain::MonitorConfig& config() const { return config_; }

  std::uint32_t consecutiveFetchFailures() const { return consecutive_failures_; }

 private:
  IterationResult handleBaseline(domain::NormalizedState state);
  IterationResult handleChange(domain::NormalizedState previous,
                               domain::NormalizedState current);

  // Screenshot from the source when snapshots are enabled. A FetchError is
  // published as a snapshot PersistenceFailureEvent and yields std::nullopt.
  std::optional<std::string> captureImage(const std::string& path);

  void publishFailures(const PersistenceReport& report);
  void publishFailures(const std::vector<SinkReport>& reports);

  bool giveUpOnStartup() const;

  // Sleeps `duration` in slices. Returns false if stop was requested.
  bool sleepFor(std::chrono::milliseconds duration);

  Timestamp now() const;

  IPageSource& source_;
  const ITimeProvider& clock_;
  domain::MonitorConfig config_;

  StateNormalizer normalizer_;
  ChangeDetector detector_;
  PersistenceWriter persistence_;
  EventBus bus_;
  NotificationDispatcher dispatcher_;

  std::atomic<bool> stop_requested_{false};
  std::uint32_t consecutive_failures_{0};
  std::uint64_t sequence_{0};
  bool last_degraded_{false};
};

}  // namespace posmon
