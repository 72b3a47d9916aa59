#pragma once

#include "posmon/concurrent/worker_thread.hpp"
#include "posmon/domain/sink_kind.hpp"
#include "posmon/notify/rendered_summary.hpp"
#include "posmon/notify/sinks.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// SinkReport — result of one sink for one ChangeEvent
// -----------------------------------------------------------------------------
struct SinkReport {
  domain::SinkKind sink{domain::SinkKind::DesktopNotification};
  bool ok{false};
  bool timed_out{false};
  std::string detail;
};

// -----------------------------------------------------------------------------
// NotificationDispatcher
// -----------------------------------------------------------------------------
//
// @brief  Fans one RenderedSummary out to every configured sink, each in its
//         own failure domain.
//
// @details
// Each sink lives in a Slot together with a dedicated WorkerThread. A
// dispatch is split in two so the caller can do other work (persistence)
// while the sinks run:
//
//   auto pending = dispatcher.submit(summary);   // returns immediately
//   ...write log / snapshot / latest view...
//   auto reports = dispatcher.collect(pending);  // waits ≤ sink_timeout
//
// Isolation:
//   - A sink that returns a failure, throws, or hangs affects only its own
//     SinkReport. Exceptions are caught on the worker and turned into
//     ok = false with the exception text.
//   - All sinks share one deadline, submit() + timeout. A sink still running
//     at the deadline is reported with timed_out = true. Its task keeps
//     running on its own worker; command sinks are additionally killed by the
//     process runner at the same timeout, so the worker frees up shortly.
//
// Reports come back in configuration order, one per sink.
//
// Thread model: submit()/collect() from the poll thread. Sinks run on their
// workers. The destructor stops and joins every worker.
// -----------------------------------------------------------------------------
class NotificationDispatcher {
 public:
  // Futures for one submit(); consumed by collect().
  struct Pending {
    std::vector<std::pair<domain::SinkKind, std::future<SinkReport>>> results;
    std::chrono::steady_clock::time_point deadline;
  };

  // Starts one worker per sink. `sinks` may be empty (nothing to notify).
  NotificationDispatcher(std::vector<Sink> sinks,
                         std::chrono::milliseconds timeout);
  ~NotificationDispatcher();

  NotificationDispatcher(const NotificationDispatcher&) = delete;
  NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

  // Queues `summary` on every sink's worker.
  Pending submit(const RenderedSummary& summary);

  // Waits until every sink reported or the shared deadline passed.
  std::vector<SinkReport> collect(Pending& pending);

  // submit() followed by collect().
  std::vector<SinkReport> dispatch(const RenderedSummary& summary);

  std::vector<domain::SinkKind> kinds() const;

 private:
  struct Slot {
    Slot(Sink s, std::string worker_name)
        : sink(std::move(s)), worker(std::move(worker_name)) {}

    Sink sink;
    // Declared after sink: destroyed (joined) first.
    WorkerThread worker;
  };

  std::vector<std::unique_ptr<Slot>> slots_;
  std::chrono::milliseconds timeout_;
};

}  // namespace posmon
