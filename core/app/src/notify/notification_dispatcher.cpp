#include "posmon/notify/notification_dispatcher.hpp"

#include <exception>

namespace posmon {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
NotificationDispatcher::NotificationDispatcher(
    std::vector<Sink> sinks, std::chrono::milliseconds timeout)
    : timeout_(timeout) {
  for (auto& sink : sinks) {
    std::string name =
        std::string("sink:") + domain::sinkKindName(sinkKindOf(sink));
    slots_.push_back(std::make_unique<Slot>(std::move(sink), std::move(name)));
    slots_.back()->worker.start();
  }
}

NotificationDispatcher::~NotificationDispatcher() {
  for (auto& slot : slots_) {
    slot->worker.stop();
  }
}

// -----------------------------------------------------------------------------
// submit()
// -----------------------------------------------------------------------------
// The summary is copied once into a shared_ptr so every worker reads the same
// immutable object, and so it outlives a sink that is still running after
// collect() gave up on it.
// -----------------------------------------------------------------------------
NotificationDispatcher::Pending NotificationDispatcher::submit(
    const RenderedSummary& summary) {
  auto shared = std::make_shared<const RenderedSummary>(summary);

  Pending pending;
  pending.deadline = std::chrono::steady_clock::now() + timeout_;

  for (auto& slot_ptr : slots_) {
    Slot* slot = slot_ptr.get();
    const domain::SinkKind kind = sinkKindOf(slot->sink);

    auto promise = std::make_shared<std::promise<SinkReport>>();
    pending.results.emplace_back(kind, promise->get_future());

    bool queued = slot->worker.post([slot, kind, shared, promise] {
      SinkReport report;
      report.sink = kind;
      try {
        SinkOutcome outcome = notifySink(slot->sink, *shared);
        report.ok = outcome.ok;
        report.detail = std::move(outcome.detail);
      } catch (const std::exception& e) {
        report.ok = false;
        report.detail = std::string("threw: ") + e.what();
      } catch (...) {
        report.ok = false;
        report.detail = "threw a non-standard exception";
      }
      promise->set_value(std::move(report));
    });

    if (!queued) {
      SinkReport report;
      report.sink = kind;
      report.detail = "sink worker is stopped";
      promise->set_value(std::move(report));
    }
  }
  return pending;
}

// -----------------------------------------------------------------------------
// collect()
// -----------------------------------------------------------------------------
std::vector<SinkReport> NotificationDispatcher::collect(Pending& pending) {
  std::vector<SinkReport> reports;
  reports.reserve(pending.results.size());

  for (auto& [kind, future] : pending.results) {
    if (future.wait_until(pending.deadline) == std::future_status::ready) {
      reports.push_back(future.get());
      continue;
    }
    SinkReport report;
    report.sink = kind;
    report.timed_out = true;
    report.detail = "no result within " + std::to_string(timeout_.count()) +
                    " ms";
    reports.push_back(std::move(report));
  }
  pending.results.clear();
  return reports;
}

std::vector<SinkReport> NotificationDispatcher::dispatch(
    const RenderedSummary& summary) {
  auto pending = submit(summary);
  return collect(pending);
}

std::vector<domain::SinkKind> NotificationDispatcher::kinds() const {
  std::vector<domain::SinkKind> out;
  out.reserve(slots_.size());
  for (const auto& slot : slots_) {
    out.push_back(sinkKindOf(slot->sink));
  }
  return out;
}

}  // namespace posmon
