#pragma once

#include "posmon/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish/subscribe channel for the monitor's
// observable outcomes (baseline, change, heartbeat and the three failure
// kinds). MonitorEngine publishes; ConsoleReporter renders; tests record.
//
// Thread model: subscribe/unsubscribe/publish are safe from any thread.
// Callbacks run on the publishing thread (the poll thread in practice), after
// the subscriber list has been copied and the lock released, so a callback may
// itself subscribe or unsubscribe.
//
// A callback that throws is reported on std::cerr and skipped; the remaining
// subscribers still run. Observers must never be able to stop the poll loop.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType, e.g. subscribe<ChangeEvent>(...).
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Typed subscribe: filter the variant with std::get_if
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace posmon
