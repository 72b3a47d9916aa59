#pragma once

#include "posmon/domain/monitor_config.hpp"
#include "posmon/eventbus/event_bus.hpp"

#include <iostream>
#include <ostream>
#include <string>

namespace posmon {

// -----------------------------------------------------------------------------
// ConsoleReporter
// -----------------------------------------------------------------------------
// Responsibility: Terminal view of the monitor. Subscribes to the EventBus on
// construction and unsubscribes on destruction.
//
//   BaselineEvent            "Initialized." + the initial JSON payload on out;
//                            a warning on err when the baseline is degraded
//   ChangeEvent              "⚡ Positions updated! (Δ ...)" + JSON payload
//   HeartbeatEvent           "no change"
//   FetchFailureEvent        retry notice on err
//   SinkFailureEvent         sink name and detail on err
//   PersistenceFailureEvent  target, path and error on err
//
// Thread model: callbacks run on the publishing (poll) thread.
// -----------------------------------------------------------------------------
class ConsoleReporter {
 public:
  ConsoleReporter(EventBus& bus, std::string model_name,
                  std::ostream& out = std::cout,
                  std::ostream& err = std::cerr);
  ~ConsoleReporter();

  ConsoleReporter(const ConsoleReporter&) = delete;
  ConsoleReporter& operator=(const ConsoleReporter&) = delete;

  // Startup banner: target, log path, snapshot directory, source, sinks.
  static void printBanner(std::ostream& out,
                          const domain::MonitorConfig& config,
                          const std::string& source_description);

 private:
  void onEvent(const Event& event);

  EventBus& bus_;
  EventBus::SubscriptionId subscription_;
  std::string model_name_;
  std::ostream& out_;
  std::ostream& err_;
};

}  // namespace posmon
