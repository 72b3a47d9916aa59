#pragma once

#include "posmon/domain/normalized_state.hpp"
#include "posmon/domain/sink_kind.hpp"
#include "posmon/time/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace posmon {

// Every event carries the poll iteration that produced it (1-based) so the
// console and tests can correlate lines across components.

// -----------------------------------------------------------------------------
// BaselineEvent
// -----------------------------------------------------------------------------
// First successful snapshot accepted as the baseline (cold start). Not a
// change: no LogRecord is written and no sink is notified.
// -----------------------------------------------------------------------------
struct BaselineEvent {
  domain::NormalizedState state;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// ChangeEvent
// -----------------------------------------------------------------------------
// Emitted exactly once per CHANGED decision, after the baseline was replaced.
// `previous` is the superseded baseline; it is empty only if a change is ever
// built without one, which the detector never does.
// pnl_delta is empty whenever either aggregate is unknown.
// -----------------------------------------------------------------------------
struct ChangeEvent {
  std::optional<domain::NormalizedState> previous;
  domain::NormalizedState current;
  std::optional<double> pnl_delta;
  Timestamp detected_at{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// HeartbeatEvent
// -----------------------------------------------------------------------------
// UNCHANGED iteration. Liveness only, never persisted.
// -----------------------------------------------------------------------------
struct HeartbeatEvent {
  std::size_t position_count{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// FetchFailureEvent
// -----------------------------------------------------------------------------
// The source adapter threw FetchError. The loop sleeps `retry_in_ms` before
// the next attempt. `consecutive` counts failures since the last success.
// -----------------------------------------------------------------------------
struct FetchFailureEvent {
  std::string reason;
  bool transient{true};
  std::uint32_t consecutive{0};
  std::int64_t retry_in_ms{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// SinkFailureEvent
// -----------------------------------------------------------------------------
// One sink failed or timed out while handling a ChangeEvent. Other sinks and
// persistence are unaffected.
// -----------------------------------------------------------------------------
struct SinkFailureEvent {
  domain::SinkKind sink{domain::SinkKind::DesktopNotification};
  bool timed_out{false};
  std::string detail;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PersistenceFailureEvent
// -----------------------------------------------------------------------------
// One persistence target ("log", "snapshot", "latest_view") failed.
// -----------------------------------------------------------------------------
struct PersistenceFailureEvent {
  std::string target;
  std::string path;
  std::string error;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace posmon
