#pragma once

#include "posmon/domain/monitor_config.hpp"
#include "posmon/domain/normalized_state.hpp"
#include "posmon/events/event_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// PersistenceResult / PersistenceReport
// -----------------------------------------------------------------------------
// One result per target written for an event. target is "log", "snapshot" or
// "latest_view". A skipped target (disabled, or no image available) is
// reported with skipped = true and ok = true.
// -----------------------------------------------------------------------------
struct PersistenceResult {
  std::string target;
  bool ok{false};
  bool skipped{false};
  std::string path;
  std::string error;
};

struct PersistenceReport {
  std::vector<PersistenceResult> results;

  bool allOk() const;
  const PersistenceResult* find(const std::string& target) const;
};

// -----------------------------------------------------------------------------
// PersistenceWriter
// -----------------------------------------------------------------------------
//
// @brief  Writes the durable artifacts of a ChangeEvent (and the initial
//         snapshot of a baseline).
//
// @details
// Targets, each independent of the others:
//
//   log          <log_path>, append-only. One LogRecord line per change,
//                written in a single insertion and flushed.
//   snapshot     <snapshot_dir>/positions_YYYYmmdd_HHMMSS.png (UTC, from the
//                event time) when snapshots are enabled and an image was
//                captured.
//   latest_view  <latest_view_path>, an HTML table of the current state,
//                overwritten each time.
//
// Snapshot and latest view go through writeFileAtomically(): the bytes are
// written to "<path>.tmp" and rename(2)d over the target, so a reader (or a
// crash) never observes a half-written file. Parent directories are created
// on demand.
//
// No method throws. Every failure lands in the returned report, and one
// failed target never prevents the others from being attempted.
//
// Thread model: poll thread only. Writes nothing the sinks touch, which is
// what lets it run while the sinks are busy.
// -----------------------------------------------------------------------------
class PersistenceWriter {
 public:
  explicit PersistenceWriter(const domain::MonitorConfig& config);

  // Log line, optional snapshot image, latest view.
  PersistenceReport persistChange(const ChangeEvent& event,
                                  const std::optional<std::string>& image);

  // Cold start: only the snapshot image. A degraded baseline is saved as
  // <snapshot_dir>/debug_positions_full.png for diagnosis.
  PersistenceReport persistBaseline(const BaselineEvent& event,
                                    const std::optional<std::string>& image);

  // Path of the snapshot file for a given epoch-ms time.
  std::string snapshotPath(std::int64_t epoch_ms) const;

  // HTML document for the latest view. Exposed for tests.
  std::string renderLatestView(const domain::NormalizedState& state,
                               std::int64_t updated_ms) const;

  // temp file + rename. Returns an empty string on success, else the error.
  static std::string writeFileAtomically(const std::string& path,
                                         const std::string& bytes);

 private:
  PersistenceResult appendLog(const ChangeEvent& event);
  PersistenceResult writeImage(const std::string& path,
                               const std::optional<std::string>& image);
  PersistenceResult writeLatestView(const ChangeEvent& event);

  domain::MonitorConfig config_;
};

// &, <, >, ", ' → entities.
std::string escapeHtml(const std::string& text);

}  // namespace posmon
