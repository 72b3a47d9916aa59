#pragma once

#include "posmon/domain/sink_kind.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace posmon {
namespace domain {

// -----------------------------------------------------------------------------
// SourceKind — which page-source adapter main() constructs
// -----------------------------------------------------------------------------
enum class SourceKind {
  Renderer,  // external headless-browser renderer over ZeroMQ REQ/REP
  Http,      // direct HTTP(S) GET + HTML-to-text
};

// -----------------------------------------------------------------------------
// MonitorConfig — process-wide monitor settings
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the knobs that drive the poll loop, the
//         source adapter, the sinks and the persistence writer.
//
// @details
// Built once in main() by ConfigLoader (file → environment → flags) and then
// copied by value into MonitorEngine and the adapters. Nothing mutates it
// after startup.
//
// Durations use std::chrono::milliseconds so tests can run the real loop with
// intervals of a few milliseconds.
//
// enabled_sinks may be empty here; effectiveSinks() applies the
// "desktop notification by default" rule so callers never have to.
// -----------------------------------------------------------------------------
struct MonitorConfig {
  // --- What to watch ---------------------------------------------------------
  std::string target_url{"https://nof1.ai/models/deepseek-chat-v3.1"};
  std::string model_name{"DEEPSEEK CHAT V3.1"};
  std::string section_marker{"ACTIVE POSITIONS"};

  // --- Source adapter --------------------------------------------------------
  SourceKind source{SourceKind::Renderer};
  std::string renderer_endpoint{"tcp://127.0.0.1:5560"};
  std::chrono::milliseconds fetch_timeout{60000};

  // --- Scheduling ------------------------------------------------------------
  std::chrono::milliseconds poll_interval{10000};
  std::chrono::milliseconds retry_cooldown{30000};

  /// Consecutive failed fetches tolerated before the first baseline exists.
  /// 0 means retry forever (a long-running monitor, not a batch job).
  std::uint32_t max_startup_attempts{0};

  // --- Notification ----------------------------------------------------------
  std::vector<SinkKind> enabled_sinks;
  std::chrono::milliseconds sink_timeout{5000};
  std::string sound_file{"/usr/share/sounds/freedesktop/stereo/complete.oga"};

  // --- Persistence -----------------------------------------------------------
  std::string log_path{"positions-log.txt"};
  std::string snapshot_dir{"positions_snapshots"};
  std::string latest_view_path{"positions_latest.html"};
  bool write_snapshots{true};
  bool write_latest_view{true};

  // Sinks to actually drive: enabled_sinks, or {DesktopNotification} when the
  // operator enabled none.
  std::vector<SinkKind> effectiveSinks() const {
    if (enabled_sinks.empty()) {
      return {SinkKind::DesktopNotification};
    }
    return enabled_sinks;
  }
};

}  // namespace domain
}  // namespace posmon
