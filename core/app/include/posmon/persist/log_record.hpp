#pragma once

#include "posmon/events/event_types.hpp"

#include <string>

namespace posmon {

// -----------------------------------------------------------------------------
// LogRecord — one line of the durable change log
// -----------------------------------------------------------------------------
// Serialized as a single-line JSON object with keys in exactly this order:
//
//   {"timestamp": "2025-10-09T08:53:20Z", "model": "DEEPSEEK CHAT V3.1", "active_positions": "..."}
//
// with ", " and ": " separators, the shape existing positions-log.txt readers
// parse. active_positions is the new state's comparison key, or
// "(no positions recognised)" when the state is degraded.
// -----------------------------------------------------------------------------
struct LogRecord {
  std::string timestamp;
  std::string model;
  std::string active_positions;
};

LogRecord makeLogRecord(const ChangeEvent& event, const std::string& model);

// JSON text without the trailing newline. Non-ASCII is written as UTF-8, not
// \u-escaped; invalid UTF-8 bytes are replaced with U+FFFD instead of
// throwing.
std::string toJsonLine(const LogRecord& record);

}  // namespace posmon
