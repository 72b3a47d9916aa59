#include "posmon/persist/log_record.hpp"
#include "posmon/time/time_utils.hpp"

#include <nlohmann/json.hpp>

namespace posmon {

namespace {

constexpr const char* kNoPositions = "(no positions recognised)";

std::string quoted(const std::string& value) {
  return nlohmann::json(value).dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

LogRecord makeLogRecord(const ChangeEvent& event, const std::string& model) {
  LogRecord record;
  record.timestamp = formatIso8601Utc(timestamp_to_ms(event.detected_at));
  record.model = model;
  record.active_positions = event.current.degraded()
                                ? kNoPositions
                                : event.current.comparison_key;
  return record;
}

// dump() has no separator option, so the object is assembled field by field
// to get ", " and ": " between tokens.
std::string toJsonLine(const LogRecord& record) {
  std::string line = "{";
  line += "\"timestamp\": " + quoted(record.timestamp);
  line += ", \"model\": " + quoted(record.model);
  line += ", \"active_positions\": " + quoted(record.active_positions);
  line += "}";
  return line;
}

}  // namespace posmon
