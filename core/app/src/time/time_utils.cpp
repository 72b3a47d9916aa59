#include "posmon/time/time_utils.hpp"

#include <ctime>

namespace posmon {

namespace {

// Splits epoch milliseconds into a broken-down UTC calendar time. Negative
// inputs floor towards the earlier second so pre-1970 values still format.
std::tm toUtcTm(std::int64_t epoch_ms) {
  std::int64_t seconds = epoch_ms / 1000;
  if (epoch_ms < 0 && epoch_ms % 1000 != 0) {
    --seconds;
  }
  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

std::string formatTm(const std::tm& tm, const char* fmt) {
  char buf[32];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

}  // namespace

// -----------------------------------------------------------------------------
// formatIso8601Utc()
// -----------------------------------------------------------------------------
std::string formatIso8601Utc(std::int64_t epoch_ms) {
  return formatTm(toUtcTm(epoch_ms), "%Y-%m-%dT%H:%M:%SZ");
}

// -----------------------------------------------------------------------------
// formatFileStamp()
// -----------------------------------------------------------------------------
std::string formatFileStamp(std::int64_t epoch_ms) {
  return formatTm(toUtcTm(epoch_ms), "%Y%m%d_%H%M%S");
}

}  // namespace posmon
