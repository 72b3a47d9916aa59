#pragma once

#include "posmon/domain/monitor_config.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Invalid configuration from any source: unreadable or malformed file,
// unknown key or flag, value of the wrong type or out of range. main() exits
// with status 2.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// ConfigLoader
// -----------------------------------------------------------------------------
//
// @brief  Builds the MonitorConfig from defaults, a JSON file, the
//         environment and the command line.
//
// @details
// Precedence, lowest to highest:
//
//   1. MonitorConfig defaults
//   2. JSON file          --config <path>, else $POSMON_CONFIG, else none.
//                         Keys are the MonitorConfig field names; durations
//                         carry an _ms suffix (poll_interval_ms). Sinks are
//                         "enabled_sinks": ["visual_table", ...].
//   3. Environment        POSMON_TARGET_URL, POSMON_MODEL, POSMON_SOURCE,
//                         POSMON_RENDERER, POSMON_POLL_INTERVAL_MS,
//                         POSMON_RETRY_COOLDOWN_MS, POSMON_OUT_DIR
//   4. Flags              see usage()
//
// Sink flags (--visual, --notify, --sound, --popup) replace any sink list from
// the file when at least one is given.
//
// The output directory (POSMON_OUT_DIR or --out-dir, flag wins) is applied
// last and once: it prefixes log_path, snapshot_dir and latest_view_path
// when they are relative.
//
// The environment is read through an injectable lookup so tests never touch
// the real process environment.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  using EnvLookup =
      std::function<std::optional<std::string>(const std::string& name)>;

  struct Result {
    domain::MonitorConfig config;
    bool help_requested{false};
  };

  // Uses std::getenv.
  ConfigLoader();
  explicit ConfigLoader(EnvLookup env);

  // @throws ConfigError
  Result load(const std::vector<std::string>& args) const;

  // Applies one parsed JSON document on top of `config`.
  // @throws ConfigError
  static void applyJson(const nlohmann::json& doc,
                        domain::MonitorConfig& config);

  static std::string usage(const std::string& program);

 private:
  void applyFile(const std::string& path, domain::MonitorConfig& config) const;
  void applyEnvironment(domain::MonitorConfig& config,
                        std::optional<std::string>& out_dir) const;
  static void validate(const domain::MonitorConfig& config);

  EnvLookup env_;
};

}  // namespace posmon
