#include "posmon/config/config_loader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace posmon {

namespace {

using domain::MonitorConfig;
using domain::SinkKind;
using domain::SourceKind;

std::int64_t parseInteger(const std::string& name, const std::string& text) {
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (text.empty() || end == text.c_str() || *end != '\0' || errno == ERANGE) {
    throw ConfigError(name + ": expected an integer, got '" + text + "'");
  }
  return value;
}

std::chrono::milliseconds parseMillis(const std::string& name,
                                      const std::string& text) {
  std::int64_t v = parseInteger(name, text);
  if (v <= 0) {
    throw ConfigError(name + ": must be a positive number of milliseconds");
  }
  return std::chrono::milliseconds{v};
}

SourceKind parseSource(const std::string& name, const std::string& text) {
  if (text == "renderer") return SourceKind::Renderer;
  if (text == "http") return SourceKind::Http;
  throw ConfigError(name + ": expected 'renderer' or 'http', got '" + text +
                    "'");
}

std::string prefixIfRelative(const std::string& dir, const std::string& path) {
  if (fs::path(path).is_absolute()) {
    return path;
  }
  return (fs::path(dir) / path).string();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
ConfigLoader::ConfigLoader()
    : env_([](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (v == nullptr) return std::nullopt;
        return std::string(v);
      }) {}

ConfigLoader::ConfigLoader(EnvLookup env) : env_(std::move(env)) {}

// -----------------------------------------------------------------------------
// load()
// -----------------------------------------------------------------------------
ConfigLoader::Result ConfigLoader::load(
    const std::vector<std::string>& args) const {
  Result result;
  MonitorConfig& config = result.config;

  // --config has to be known before anything else is applied.
  std::optional<std::string> config_path = env_("POSMON_CONFIG");
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        throw ConfigError("--config requires a value");
      }
      config_path = args[i + 1];
    }
  }
  if (config_path) {
    applyFile(*config_path, config);
  }

  std::optional<std::string> out_dir;
  applyEnvironment(config, out_dir);

  std::vector<SinkKind> flag_sinks;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    auto value = [&]() -> const std::string& {
      if (i + 1 >= args.size()) {
        throw ConfigError(arg + " requires a value");
      }
      return args[++i];
    };

    if (arg == "--help" || arg == "-h") {
      result.help_requested = true;
    } else if (arg == "--visual") {
      flag_sinks.push_back(SinkKind::VisualTable);
    } else if (arg == "--notify") {
      flag_sinks.push_back(SinkKind::DesktopNotification);
    } else if (arg == "--sound") {
      flag_sinks.push_back(SinkKind::AudibleAlert);
    } else if (arg == "--popup") {
      flag_sinks.push_back(SinkKind::ModalPopup);
    } else if (arg == "--config") {
      value();
    } else if (arg == "--url") {
      config.target_url = value();
    } else if (arg == "--model") {
      config.model_name = value();
    } else if (arg == "--source") {
      config.source = parseSource(arg, value());
    } else if (arg == "--renderer") {
      config.renderer_endpoint = value();
    } else if (arg == "--interval-ms") {
      config.poll_interval = parseMillis(arg, value());
    } else if (arg == "--cooldown-ms") {
      config.retry_cooldown = parseMillis(arg, value());
    } else if (arg == "--out-dir") {
      out_dir = value();
    } else if (arg == "--max-startup-attempts") {
      std::int64_t n = parseInteger(arg, value());
      if (n < 0 || n > UINT32_MAX) {
        throw ConfigError(arg + ": out of range");
      }
      config.max_startup_attempts = static_cast<std::uint32_t>(n);
    } else if (arg == "--no-snapshots") {
      config.write_snapshots = false;
    } else if (arg == "--no-latest-view") {
      config.write_latest_view = false;
    } else {
      throw ConfigError("unknown argument: " + arg);
    }
  }

  if (!flag_sinks.empty()) {
    config.enabled_sinks.clear();
    for (SinkKind k : flag_sinks) {
      if (std::find(config.enabled_sinks.begin(), config.enabled_sinks.end(),
                    k) == config.enabled_sinks.end()) {
        config.enabled_sinks.push_back(k);
      }
    }
  }

  if (out_dir && !out_dir->empty()) {
    config.log_path = prefixIfRelative(*out_dir, config.log_path);
    config.snapshot_dir = prefixIfRelative(*out_dir, config.snapshot_dir);
    config.latest_view_path =
        prefixIfRelative(*out_dir, config.latest_view_path);
  }

  validate(config);
  return result;
}

// -----------------------------------------------------------------------------
// applyFile()
// -----------------------------------------------------------------------------
void ConfigLoader::applyFile(const std::string& path,
                             MonitorConfig& config) const {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("config file " + path + ": " + e.what());
  }
  applyJson(doc, config);
}

// -----------------------------------------------------------------------------
// applyJson()
// -----------------------------------------------------------------------------
void ConfigLoader::applyJson(const nlohmann::json& doc, MonitorConfig& config) {
  if (!doc.is_object()) {
    throw ConfigError("config: top level must be a JSON object");
  }

  auto millis = [](const std::string& key, const nlohmann::json& v) {
    auto n = v.get<std::int64_t>();
    if (n <= 0) {
      throw ConfigError("config: " + key + " must be positive");
    }
    return std::chrono::milliseconds{n};
  };

  try {
    for (const auto& item : doc.items()) {
      const std::string& key = item.key();
      const nlohmann::json& v = item.value();
      if (key == "target_url") {
        config.target_url = v.get<std::string>();
      } else if (key == "model_name") {
        config.model_name = v.get<std::string>();
      } else if (key == "section_marker") {
        config.section_marker = v.get<std::string>();
      } else if (key == "source") {
        config.source = parseSource("config: source", v.get<std::string>());
      } else if (key == "renderer_endpoint") {
        config.renderer_endpoint = v.get<std::string>();
      } else if (key == "fetch_timeout_ms") {
        config.fetch_timeout = millis(key, v);
      } else if (key == "poll_interval_ms") {
        config.poll_interval = millis(key, v);
      } else if (key == "retry_cooldown_ms") {
        config.retry_cooldown = millis(key, v);
      } else if (key == "sink_timeout_ms") {
        config.sink_timeout = millis(key, v);
      } else if (key == "max_startup_attempts") {
        config.max_startup_attempts = v.get<std::uint32_t>();
      } else if (key == "enabled_sinks") {
        config.enabled_sinks.clear();
        for (const auto& name : v) {
          auto kind = domain::parseSinkKind(name.get<std::string>());
          if (!kind) {
            throw ConfigError("config: unknown sink '" +
                              name.get<std::string>() + "'");
          }
          if (std::find(config.enabled_sinks.begin(),
                        config.enabled_sinks.end(),
                        *kind) == config.enabled_sinks.end()) {
            config.enabled_sinks.push_back(*kind);
          }
        }
      } else if (key == "sound_file") {
        config.sound_file = v.get<std::string>();
      } else if (key == "log_path") {
        config.log_path = v.get<std::string>();
      } else if (key == "snapshot_dir") {
        config.snapshot_dir = v.get<std::string>();
      } else if (key == "latest_view_path") {
        config.latest_view_path = v.get<std::string>();
      } else if (key == "write_snapshots") {
        config.write_snapshots = v.get<bool>();
      } else if (key == "write_latest_view") {
        config.write_latest_view = v.get<bool>();
      } else {
        throw ConfigError("config: unknown key '" + key + "'");
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("config: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// applyEnvironment()
// -----------------------------------------------------------------------------
void ConfigLoader::applyEnvironment(MonitorConfig& config,
                                    std::optional<std::string>& out_dir) const {
  if (auto v = env_("POSMON_TARGET_URL")) config.target_url = *v;
  if (auto v = env_("POSMON_MODEL")) config.model_name = *v;
  if (auto v = env_("POSMON_SOURCE")) {
    config.source = parseSource("POSMON_SOURCE", *v);
  }
  if (auto v = env_("POSMON_RENDERER")) config.renderer_endpoint = *v;
  if (auto v = env_("POSMON_POLL_INTERVAL_MS")) {
    config.poll_interval = parseMillis("POSMON_POLL_INTERVAL_MS", *v);
  }
  if (auto v = env_("POSMON_RETRY_COOLDOWN_MS")) {
    config.retry_cooldown = parseMillis("POSMON_RETRY_COOLDOWN_MS", *v);
  }
  if (auto v = env_("POSMON_OUT_DIR")) out_dir = *v;
}

void ConfigLoader::validate(const MonitorConfig& config) {
  if (config.target_url.empty()) {
    throw ConfigError("target_url must not be empty");
  }
  if (config.source == SourceKind::Renderer &&
      config.renderer_endpoint.empty()) {
    throw ConfigError("renderer_endpoint must not be empty");
  }
  if (config.log_path.empty()) {
    throw ConfigError("log_path must not be empty");
  }
}

// -----------------------------------------------------------------------------
// usage()
// -----------------------------------------------------------------------------
std::string ConfigLoader::usage(const std::string& program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options]\n"
      << "\n"
      << "Watches a positions page and reports every change.\n"
      << "\n"
      << "Sinks (default: --notify):\n"
      << "  --visual                  coloured table in the terminal\n"
      << "  --notify                  desktop notification (notify-send)\n"
      << "  --sound                   audible alert (aplay)\n"
      << "  --popup                   details popup (zenity)\n"
      << "\n"
      << "Source:\n"
      << "  --url <url>               page to watch\n"
      << "  --model <name>            display name written to the log\n"
      << "  --source renderer|http    page source adapter (default renderer)\n"
      << "  --renderer <endpoint>     renderer ZeroMQ endpoint\n"
      << "\n"
      << "Scheduling:\n"
      << "  --interval-ms <n>         delay between polls (default 10000)\n"
      << "  --cooldown-ms <n>         delay after a failed fetch (default 30000)\n"
      << "  --max-startup-attempts <n> give up if no baseline after n failed\n"
      << "                            fetches (default 0 = never)\n"
      << "\n"
      << "Output:\n"
      << "  --out-dir <dir>           prefix for log, snapshots and latest view\n"
      << "  --no-snapshots            do not save snapshot images\n"
      << "  --no-latest-view          do not write positions_latest.html\n"
      << "\n"
      << "  --config <file>           JSON config file (also $POSMON_CONFIG)\n"
      << "  --help                    show this text\n";
  return out.str();
}

}  // namespace posmon
