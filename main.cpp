// -----------------------------------------------------------------------------
// posmon — single executable entry point.
//
//   1) Load MonitorConfig (defaults → JSON file → environment → flags).
//   2) Construct the page source chosen by config.source.
//   3) Build the sinks, the MonitorEngine and the ConsoleReporter.
//   4) Install SIGINT/SIGTERM handlers that only request a stop.
//   5) Run the poll loop on the main thread until stopped.
//
// Thread layout:
//   main thread        → MonitorEngine::run() (fetch, normalize, detect,
//                        persist, console output)
//   one thread per sink → NotificationDispatcher workers
//
// Exit codes:
//   0  stopped by signal (or --help)
//   1  page source could not be constructed, or no successful fetch within
//      --max-startup-attempts
//   2  invalid configuration
// -----------------------------------------------------------------------------

#include "posmon/config/config_loader.hpp"
#include "posmon/engine/monitor_engine.hpp"
#include "posmon/notify/sinks.hpp"
#include "posmon/report/console_reporter.hpp"
#include "posmon/source/http_page_source.hpp"
#include "posmon/source/renderer_page_source.hpp"
#include "posmon/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Set once before the handlers are installed. The handler only performs an
// atomic store through it.
posmon::MonitorEngine* g_engine_ptr = nullptr;

extern "C" void onStopSignal(int /*signum*/) {
  if (g_engine_ptr != nullptr) {
    g_engine_ptr->stop();
  }
}

void installStopHandlers() {
  struct sigaction sa {};
  sa.sa_handler = onStopSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

std::unique_ptr<posmon::IPageSource> makeSource(
    const posmon::domain::MonitorConfig& config,
    const posmon::ITimeProvider& clock) {
  if (config.source == posmon::domain::SourceKind::Http) {
    return std::make_unique<posmon::HttpPageSource>(
        config.target_url, config.section_marker, config.fetch_timeout, clock);
  }
  return std::make_unique<posmon::RendererPageSource>(
      config.renderer_endpoint, config.target_url, config.section_marker,
      config.fetch_timeout, clock);
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string program = argc > 0 ? argv[0] : "posmon";
  std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  posmon::ConfigLoader::Result loaded;
  try {
    loaded = posmon::ConfigLoader().load(args);
  } catch (const posmon::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n\n"
              << posmon::ConfigLoader::usage(program);
    return 2;
  }
  if (loaded.help_requested) {
    std::cout << posmon::ConfigLoader::usage(program);
    return 0;
  }
  const posmon::domain::MonitorConfig& config = loaded.config;

  // -------------------------------------------------------------------------
  // 2) Page source
  // -------------------------------------------------------------------------
  posmon::LiveTimeProvider clock;
  std::unique_ptr<posmon::IPageSource> source;
  try {
    source = makeSource(config, clock);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[main] cannot create page source: " << e.what() << '\n';
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot create renderer client: " << e.what() << '\n';
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Engine, sinks and console
  // -------------------------------------------------------------------------
  posmon::MonitorEngine engine(*source, clock, config,
                               posmon::makeSinks(config, std::cout));
  posmon::ConsoleReporter reporter(engine.eventBus(), config.model_name);
  posmon::ConsoleReporter::printBanner(std::cout, config, source->describe());

  // -------------------------------------------------------------------------
  // 4) Signals
  // -------------------------------------------------------------------------
  g_engine_ptr = &engine;
  installStopHandlers();

  // -------------------------------------------------------------------------
  // 5) Poll loop
  // -------------------------------------------------------------------------
  posmon::MonitorEngine::RunResult result = engine.run();
  g_engine_ptr = nullptr;

  if (result == posmon::MonitorEngine::RunResult::StartupFailed) {
    return 1;
  }
  std::cout << "Stopped by user.\n";
  return 0;
}
