// =============================================================================
// monitor_engine_test.cpp
// =============================================================================
// Integration tests for posmon::MonitorEngine: scripted page source →
// normalizer → detector → dispatcher + persistence → event bus.
//
// Validates:
//   - Cold start establishes a baseline without notifying or logging
//   - An unchanged page produces a heartbeat only
//   - A change notifies every sink once, appends one log line, saves a
//     snapshot and rewrites the latest view
//   - Fetch failures leave the baseline untouched and are retried
//   - max_startup_attempts ends run() with StartupFailed
//   - stop() from another thread ends run() promptly
//   - Sink, image-capture and log failures are isolated and reported
//
// Design note: the page source is a scripted fake and the clock is a
// SimulationTimeProvider, so file names and timestamps are deterministic.
// Sinks use fake command runners; no external process is started.
// =============================================================================

#include "posmon/engine/monitor_engine.hpp"
#include "posmon/time/simulation_time_provider.hpp"
#include "posmon/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using IterationResult = posmon::MonitorEngine::IterationResult;

namespace {

constexpr std::int64_t kStartMs = 1'760'000'000'000;  // 2025-10-09 08:53:20Z

// One scripted fetch outcome: page text, or a FetchError message.
struct Step {
  bool fails{false};
  std::string text;

  static Step page(std::string t) { return Step{false, std::move(t)}; }
  static Step failure(std::string why) { return Step{true, std::move(why)}; }
};

// Plays the script in order; once exhausted, repeats the last step.
class ScriptedPageSource final : public posmon::IPageSource {
 public:
  ScriptedPageSource(const posmon::ITimeProvider& clock,
                     std::vector<Step> script)
      : clock_(clock), script_(script.begin(), script.end()) {}

  posmon::RawSnapshot fetch() override {
    ++fetches;
    Step step = script_.front();
    if (script_.size() > 1) {
      script_.pop_front();
    }
    if (step.fails) {
      throw posmon::FetchError(step.text);
    }
    posmon::RawSnapshot snap;
    snap.text = step.text;
    snap.captured_at = posmon::ms_to_timestamp(clock_.now_ms());
    return snap;
  }

  std::optional<std::string> captureImage() override {
    if (fail_capture) {
      throw posmon::FetchError("renderer lost the page");
    }
    return std::string("PNG-") + std::to_string(fetches.load());
  }

  std::string describe() const override { return "scripted"; }

  std::atomic<int> fetches{0};
  bool fail_capture{false};

 private:
  const posmon::ITimeProvider& clock_;
  std::deque<Step> script_;
};

std::size_t countLines(const fs::path& p) {
  std::ifstream in(p);
  std::size_t n = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++n;
  }
  return n;
}

}  // namespace

class MonitorEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = fs::temp_directory_path() /
          (std::string("posmon_engine_") + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);

    config.model_name = "DEEPSEEK CHAT V3.1";
    config.poll_interval = 1ms;
    config.retry_cooldown = 5ms;
    config.sink_timeout = 1000ms;
    config.log_path = (dir / "positions-log.txt").string();
    config.snapshot_dir = (dir / "positions_snapshots").string();
    config.latest_view_path = (dir / "positions_latest.html").string();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  // Desktop sink counting its invocations, plus the terminal table.
  std::vector<posmon::Sink> countingSinks() {
    std::vector<posmon::Sink> sinks;
    sinks.emplace_back(posmon::DesktopNotificationSink(
        [this](const std::vector<std::string>&) {
          ++desktop_calls;
          posmon::ProcessResult r;
          r.started = true;
          r.exit_code = 0;
          return r;
        }));
    sinks.emplace_back(posmon::VisualTableSink(terminal));
    return sinks;
  }

  // Records every event the engine publishes.
  void record(posmon::MonitorEngine& engine) {
    engine.eventBus().subscribe(
        [this](const posmon::Event& e) { events.push_back(e); });
  }

  template <typename T>
  std::vector<T> eventsOf() const {
    std::vector<T> out;
    for (const auto& e : events) {
      if (const auto* p = std::get_if<T>(&e)) out.push_back(*p);
    }
    return out;
  }

  fs::path dir;
  posmon::domain::MonitorConfig config;
  posmon::SimulationTimeProvider clock{kStartMs};
  std::ostringstream terminal;
  std::atomic<int> desktop_calls{0};
  std::vector<posmon::Event> events;
};

// -----------------------------------------------------------------------------
// 1. End to end: baseline, unchanged, changed.
// Why: This is the whole point of the program. Exactly one notification per
//      sink and one log line per real change, none on cold start.
// -----------------------------------------------------------------------------
TEST_F(MonitorEngineTest, BaselineUnchangedChanged) {
  ScriptedPageSource source(
      clock, {Step::page("ETH short 2.4 (pnl 10.0)"),
              Step::page("ETH short 2.4 (pnl 10.0)"),
              Step::page("ETH short 2.4 (pnl 25.0)")});
  posmon::MonitorEngine engine(source, clock, config, countingSinks());
  record(engine);

  EXPECT_EQ(engine.runOnce(), IterationResult::Baseline);
  EXPECT_EQ(desktop_calls.load(), 0);
  EXPECT_FALSE(fs::exists(config.log_path));
  EXPECT_TRUE(fs::exists(fs::path(config.snapshot_dir) /
                         "positions_20251009_085320.png"));

  clock.advance_by(10'000);
  EXPECT_EQ(engine.runOnce(), IterationResult::Unchanged);
  EXPECT_EQ(desktop_calls.load(), 0);
  EXPECT_EQ(eventsOf<posmon::HeartbeatEvent>().size(), 1u);

  clock.advance_by(10'000);
  EXPECT_EQ(engine.runOnce(), IterationResult::Changed);
  EXPECT_EQ(desktop_calls.load(), 1);
  EXPECT_NE(terminal.str().find("ETH"), std::string::npos);

  auto changes = eventsOf<posmon::ChangeEvent>();
  ASSERT_EQ(changes.size(), 1u);
  ASSERT_TRUE(changes[0].pnl_delta.has_value());
  EXPECT_DOUBLE_EQ(*changes[0].pnl_delta, 15.0);
  ASSERT_TRUE(changes[0].previous.has_value());
  EXPECT_EQ(changes[0].previous->comparison_key, "ETH short 2.4 (pnl 10.0)");
  EXPECT_EQ(changes[0].current.comparison_key, "ETH short 2.4 (pnl 25.0)");

  EXPECT_EQ(countLines(config.log_path), 1u);
  EXPECT_TRUE(fs::exists(fs::path(config.snapshot_dir) /
                         "positions_20251009_085340.png"));
  EXPECT_TRUE(fs::exists(config.latest_view_path));

  EXPECT_EQ(eventsOf<posmon::BaselineEvent>().size(), 1u);
  EXPECT_TRUE(eventsOf<posmon::SinkFailureEvent>().empty());
  EXPECT_TRUE(eventsOf<posmon::PersistenceFailureEvent>().empty());
  EXPECT_EQ(engine.baseline()->comparison_key, "ETH short 2.4 (pnl 25.0)");
}

// -----------------------------------------------------------------------------
// 2. Noise outside position blocks never triggers a change.
// -----------------------------------------------------------------------------
TEST_F(MonitorEngineTest, NoiseIsNotAChange) {
  ScriptedPageSource source(
      clock, {Step::page("Updated 12:00:01\nETH short 2.4 (pnl 10.0)"),
              Step::page("Updated 12:00:11\nETH  short 2.4 (pnl 10.0) ")});
  posmon::MonitorEngine engine(source, clock, config, countingSinks());

  EXPECT_EQ(engine.runOnce(), IterationResult::Baseline);
  EXPECT_EQ(engine.runOnce(), IterationResult::Unchanged);
  EXPECT_EQ(desktop_calls.load(), 0);
}

// -----------------------------------------------------------------------------
// 3. A fetch failure keeps the baseline; the next success is compared with
//    the state from before the failure.
// -----------------------------------------------------------------------------
TEST_F(MonitorEngineTest, FetchFailureKeepsBaseline) {
  ScriptedPageSource source(
      clock, {Step::page("BTC long pnl 5"), Step::failure("connection refused"),
              Step::page("BTC long pnl 5"), Step::page("BTC long pnl 6")});
  posmon::MonitorEngine engine(source, clock, config, countingSinks());
  record(engine);

  EXPECT_EQ(engine.runOnce(), IterationResult::Baseline);
  EXPECT_EQ(engine.runOnce(), IterationResult::FetchFailed);
  EXPECT_EQ(engine.consecutiveFetchFailures(), 1u);
  EXPECT_EQ(engine.baseline()->comparison_key, "BTC long pnl 5");

  auto failures = eventsOf<posmon::FetchFailureEvent>();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].reason, "connection refused");
  EXPECT_EQ(failures[0].retry_in_ms, 5);

  EXPECT_EQ(engine.runOnce(), IterationResult::Unchanged);
  EXPECT_EQ(engine.consecutiveFetchFailures(), 0u);
  EXPECT_EQ(engine.runOnce(), IterationResult::Changed);
  EXPECT_EQ(desktop_calls.load(), 1);
}

// -----------------------------------------------------------------------------
// 4. With max_startup_attempts set and no baseline yet, run() gives up after
//    that many consecutive failures.
// -----------------------------------------------------------------------------
TEST_F(MonitorEngineTest, StartupGivesUpAfterMaxAttempts) {
  config.max_startup_attempts = 3;
  ScriptedPageSource source(clock, {Step::failure("timeout")});
  posmon::MonitorEngine engine(source, clock, config, countingSinks());
  record(engine);

  EXPECT_EQ(engine.run(), posmon::MonitorEngine::RunResult::StartupFailed);
  EXPECT_EQ(source.fetches.load(), 3);

  auto failures = eventsOf<posmon::FetchFailureEvent>();
  ASSERT_EQ(failures.size(), 3u);
  EXPECT_EQ(failures[0].retry_in_ms, 5);
  EXPECT_EQ(failures[2].retry_in_ms, 0);
  EXPECT_EQ(failures[2].consecutive, 3u);
}

// -----------------------------------------------------------------------------
// 5. stop() from another thread ends run() within one sleep slice, even
//    with a long poll interval.
// Why: SIGINT/SIGTERM call stop(); the process must not hang for a whole
//      interval before exiting.
// -----------------------------------------------------------------------------
TEST_F(MonitorEngineTest, StopEndsRunPromptly) {
  config.poll_interval = 60s;
  ScriptedPageSource source(clock, {Step::page("ETH long pnl 1")});
  posmon::MonitorEngine engine(source, clock, config, countingSinks());

  std::atomic<bool> finished{false};
  posmon::MonitorEngine::RunResult result =
      posmon::MonitorEngine::RunResult::StartupFailed;
  std::thread runner([&] {
    result = engine.run();
    finished.store(true);
  });

  std::this_thread::sleep_for(150ms);
  EXPECT_FALSE(finished.load());

  auto start = std::chrono::steady_clock::now();
  engine.stop();
  runner.join();

  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
  EXPECT_EQ(result, posmon::MonitorEngine::RunResult::Stopped);
  EXPECT_TRUE(engine.stopRequested());
  EXPECT_EQ(source.fetches.load(), 1);
}

// -----------------------------------------------------------------------------
// 6. A throwing sink is reported; the other sink and the log still happen.
// -----------------------------------------------------------------------------
TEST_F(MonitorEngineTest, SinkFailureIsIsolated) {
  auto sinks = countingSinks();
  sinks.emplace_back(posmon::AudibleAlertSink(
      "/nonexistent.oga",
      [](const std::vector<std::string>&) -> posmon::ProcessResult {
        throw std::runtime_error("no audio device");
      }));

  ScriptedPageSource source(clock,
                            {Step::page("SOL long pnl 1"),
                             Step::page("SOL long pnl 2")});
  posmon::MonitorEngine engine(source, clock, config, std::move(sinks));
  record(engine);

  engine.runOnce();
  EXPECT_EQ(engine.runOnce(), IterationResult::Changed);

  EXPECT_EQ(desktop_calls.load(), 1);
  EXPECT_EQ(countLines(config.log_path), 1u);

  auto failures = eventsOf<posmon::SinkFailureEvent>();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].sink, posmon::domain::SinkKind::AudibleAlert);
  EXPECT_FALSE(failures[0].timed_out);
}

// -----------------------------------------------------------------------------
// 7. A failed image capture is reported but the change is still logged and
//    notified.
// -----------------------------------------------------------------------------
TEST_F(MonitorEngineTest, ImageCaptureFailureIsReported) {
  ScriptedPageSource source(clock,
                            {Step::page("ETH long pnl 1"),
                             Step::page("ETH long pnl 3")});
  posmon::MonitorEngine engine(source, clock, config, countingSinks());
  record(engine);

  engine.runOnce();
  source.fail_capture = true;
  EXPECT_EQ(engine.runOnce(), IterationResult::Changed);

  auto failures = eventsOf<posmon::PersistenceFailureEvent>();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].target, "snapshot");
  EXPECT_NE(failures[0].error.find("renderer lost the page"),
            std::string::npos);

  EXPECT_EQ(countLines(config.log_path), 1u);
  EXPECT_EQ(desktop_calls.load(), 1);
}

// -----------------------------------------------------------------------------
// 8. A log write failure is reported and does not stop the notification.
// -----------------------------------------------------------------------------
TEST_F(MonitorEngineTest, LogFailureIsReported) {
  {
    std::ofstream blocker(dir / "blocker");
    blocker << "x";
  }
  config.log_path = (dir / "blocker" / "positions-log.txt").string();

  ScriptedPageSource source(clock,
                            {Step::page("ETH long pnl 1"),
                             Step::page("ETH long pnl 2")});
  posmon::MonitorEngine engine(source, clock, config, countingSinks());
  record(engine);

  engine.runOnce();
  EXPECT_EQ(engine.runOnce(), IterationResult::Changed);

  auto failures = eventsOf<posmon::PersistenceFailureEvent>();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].target, "log");
  EXPECT_EQ(desktop_calls.load(), 1);
}

// -----------------------------------------------------------------------------
// 9. A page that stops parsing is still a change, with no P&L delta.
// -----------------------------------------------------------------------------
TEST_F(MonitorEngineTest, DegradedPageIsAChange) {
  config.write_snapshots = false;
  ScriptedPageSource source(clock,
                            {Step::page("ETH long pnl 1"),
                             Step::page("Loading...")});
  posmon::MonitorEngine engine(source, clock, config, countingSinks());
  record(engine);

  engine.runOnce();
  EXPECT_EQ(engine.runOnce(), IterationResult::Changed);

  auto changes = eventsOf<posmon::ChangeEvent>();
  ASSERT_EQ(changes.size(), 1u);
  EXPECT_TRUE(changes[0].current.degraded());
  EXPECT_FALSE(changes[0].pnl_delta.has_value());
  EXPECT_FALSE(fs::exists(config.snapshot_dir));
}
