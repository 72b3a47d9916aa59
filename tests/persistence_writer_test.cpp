// =============================================================================
// persistence_writer_test.cpp
// =============================================================================
// Unit tests for posmon::PersistenceWriter and the change-log line format.
//
// Validates:
//   - Log line: one JSON object per line, keys in a fixed order, appended
//   - Snapshot file named from the detection time, written atomically
//   - Latest view rewritten with escaped content
//   - Each target fails independently
//   - Degraded baseline lands in debug_positions_full.png
//
// Every test works in its own directory under the system temp dir.
// =============================================================================

#include "posmon/persist/log_record.hpp"
#include "posmon/persist/persistence_writer.hpp"
#include "posmon/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::int64_t kDetectedMs = 1'760'000'000'000;  // 2025-10-09 08:53:20Z

std::string readFile(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

std::vector<std::string> readLines(const fs::path& p) {
  std::ifstream in(p);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

class PersistenceWriterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = fs::temp_directory_path() /
          (std::string("posmon_persist_") + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);

    config.model_name = "DEEPSEEK CHAT V3.1";
    config.log_path = (dir / "positions-log.txt").string();
    config.snapshot_dir = (dir / "positions_snapshots").string();
    config.latest_view_path = (dir / "positions_latest.html").string();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  static posmon::ChangeEvent change(const std::string& key, double pnl) {
    posmon::ChangeEvent e;
    posmon::domain::PositionEntry p;
    p.symbol = "ETH";
    p.side = posmon::domain::Side::Short;
    p.unrealized_pnl = pnl;
    e.current.positions.push_back(p);
    e.current.comparison_key = key;
    e.current.aggregate_pnl = pnl;
    e.detected_at = posmon::ms_to_timestamp(kDetectedMs);
    return e;
  }

  fs::path dir;
  posmon::domain::MonitorConfig config;
};

// -----------------------------------------------------------------------------
// 1. The log line has exactly timestamp, model, active_positions in that
//    order, with an ISO-8601 UTC timestamp and ", " / ": " separators.
// Why: Downstream tooling reads the file line by line and expects this shape.
// -----------------------------------------------------------------------------
TEST_F(PersistenceWriterTest, LogLineShape) {
  auto record =
      posmon::makeLogRecord(change("ETH short 2.4 (pnl 25.0)", 25.0), "M");
  EXPECT_EQ(posmon::toJsonLine(record),
            R"({"timestamp": "2025-10-09T08:53:20Z", "model": "M", )"
            R"x("active_positions": "ETH short 2.4 (pnl 25.0)"})x");
}

TEST_F(PersistenceWriterTest, DegradedStateLogsPlaceholder) {
  auto event = change("", 0.0);
  event.current.positions.clear();
  event.current.aggregate_pnl.reset();

  auto record = posmon::makeLogRecord(event, "M");
  EXPECT_EQ(record.active_positions, "(no positions recognised)");
  EXPECT_NE(posmon::toJsonLine(record).find(
                R"x("active_positions": "(no positions recognised)")x"),
            std::string::npos);
}

TEST_F(PersistenceWriterTest, LogLineEscapesNewlines) {
  auto line = posmon::toJsonLine(
      posmon::makeLogRecord(change("ETH a\nBTC b", 1.0), "M"));
  EXPECT_EQ(line.find('\n'), std::string::npos);
  EXPECT_NE(line.find(R"(ETH a\nBTC b)"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 2. Two changes append two lines; nothing is rewritten.
// -----------------------------------------------------------------------------
TEST_F(PersistenceWriterTest, ChangesAppendToLog) {
  posmon::PersistenceWriter writer(config);

  auto first = writer.persistChange(change("a", 1.0), std::nullopt);
  auto second = writer.persistChange(change("b", 2.0), std::nullopt);
  EXPECT_TRUE(first.allOk());
  EXPECT_TRUE(second.allOk());

  auto lines = readLines(config.log_path);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find(R"("active_positions": "a")"), std::string::npos);
  EXPECT_NE(lines[1].find(R"("active_positions": "b")"), std::string::npos);
  EXPECT_NE(lines[0].find(R"("model": "DEEPSEEK CHAT V3.1")"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 3. The snapshot is named after the detection time and holds the bytes the
//    source produced; no temporary file is left behind.
// -----------------------------------------------------------------------------
TEST_F(PersistenceWriterTest, SnapshotWrittenAtomically) {
  posmon::PersistenceWriter writer(config);
  const std::string png("\x89PNG\r\n\x1a\n-bytes", 14);

  auto report = writer.persistChange(change("k", 1.0), png);

  const auto* snap = report.find("snapshot");
  ASSERT_NE(snap, nullptr);
  EXPECT_TRUE(snap->ok);
  EXPECT_FALSE(snap->skipped);

  fs::path expected =
      fs::path(config.snapshot_dir) / "positions_20251009_085320.png";
  EXPECT_EQ(snap->path, expected.string());
  EXPECT_EQ(readFile(expected), png);

  for (const auto& entry : fs::recursive_directory_iterator(dir)) {
    EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
  }
}

// -----------------------------------------------------------------------------
// 4. Without an image, or with snapshots disabled, the target is skipped
//    rather than failed.
// -----------------------------------------------------------------------------
TEST_F(PersistenceWriterTest, SnapshotSkippedWithoutImage) {
  posmon::PersistenceWriter writer(config);
  auto report = writer.persistChange(change("k", 1.0), std::nullopt);

  const auto* snap = report.find("snapshot");
  ASSERT_NE(snap, nullptr);
  EXPECT_TRUE(snap->ok);
  EXPECT_TRUE(snap->skipped);
  EXPECT_FALSE(fs::exists(config.snapshot_dir));

  config.write_snapshots = false;
  config.write_latest_view = false;
  posmon::PersistenceWriter disabled(config);
  auto off = disabled.persistChange(change("k2", 1.0), std::string("png"));
  EXPECT_TRUE(off.find("snapshot")->skipped);
  EXPECT_TRUE(off.find("latest_view")->skipped);
  EXPECT_TRUE(off.find("log")->ok);
}

// -----------------------------------------------------------------------------
// 5. The latest view shows the current positions, escaped, and the update
//    time.
// -----------------------------------------------------------------------------
TEST_F(PersistenceWriterTest, LatestViewRewritten) {
  config.model_name = "A&B <model>";
  posmon::PersistenceWriter writer(config);

  writer.persistChange(change("old", 1.0), std::nullopt);
  auto ev = change("new", -3.5);
  ev.current.positions[0].leverage = "20X";
  ev.current.positions[0].entry_price = "4,123.5";
  auto report = writer.persistChange(ev, std::nullopt);
  ASSERT_TRUE(report.find("latest_view")->ok);

  std::string html = readFile(config.latest_view_path);
  EXPECT_NE(html.find("A&amp;B &lt;model&gt;"), std::string::npos);
  EXPECT_EQ(html.find("<model>"), std::string::npos);
  EXPECT_NE(html.find("Last updated: 2025-10-09T08:53:20Z"), std::string::npos);
  EXPECT_NE(html.find("<td>ETH</td><td>Short</td><td>20X</td><td>$4,123.5</td>"),
            std::string::npos);
  EXPECT_NE(html.find("-$3.50"), std::string::npos);
  EXPECT_NE(html.find("class='loss'"), std::string::npos);
}

TEST_F(PersistenceWriterTest, LatestViewWithoutAggregate) {
  posmon::PersistenceWriter writer(config);
  posmon::domain::NormalizedState state;
  std::string html = writer.renderLatestView(state, kDetectedMs);
  EXPECT_NE(html.find("Total P&amp;L:</strong> N/A"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 6. A log failure does not stop the snapshot or the latest view.
// How: the log's parent "directory" is a regular file, so it cannot be
//      created.
// -----------------------------------------------------------------------------
TEST_F(PersistenceWriterTest, TargetsFailIndependently) {
  {
    std::ofstream blocker(dir / "blocker");
    blocker << "x";
  }
  config.log_path = (dir / "blocker" / "positions-log.txt").string();
  posmon::PersistenceWriter writer(config);

  auto report = writer.persistChange(change("k", 1.0), std::string("png"));

  EXPECT_FALSE(report.allOk());
  const auto* log = report.find("log");
  ASSERT_NE(log, nullptr);
  EXPECT_FALSE(log->ok);
  EXPECT_FALSE(log->error.empty());

  EXPECT_TRUE(report.find("snapshot")->ok);
  EXPECT_TRUE(report.find("latest_view")->ok);
  EXPECT_TRUE(fs::exists(config.latest_view_path));
}

// -----------------------------------------------------------------------------
// 7. Baseline: only the snapshot is written; a degraded baseline goes to the
//    fixed debug file name.
// -----------------------------------------------------------------------------
TEST_F(PersistenceWriterTest, BaselineWritesOnlySnapshot) {
  posmon::PersistenceWriter writer(config);

  posmon::BaselineEvent baseline;
  baseline.state = change("k", 1.0).current;
  baseline.timestamp = posmon::ms_to_timestamp(kDetectedMs);

  auto report = writer.persistBaseline(baseline, std::string("png"));
  ASSERT_EQ(report.results.size(), 1u);
  EXPECT_TRUE(report.results[0].ok);
  EXPECT_TRUE(fs::exists(fs::path(config.snapshot_dir) /
                         "positions_20251009_085320.png"));
  EXPECT_FALSE(fs::exists(config.log_path));
  EXPECT_FALSE(fs::exists(config.latest_view_path));
}

TEST_F(PersistenceWriterTest, DegradedBaselineUsesDebugName) {
  posmon::PersistenceWriter writer(config);

  posmon::BaselineEvent baseline;
  baseline.timestamp = posmon::ms_to_timestamp(kDetectedMs);

  auto report = writer.persistBaseline(baseline, std::string("png"));
  ASSERT_EQ(report.results.size(), 1u);
  EXPECT_EQ(report.results[0].path,
            (fs::path(config.snapshot_dir) / "debug_positions_full.png")
                .string());
  EXPECT_EQ(readFile(report.results[0].path), "png");
}

TEST(PersistenceHelpers, EscapeHtml) {
  EXPECT_EQ(posmon::escapeHtml(R"(<a href="x">'&'</a>)"),
            "&lt;a href=&quot;x&quot;&gt;&#x27;&amp;&#x27;&lt;/a&gt;");
}
