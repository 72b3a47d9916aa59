#include "posmon/persist/persistence_writer.hpp"
#include "posmon/notify/rendered_summary.hpp"
#include "posmon/persist/log_record.hpp"
#include "posmon/time/time_utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace posmon {

namespace {

constexpr const char* kDebugSnapshotName = "debug_positions_full.png";

// Creates the parent directory of `path` if it has one. Empty on success.
std::string ensureParent(const std::string& path) {
  fs::path parent = fs::path(path).parent_path();
  if (parent.empty()) {
    return {};
  }
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    return "cannot create " + parent.string() + ": " + ec.message();
  }
  return {};
}

const char* pnlClass(const std::optional<double>& pnl) {
  if (!pnl) return "";
  return *pnl >= 0 ? "profit" : "loss";
}

}  // namespace

// -----------------------------------------------------------------------------
// PersistenceReport
// -----------------------------------------------------------------------------
bool PersistenceReport::allOk() const {
  for (const auto& r : results) {
    if (!r.ok) return false;
  }
  return true;
}

const PersistenceResult* PersistenceReport::find(
    const std::string& target) const {
  for (const auto& r : results) {
    if (r.target == target) return &r;
  }
  return nullptr;
}

// -----------------------------------------------------------------------------
// PersistenceWriter
// -----------------------------------------------------------------------------
PersistenceWriter::PersistenceWriter(const domain::MonitorConfig& config)
    : config_(config) {}

PersistenceReport PersistenceWriter::persistChange(
    const ChangeEvent& event, const std::optional<std::string>& image) {
  PersistenceReport report;
  report.results.push_back(appendLog(event));
  report.results.push_back(
      writeImage(snapshotPath(timestamp_to_ms(event.detected_at)), image));
  report.results.push_back(writeLatestView(event));
  return report;
}

PersistenceReport PersistenceWriter::persistBaseline(
    const BaselineEvent& event, const std::optional<std::string>& image) {
  std::string path =
      event.state.degraded()
          ? (fs::path(config_.snapshot_dir) / kDebugSnapshotName).string()
          : snapshotPath(timestamp_to_ms(event.timestamp));

  PersistenceReport report;
  report.results.push_back(writeImage(path, image));
  return report;
}

std::string PersistenceWriter::snapshotPath(std::int64_t epoch_ms) const {
  return (fs::path(config_.snapshot_dir) /
          ("positions_" + formatFileStamp(epoch_ms) + ".png"))
      .string();
}

// -----------------------------------------------------------------------------
// appendLog(): one line, one insertion, flushed
// -----------------------------------------------------------------------------
PersistenceResult PersistenceWriter::appendLog(const ChangeEvent& event) {
  PersistenceResult result;
  result.target = "log";
  result.path = config_.log_path;

  result.error = ensureParent(config_.log_path);
  if (!result.error.empty()) {
    return result;
  }

  const std::string line =
      toJsonLine(makeLogRecord(event, config_.model_name)) + '\n';

  std::ofstream out(config_.log_path, std::ios::out | std::ios::app);
  if (!out) {
    result.error = "cannot open for append: " + std::string(std::strerror(errno));
    return result;
  }
  out << line;
  out.flush();
  if (!out) {
    result.error = "write failed: " + std::string(std::strerror(errno));
    return result;
  }

  result.ok = true;
  return result;
}

// -----------------------------------------------------------------------------
// writeImage()
// -----------------------------------------------------------------------------
PersistenceResult PersistenceWriter::writeImage(
    const std::string& path, const std::optional<std::string>& image) {
  PersistenceResult result;
  result.target = "snapshot";
  result.path = path;

  if (!config_.write_snapshots || !image) {
    result.ok = true;
    result.skipped = true;
    return result;
  }

  result.error = writeFileAtomically(path, *image);
  result.ok = result.error.empty();
  return result;
}

// -----------------------------------------------------------------------------
// writeLatestView()
// -----------------------------------------------------------------------------
PersistenceResult PersistenceWriter::writeLatestView(const ChangeEvent& event) {
  PersistenceResult result;
  result.target = "latest_view";
  result.path = config_.latest_view_path;

  if (!config_.write_latest_view) {
    result.ok = true;
    result.skipped = true;
    return result;
  }

  result.error = writeFileAtomically(
      config_.latest_view_path,
      renderLatestView(event.current, timestamp_to_ms(event.detected_at)));
  result.ok = result.error.empty();
  return result;
}

// -----------------------------------------------------------------------------
// renderLatestView()
// -----------------------------------------------------------------------------
std::string PersistenceWriter::renderLatestView(
    const domain::NormalizedState& state, std::int64_t updated_ms) const {
  const std::string model = escapeHtml(config_.model_name);

  std::ostringstream html;
  html << "<!DOCTYPE html>\n"
       << "<html><head><meta charset='utf-8'><title>" << model
       << " Positions</title>\n"
       << "<style>\n"
       << "body { font-family: system-ui, sans-serif; max-width: 900px; "
          "margin: 20px auto; padding: 20px; }\n"
       << "table { border-collapse: collapse; width: 100%; margin: 20px 0; }\n"
       << "td, th { border: 1px solid #ddd; padding: 8px 12px; "
          "text-align: left; }\n"
       << "th { background: #f5f5f5; }\n"
       << ".profit { color: #28a745; font-weight: bold; }\n"
       << ".loss { color: #dc3545; font-weight: bold; }\n"
       << "</style>\n</head><body>\n"
       << "<h2>" << model << " Active Positions</h2>\n"
       << "<p><small>Last updated: " << formatIso8601Utc(updated_ms)
       << "</small></p>\n"
       << "<table>\n<thead>\n<tr><th>Symbol</th><th>Side</th>"
          "<th>Leverage</th><th>Entry Price</th><th>Unrealized P&amp;L</th>"
          "</tr>\n</thead>\n<tbody>\n";

  for (const auto& p : state.positions) {
    html << "<tr><td>" << escapeHtml(p.symbol) << "</td><td>"
         << domain::sideToString(p.side) << "</td><td>"
         << escapeHtml(p.leverage.value_or("")) << "</td><td>"
         << (p.entry_price ? "$" + escapeHtml(*p.entry_price) : "")
         << "</td><td class='" << pnlClass(p.unrealized_pnl) << "'>"
         << formatPnl(p.unrealized_pnl) << "</td></tr>\n";
  }

  html << "</tbody>\n</table>\n<p><strong>Total P&amp;L:</strong> ";
  if (state.aggregate_pnl) {
    html << "<span class='" << pnlClass(state.aggregate_pnl) << "'>"
         << formatPnl(state.aggregate_pnl) << "</span>";
  } else {
    html << "N/A";
  }
  html << "</p>\n</body></html>\n";
  return html.str();
}

// -----------------------------------------------------------------------------
// writeFileAtomically()
// -----------------------------------------------------------------------------
std::string PersistenceWriter::writeFileAtomically(const std::string& path,
                                                   const std::string& bytes) {
  std::string error = ensureParent(path);
  if (!error.empty()) {
    return error;
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      return "cannot open " + tmp + ": " + std::strerror(errno);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      error = "write to " + tmp + " failed: " + std::strerror(errno);
    }
  }

  std::error_code ec;
  if (error.empty()) {
    fs::rename(tmp, path, ec);
    if (!ec) {
      return {};
    }
    error = "rename to " + path + " failed: " + ec.message();
  }

  fs::remove(tmp, ec);
  return error;
}

std::string escapeHtml(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':  out += "&amp;"; break;
      case '<':  out += "&lt;"; break;
      case '>':  out += "&gt;"; break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&#x27;"; break;
      default:   out += c;
    }
  }
  return out;
}

}  // namespace posmon
