#pragma once

#include "posmon/time/timestamp.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace posmon {

// -----------------------------------------------------------------------------
// RawSnapshot
// -----------------------------------------------------------------------------
// One point-in-time capture of the watched page: opaque text plus the time it
// was captured. Transient: StateNormalizer turns it into a NormalizedState and
// the snapshot is dropped.
// -----------------------------------------------------------------------------
struct RawSnapshot {
  std::string text;
  Timestamp captured_at{};
};

// -----------------------------------------------------------------------------
// FetchError
// -----------------------------------------------------------------------------
//
// @brief  Thrown by IPageSource::fetch() when no snapshot could be produced.
//
// @details
// `transient()` records the adapter's own opinion (timeout / connection
// refused → true, HTTP 404 → false). MonitorEngine logs it but retries in
// both cases: a long-running monitor cannot tell "page moved" from "network
// down" and is not supposed to try.
// -----------------------------------------------------------------------------
class FetchError : public std::runtime_error {
 public:
  explicit FetchError(const std::string& what, bool transient = true)
      : std::runtime_error(what), transient_(transient) {}

  bool transient() const noexcept { return transient_; }

 private:
  bool transient_;
};

// -----------------------------------------------------------------------------
// IPageSource — the Source Adapter boundary
// -----------------------------------------------------------------------------
//
// @brief  Produces raw snapshots of the watched page on demand.
//
// @details
// Implementations:
//   - RendererPageSource → asks an external headless-browser renderer over
//                          ZeroMQ for the rendered section text.
//   - HttpPageSource     → plain HTTP(S) GET, HTML stripped to text.
//   - test fakes         → scripted sequences of snapshots / failures.
//
// The engine depends only on this interface; how the page is rendered,
// scraped or screenshotted is the adapter's business.
//
// Thread model:
//   Called only from the poll thread, one call at a time. Implementations
//   need not be thread-safe.
//
// Ownership:
//   main() (or the test) owns the source; MonitorEngine holds a reference.
// -----------------------------------------------------------------------------
class IPageSource {
 public:
  virtual ~IPageSource() = default;

  // -------------------------------------------------------------------------
  // fetch()
  // -------------------------------------------------------------------------
  // @brief  Captures the current page text.
  //
  // @return RawSnapshot  Text of the watched section (or the whole page when
  //                      the section could not be located) and its capture
  //                      time.
  // @throws FetchError   On any failure to obtain the text. Must not throw
  //                      anything else for I/O problems.
  //
  // Side-effects: Network / IPC I/O. May block for up to the adapter's
  //               configured fetch timeout.
  // -------------------------------------------------------------------------
  virtual RawSnapshot fetch() = 0;

  // -------------------------------------------------------------------------
  // captureImage()
  // -------------------------------------------------------------------------
  // @brief  PNG bytes of the currently rendered section, if the adapter can
  //         render images.
  //
  // @return std::nullopt when unsupported.
  // @throws FetchError   When supported but the capture failed.
  // -------------------------------------------------------------------------
  virtual std::optional<std::string> captureImage() { return std::nullopt; }

  // Short label for log lines, e.g. "renderer tcp://127.0.0.1:5560".
  virtual std::string describe() const = 0;
};

}  // namespace posmon
