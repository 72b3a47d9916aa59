#pragma once

#include "posmon/source/i_page_source.hpp"
#include "posmon/time/i_time_provider.hpp"

#include <chrono>
#include <string>

namespace posmon {

// -----------------------------------------------------------------------------
// HttpPageSource — direct HTTP(S) page fetch
// -----------------------------------------------------------------------------
//
// @brief  IPageSource that GETs the target URL with Boost.Beast and reduces
//         the HTML to text.
//
// @details
// Suitable for server-rendered pages. Pages that build the positions table in
// client-side JavaScript yield no position blocks through this adapter; use
// RendererPageSource for those.
//
// Each fetch():
//   1. Resolves the host (synchronous).
//   2. Connects, (TLS handshakes for https), writes the request and reads the
//      response as one asynchronous chain on a private io_context. A single
//      beast::tcp_stream deadline bounds the whole chain, so a hung server
//      surfaces as a FetchError instead of stalling the poll loop.
//   3. Sends no-cache headers so intermediaries never serve a stale page.
//   4. Converts the body with htmlToText() and narrows it with
//      extractSection(section_marker).
//
// Error mapping:
//   resolve / connect / TLS / timeout / read errors → FetchError(transient)
//   HTTP 5xx                                        → FetchError(transient)
//   HTTP 3xx / 4xx                                  → FetchError(!transient)
//
// captureImage() is not supported (returns std::nullopt): there is no
// renderer behind this adapter.
//
// Thread model: poll thread only.
// -----------------------------------------------------------------------------
class HttpPageSource final : public IPageSource {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  url             http:// or https:// URL of the watched page.
  // @param  section_marker  Header text that precedes the positions section.
  // @param  timeout         Deadline for connect + request + response.
  // @param  clock           Stamps RawSnapshot::captured_at.
  //
  // @throws std::invalid_argument  When the URL is not http(s)://host[:port]/...
  // -------------------------------------------------------------------------
  HttpPageSource(const std::string& url, std::string section_marker,
                 std::chrono::milliseconds timeout, const ITimeProvider& clock);

  RawSnapshot fetch() override;

  std::string describe() const override;

 private:
  bool tls_{false};
  std::string host_;
  std::string port_;
  std::string target_;
  std::string url_;
  std::string section_marker_;
  std::chrono::milliseconds timeout_;
  const ITimeProvider& clock_;
};

}  // namespace posmon
