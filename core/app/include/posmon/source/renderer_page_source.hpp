#pragma once

#include "posmon/source/i_page_source.hpp"
#include "posmon/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace posmon {

// -----------------------------------------------------------------------------
// RendererPageSource — ZeroMQ client of an external headless-browser renderer
// -----------------------------------------------------------------------------
//
// @brief  IPageSource that asks a separate renderer process (a headless
//         Chromium driver) for the rendered text of the watched section and
//         for screenshots of it.
//
// @details
// Page rendering is deliberately kept out of this process. The renderer
// listens on a REP socket; this adapter connects a REQ socket to it (outbound
// only, the monitor never binds) and exchanges one JSON request per call:
//
//   → {"op":"snapshot","url":"https://...","section":"ACTIVE POSITIONS"}
//   ← {"ok":true,"text":"...","captured_at_ms":1760000000000}
//   ← {"ok":false,"error":"navigation timeout","transient":true}
//
//   → {"op":"screenshot","url":"https://...","section":"ACTIVE POSITIONS"}
//   ← frame 1: {"ok":true,"content_type":"image/png"}
//     frame 2: raw PNG bytes
//
// Reply fields beyond those shown are ignored. captured_at_ms is optional;
// when missing the local clock stamps the snapshot.
//
// Timeouts (lazy-pirate pattern):
//   ZMQ_SNDTIMEO / ZMQ_RCVTIMEO bound every exchange by fetch_timeout. A REQ
//   socket that sent a request but never got the reply is stuck in the
//   "expect reply" state, so on timeout the socket is closed (linger 0) and
//   rebuilt before the FetchError is thrown. The next fetch starts clean.
//
// Error mapping:
//   send/recv timeout, zmq::error_t      → FetchError(transient)
//   {"ok":false,...}                     → FetchError(reply "transient", default true)
//   unparseable / wrong-shape reply      → FetchError(!transient)
//
// Ownership:
//   Owns the zmq::context_t and the socket (RAII). Holds a reference to the
//   clock, which must outlive it.
//
// Thread model: poll thread only. zmq sockets are not thread-safe.
// -----------------------------------------------------------------------------
class RendererPageSource final : public IPageSource {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  endpoint        Renderer REP endpoint, e.g. "tcp://127.0.0.1:5560".
  // @param  target_url      Page the renderer should load.
  // @param  section_marker  Header text identifying the positions section.
  // @param  timeout         Per-exchange send + receive deadline.
  // @param  clock           Fallback capture time source.
  //
  // @throws zmq::error_t  When the endpoint string is malformed. connect()
  //                       itself is asynchronous; an absent renderer only
  //                       shows up as fetch timeouts.
  // -------------------------------------------------------------------------
  RendererPageSource(std::string endpoint, std::string target_url,
                     std::string section_marker,
                     std::chrono::milliseconds timeout,
                     const ITimeProvider& clock);

  ~RendererPageSource() override = default;

  RendererPageSource(const RendererPageSource&) = delete;
  RendererPageSource& operator=(const RendererPageSource&) = delete;

  RawSnapshot fetch() override;

  std::optional<std::string> captureImage() override;

  std::string describe() const override;

 private:
  // Closes any existing socket and connects a fresh REQ socket.
  void connect();

  // Sends one JSON request and returns every frame of the reply. Frame 0 is
  // parsed and checked for "ok"; the parsed header is returned via `header`.
  std::vector<zmq::message_t> exchange(const nlohmann::json& request,
                                       nlohmann::json& header);

  nlohmann::json makeRequest(const char* op) const;

  std::string endpoint_;
  std::string target_url_;
  std::string section_marker_;
  std::chrono::milliseconds timeout_;
  const ITimeProvider& clock_;

  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace posmon
