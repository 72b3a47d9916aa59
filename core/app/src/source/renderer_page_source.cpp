#include "posmon/source/renderer_page_source.hpp"
#include "posmon/time/time_utils.hpp"

#include <zmq_addon.hpp>

#include <iterator>
#include <utility>

namespace posmon {

// -----------------------------------------------------------------------------
// Constructor: store parameters and connect the first socket
// -----------------------------------------------------------------------------
RendererPageSource::RendererPageSource(std::string endpoint,
                                       std::string target_url,
                                       std::string section_marker,
                                       std::chrono::milliseconds timeout,
                                       const ITimeProvider& clock)
    : endpoint_(std::move(endpoint)),
      target_url_(std::move(target_url)),
      section_marker_(std::move(section_marker)),
      timeout_(timeout),
      clock_(clock) {
  connect();
}

// -----------------------------------------------------------------------------
// connect(): (re)build the REQ socket
// -----------------------------------------------------------------------------
void RendererPageSource::connect() {
  socket_.reset();

  auto socket =
      std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);

  // linger 0: a pending unanswered request must not keep the context alive
  // at shutdown or when the socket is rebuilt after a timeout.
  socket->set(zmq::sockopt::linger, 0);
  socket->set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout_.count()));
  socket->set(zmq::sockopt::sndtimeo, static_cast<int>(timeout_.count()));
  socket->connect(endpoint_);

  socket_ = std::move(socket);
}

// -----------------------------------------------------------------------------
// makeRequest()
// -----------------------------------------------------------------------------
nlohmann::json RendererPageSource::makeRequest(const char* op) const {
  nlohmann::json j;
  j["op"] = op;
  j["url"] = target_url_;
  j["section"] = section_marker_;
  return j;
}

// -----------------------------------------------------------------------------
// exchange(): one request/reply round trip with timeout recovery
// -----------------------------------------------------------------------------
std::vector<zmq::message_t> RendererPageSource::exchange(
    const nlohmann::json& request, nlohmann::json& header) {
  const std::string payload = request.dump();
  std::vector<zmq::message_t> frames;

  try {
    auto sent = socket_->send(zmq::buffer(payload), zmq::send_flags::none);
    if (!sent.has_value()) {
      connect();
      throw FetchError("renderer at " + endpoint_ + " did not accept request",
                       true);
    }

    auto received = zmq::recv_multipart(*socket_, std::back_inserter(frames));
    if (!received.has_value() || frames.empty()) {
      // The REQ socket is now wedged waiting for a reply that may never come.
      connect();
      throw FetchError("renderer at " + endpoint_ + " timed out after " +
                           std::to_string(timeout_.count()) + " ms",
                       true);
    }
  } catch (const zmq::error_t& e) {
    connect();
    throw FetchError(std::string("renderer I/O error: ") + e.what(), true);
  }

  std::string error;
  bool transient = true;
  try {
    header = nlohmann::json::parse(frames.front().to_string());
    if (!header.is_object()) {
      throw FetchError("renderer reply is not a JSON object", false);
    }
    if (!header.value("ok", false)) {
      error = header.value("error", std::string("renderer reported failure"));
      transient = header.value("transient", true);
    }
  } catch (const nlohmann::json::exception& e) {
    throw FetchError(std::string("malformed renderer reply: ") + e.what(),
                     false);
  }

  if (!error.empty()) {
    throw FetchError(error, transient);
  }

  return frames;
}

// -----------------------------------------------------------------------------
// fetch(): rendered section text
// -----------------------------------------------------------------------------
RawSnapshot RendererPageSource::fetch() {
  nlohmann::json header;
  exchange(makeRequest("snapshot"), header);

  RawSnapshot snapshot;
  try {
    snapshot.text = header.at("text").get<std::string>();
    std::int64_t captured_ms = header.contains("captured_at_ms")
                                   ? header.at("captured_at_ms").get<std::int64_t>()
                                   : clock_.now_ms();
    snapshot.captured_at = ms_to_timestamp(captured_ms);
  } catch (const nlohmann::json::exception& e) {
    throw FetchError(std::string("renderer snapshot reply missing fields: ") +
                         e.what(),
                     false);
  }
  return snapshot;
}

// -----------------------------------------------------------------------------
// captureImage(): screenshot of the located section
// -----------------------------------------------------------------------------
std::optional<std::string> RendererPageSource::captureImage() {
  nlohmann::json header;
  auto frames = exchange(makeRequest("screenshot"), header);

  if (frames.size() < 2 || frames[1].size() == 0) {
    throw FetchError("renderer screenshot reply carried no image frame", false);
  }
  return frames[1].to_string();
}

std::string RendererPageSource::describe() const {
  return "renderer " + endpoint_ + " -> " + target_url_;
}

}  // namespace posmon
