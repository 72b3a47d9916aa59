// =============================================================================
// http_page_source_test.cpp
// =============================================================================
// Tests for posmon::HttpPageSource against a one-shot HTTP server on the
// loopback interface.
//
// Validates:
//   - URL parsing: scheme, host, port, default target
//   - The GET carries the target path and no-cache headers
//   - The HTML body is reduced to text and narrowed to the section
//   - 5xx maps to a transient FetchError, 4xx to a permanent one
//   - A server that never answers times out as a transient FetchError
// =============================================================================

#include "posmon/source/http_page_source.hpp"
#include "posmon/time/simulation_time_provider.hpp"
#include "posmon/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

using namespace std::chrono_literals;

namespace {

// Accepts a single connection, records the request and answers with the
// given status and body. With `hang` set it reads the request and then holds
// the connection open without replying.
class OneShotServer {
 public:
  OneShotServer(http::status status, std::string body, bool hang = false)
      : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
        status_(status),
        body_(std::move(body)),
        hang_(hang) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this] { serve(); });
  }

  ~OneShotServer() { thread_.join(); }

  std::string url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  const http::request<http::string_body>& request() const { return request_; }

 private:
  void serve() {
    beast::error_code ec;
    tcp::socket socket(ioc_);
    acceptor_.accept(socket, ec);
    if (ec) return;

    beast::flat_buffer buffer;
    http::read(socket, buffer, request_, ec);
    if (ec) return;

    if (hang_) {
      std::this_thread::sleep_for(300ms);
      return;
    }

    http::response<http::string_body> res{status_, 11};
    res.set(http::field::content_type, "text/html");
    res.body() = body_;
    res.prepare_payload();
    http::write(socket, res, ec);
    socket.shutdown(tcp::socket::shutdown_both, ec);
  }

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  unsigned short port_{0};
  http::status status_;
  std::string body_;
  bool hang_;
  http::request<http::string_body> request_;
  std::thread thread_;
};

}  // namespace

class HttpPageSourceTest : public ::testing::Test {
 protected:
  posmon::SimulationTimeProvider clock{1'760'000'000'000};
};

// -----------------------------------------------------------------------------
// 1. Only http and https URLs with a host are accepted.
// -----------------------------------------------------------------------------
TEST_F(HttpPageSourceTest, RejectsBadUrls) {
  EXPECT_THROW(posmon::HttpPageSource("ftp://x/", "S", 1000ms, clock),
               std::invalid_argument);
  EXPECT_THROW(posmon::HttpPageSource("http:///path", "S", 1000ms, clock),
               std::invalid_argument);
  EXPECT_THROW(posmon::HttpPageSource("http://host:/", "S", 1000ms, clock),
               std::invalid_argument);
  EXPECT_NO_THROW(
      posmon::HttpPageSource("https://example.test", "S", 1000ms, clock));
}

// -----------------------------------------------------------------------------
// 2. A 200 page is stripped to text and narrowed to the positions section;
//    the request asks for the path with caching disabled.
// -----------------------------------------------------------------------------
TEST_F(HttpPageSourceTest, FetchesAndNarrowsSection) {
  OneShotServer server(
      http::status::ok,
      "<html><body><h1>Model</h1><nav>menu</nav>"
      "<h2>ACTIVE POSITIONS</h2><div>ETH</div><div>SHORT</div>"
      "<script>var x = 1;</script></body></html>");

  posmon::HttpPageSource source(server.url("/models/m?x=1"),
                                "ACTIVE POSITIONS", 2000ms, clock);
  auto snap = source.fetch();

  EXPECT_EQ(server.request().target(), "/models/m?x=1");
  EXPECT_EQ(server.request()[http::field::cache_control],
            "no-cache, no-store, must-revalidate");

  EXPECT_NE(snap.text.find("ETH"), std::string::npos);
  EXPECT_NE(snap.text.find("SHORT"), std::string::npos);
  EXPECT_EQ(snap.text.find("menu"), std::string::npos);
  EXPECT_EQ(snap.text.find("var x"), std::string::npos);
  EXPECT_EQ(posmon::timestamp_to_ms(snap.captured_at), 1'760'000'000'000);
  EXPECT_FALSE(source.captureImage().has_value());
}

// -----------------------------------------------------------------------------
// 3. Server errors are worth retrying; client errors are not.
// -----------------------------------------------------------------------------
TEST_F(HttpPageSourceTest, ServerErrorIsTransient) {
  OneShotServer server(http::status::service_unavailable, "busy");
  posmon::HttpPageSource source(server.url("/"), "S", 2000ms, clock);

  try {
    source.fetch();
    FAIL() << "expected FetchError";
  } catch (const posmon::FetchError& e) {
    EXPECT_TRUE(e.transient());
    EXPECT_NE(std::string(e.what()).find("HTTP 503"), std::string::npos);
  }
}

TEST_F(HttpPageSourceTest, NotFoundIsPermanent) {
  OneShotServer server(http::status::not_found, "gone");
  posmon::HttpPageSource source(server.url("/missing"), "S", 2000ms, clock);

  try {
    source.fetch();
    FAIL() << "expected FetchError";
  } catch (const posmon::FetchError& e) {
    EXPECT_FALSE(e.transient());
    EXPECT_NE(std::string(e.what()).find("HTTP 404"), std::string::npos);
  }
}

// -----------------------------------------------------------------------------
// 4. A server that accepts but never answers hits the deadline.
// Why: The poll loop must not stall on one hung request.
// -----------------------------------------------------------------------------
TEST_F(HttpPageSourceTest, HungServerTimesOut) {
  OneShotServer server(http::status::ok, "", /*hang=*/true);
  posmon::HttpPageSource source(server.url("/"), "S", 100ms, clock);

  auto start = std::chrono::steady_clock::now();
  try {
    source.fetch();
    FAIL() << "expected FetchError";
  } catch (const posmon::FetchError& e) {
    EXPECT_TRUE(e.transient());
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, 280ms);
}
