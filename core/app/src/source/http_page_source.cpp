#include "posmon/source/http_page_source.hpp"
#include "posmon/source/page_text.hpp"
#include "posmon/time/time_utils.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace posmon {

namespace {

constexpr const char* kUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/124.0.0.0 Safari/537.36";

using Response = http::response<http::string_body>;

template <typename Stream>
struct IsTlsStream : std::false_type {};

template <typename Next>
struct IsTlsStream<beast::ssl_stream<Next>> : std::true_type {};

// -----------------------------------------------------------------------------
// performRequest(): connect [→ handshake] → write → read on one deadline
// -----------------------------------------------------------------------------
// Runs the chain to completion on `ioc`. The tcp_stream deadline set before
// connecting applies to every operation that follows, so ioc.run() returns
// with beast::error::timeout at the latest when it expires.
// -----------------------------------------------------------------------------
template <typename Stream>
Response performRequest(net::io_context& ioc, Stream& stream,
                        const tcp::resolver::results_type& endpoints,
                        http::request<http::empty_body>& req,
                        std::chrono::milliseconds timeout) {
  beast::error_code result;
  beast::flat_buffer buffer;
  Response res;

  auto& lowest = beast::get_lowest_layer(stream);
  lowest.expires_after(timeout);

  lowest.async_connect(
      endpoints, [&](beast::error_code ec, const tcp::endpoint&) {
        if (ec) {
          result = ec;
          return;
        }

        auto exchange = [&] {
          http::async_write(
              stream, req, [&](beast::error_code wec, std::size_t) {
                if (wec) {
                  result = wec;
                  return;
                }
                http::async_read(stream, buffer, res,
                                 [&](beast::error_code rec, std::size_t) {
                                   result = rec;
                                 });
              });
        };

        if constexpr (IsTlsStream<Stream>::value) {
          stream.async_handshake(ssl::stream_base::client,
                                 [&, exchange](beast::error_code hec) {
                                   if (hec) {
                                     result = hec;
                                     return;
                                   }
                                   exchange();
                                 });
        } else {
          exchange();
        }
      });

  ioc.run();

  if (result) {
    throw beast::system_error(result);
  }
  return res;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: split the URL once
// -----------------------------------------------------------------------------
HttpPageSource::HttpPageSource(const std::string& url,
                               std::string section_marker,
                               std::chrono::milliseconds timeout,
                               const ITimeProvider& clock)
    : url_(url),
      section_marker_(std::move(section_marker)),
      timeout_(timeout),
      clock_(clock) {
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    tls_ = true;
    port_ = "443";
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    port_ = "80";
    rest = url.substr(7);
  } else {
    throw std::invalid_argument("unsupported URL scheme: " + url);
  }

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  target_ = (slash == std::string::npos) ? "/" : rest.substr(slash);

  auto colon = authority.find(':');
  if (colon != std::string::npos) {
    port_ = authority.substr(colon + 1);
    authority.resize(colon);
  }
  if (authority.empty() || port_.empty()) {
    throw std::invalid_argument("malformed URL: " + url);
  }
  host_ = std::move(authority);
}

// -----------------------------------------------------------------------------
// fetch(): GET, strip, narrow to section
// -----------------------------------------------------------------------------
RawSnapshot HttpPageSource::fetch() {
  http::request<http::empty_body> req{http::verb::get, target_, 11};
  req.set(http::field::host, host_);
  req.set(http::field::user_agent, kUserAgent);
  req.set(http::field::accept_language, "en-US");
  req.set(http::field::cache_control, "no-cache, no-store, must-revalidate");
  req.set(http::field::pragma, "no-cache");
  req.set(http::field::expires, "0");

  Response res;

  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto const endpoints = resolver.resolve(host_, port_);

    if (tls_) {
      ssl::context ctx(ssl::context::tlsv12_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(ssl::verify_peer);

      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
        throw FetchError("TLS SNI setup failed for " + host_);
      }
      res = performRequest(ioc, stream, endpoints, req, timeout_);
    } else {
      beast::tcp_stream stream(ioc);
      res = performRequest(ioc, stream, endpoints, req, timeout_);
    }
  } catch (const boost::system::system_error& e) {
    throw FetchError("GET " + url_ + " failed: " + e.what(), true);
  }

  unsigned status = res.result_int();
  if (status >= 500) {
    throw FetchError("GET " + url_ + " returned HTTP " +
                         std::to_string(status),
                     true);
  }
  if (status >= 300) {
    throw FetchError("GET " + url_ + " returned HTTP " +
                         std::to_string(status),
                     false);
  }

  RawSnapshot snapshot;
  snapshot.text = extractSection(htmlToText(res.body()), section_marker_);
  snapshot.captured_at = ms_to_timestamp(clock_.now_ms());
  return snapshot;
}

std::string HttpPageSource::describe() const { return "http " + url_; }

}  // namespace posmon
