#pragma once

#include <utility> // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <string>

// namespace wsops: server-side connection setup steps. Each step returns
// its error code inside std::expected; none of them throws.
namespace wsops {

namespace net = boost::asio;
namespace ssl = net::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using Status = std::expected<void, beast::error_code>;
using UpgradeRequest = http::request<http::string_body>;

inline constexpr std::chrono::seconds kHandshakeTimeout{30};
// Largest accepted client frame; base64 chunks are ~4/3 of the audio size.
inline constexpr std::size_t kMaxFrameBytes = 16u * 1024u * 1024u;

inline Status MakeStatus(const beast::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

inline void SetTcpNoDelay(beast::tcp_stream &stream) {
  beast::error_code ec;
  stream.socket().set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec;
}

inline Status AsyncTlsAccept(beast::ssl_stream<beast::tcp_stream> &stream,
                             net::yield_context yield) {
  beast::error_code ec;
  beast::get_lowest_layer(stream).expires_after(kHandshakeTimeout);
  stream.async_handshake(ssl::stream_base::server, yield[ec]);
  return MakeStatus(ec);
}

// Reads the HTTP upgrade request from the layer below the websocket.
template <typename NextLayer>
inline Status AsyncReadUpgrade(NextLayer &stream, beast::flat_buffer &buffer,
                               UpgradeRequest &req, net::yield_context yield) {
  beast::error_code ec;
  beast::get_lowest_layer(stream).expires_after(kHandshakeTimeout);
  http::async_read(stream, buffer, req, yield[ec]);
  return MakeStatus(ec);
}

// Answers a request that will not be upgraded with a plain HTTP error.
template <typename NextLayer>
inline Status AsyncRejectUpgrade(NextLayer &stream, const UpgradeRequest &req,
                                 http::status status, std::string body,
                                 const std::string &serverName,
                                 net::yield_context yield) {
  http::response<http::string_body> res{status, req.version()};
  res.set(http::field::server, serverName);
  res.set(http::field::content_type, "text/plain");
  res.keep_alive(false);
  res.body() = std::move(body);
  res.prepare_payload();
  beast::error_code ec;
  http::async_write(stream, res, yield[ec]);
  return MakeStatus(ec);
}

// Server-side options: suggested timeouts, permessage-deflate off, frame
// size limit, Server header on the handshake response.
template <typename WS>
inline void ConfigureWebSocket(WS &ws, const std::string &serverName,
                               bool disablePmd = true) {
  beast::get_lowest_layer(ws).expires_never();
  ws.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::server));
  if (disablePmd) {
    websocket::permessage_deflate pmd;
    pmd.client_enable = false;
    pmd.server_enable = false;
    ws.set_option(pmd);
  }
  ws.read_message_max(kMaxFrameBytes);
  ws.set_option(websocket::stream_base::decorator(
      [serverName](websocket::response_type &res) {
        res.set(http::field::server, serverName);
      }));
}

template <typename WS>
inline Status AsyncWsAccept(WS &ws, const UpgradeRequest &req,
                            net::yield_context yield) {
  beast::error_code ec;
  ws.async_accept(req, yield[ec]);
  return MakeStatus(ec);
}

// True for the error codes a normally closing peer produces.
inline bool IsOrderlyClose(const beast::error_code &ec) {
  return ec == websocket::error::closed || ec == net::error::eof ||
         ec == net::error::connection_reset ||
         ec == net::error::operation_aborted;
}

} // namespace wsops
