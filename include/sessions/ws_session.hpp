#pragma once

#include "core/isession.hpp"
#include "engine/dispatcher.hpp"
#include "net/ws_ops.hpp"
#include "protocol/messages.hpp"
#include "sessions/result_emitter.hpp"
#include "sessions/stream_session.hpp"
#include "util/branch.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <cstdint>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <span>
#include <string_view>
#include <type_traits>

namespace ssl = net::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using PlainWebSocket = websocket::stream<beast::tcp_stream>;
using TlsWebSocket = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

inline constexpr const char *kServerName = "voxbridge/0.1";

// WebSocketSession
// Threading model:
// - One coroutine per connection (spawn) on the connection strand; the
//   socket, the StreamSession and the outbound queue are only touched there.
// - Reads are sequential: the next frame is read only after the previous one
//   was handled, so a flush holds back later client messages.
// - Writes run as a separate completion chain drained from outbox_, which
//   keeps frames in Send() order while a read or a flush is suspended.
template <typename WsStream>
class WebSocketSession
    : public ISession,
      public MessageSink,
      public std::enable_shared_from_this<WebSocketSession<WsStream>> {
  static constexpr bool kTls = std::is_same_v<WsStream, TlsWebSocket>;

public:
  template <typename... StreamArgs>
  WebSocketSession(std::uint64_t id, SessionStrand strand,
                   engine::ProcessingDispatcher &dispatcher,
                   std::shared_ptr<std::atomic<std::size_t>> active,
                   tcp::socket socket,
                   StreamArgs &&...args)
      : id_(id), strand_(std::move(strand)), dispatcher_(dispatcher),
        active_(std::move(active)),
        ws_(std::move(socket), std::forward<StreamArgs>(args)...),
        drained_(strand_) {
    ++*active_;
  }

  ~WebSocketSession() override { --*active_; }

  void Start() override {
    net::spawn(strand_, [self = this->shared_from_this()](
                            net::yield_context yield) { self->Run(yield); });
  }

  std::uint64_t Id() const override { return id_; }

  // Called on the strand by the StreamSession's emitter.
  void Send(std::string frame) override {
    if (BRANCH_UNLIKELY(closing_)) {
      return;
    }
    outbox_.push_back(std::move(frame));
    if (!writing_) {
      WriteNext();
    }
  }

private:
  void Run(net::yield_context yield) {
    if (!Accept(yield)) {
      return;
    }
    std::cerr << "[session " << id_ << "] connected ("
              << active_->load(std::memory_order_relaxed) << " active)\n";
    session_ = std::make_shared<StreamSession>(id_, strand_, dispatcher_,
                                               this->shared_from_this());
    beast::error_code ec = ReadLoop(yield);
    session_->Detach();
    if (!ec) {
      CloseGracefully(yield);
    } else if (!wsops::IsOrderlyClose(ec)) {
      std::cerr << "[session " << id_ << "] read error: " << ec.message()
                << "\n";
    }
    closing_ = true;
    session_.reset();
    std::cerr << "[session " << id_ << "] disconnected\n";
  }

  // TLS handshake, upgrade request, path check, then the websocket accept.
  bool Accept(net::yield_context yield) {
    wsops::SetTcpNoDelay(beast::get_lowest_layer(ws_));
    if constexpr (kTls) {
      auto st = wsops::AsyncTlsAccept(ws_.next_layer(), yield);
      if (BRANCH_UNLIKELY(!st)) {
        return OnSetupError("tls handshake", st.error());
      }
    }
    beast::flat_buffer buffer;
    wsops::UpgradeRequest req;
    if (auto st = wsops::AsyncReadUpgrade(ws_.next_layer(), buffer, req, yield);
        BRANCH_UNLIKELY(!st)) {
      return OnSetupError("read upgrade", st.error());
    }
    std::string_view target(req.target().data(), req.target().size());
    if (auto q = target.find('?'); q != std::string_view::npos) {
      target = target.substr(0, q);
    }
    if (!websocket::is_upgrade(req) || target != protocol::kEndpointPath) {
      const bool wrongPath = target != protocol::kEndpointPath;
      std::cerr << "[session " << id_ << "] rejected request for '" << target
                << "'\n";
      auto st = wsops::AsyncRejectUpgrade(
          ws_.next_layer(), req,
          wrongPath ? http::status::not_found : http::status::upgrade_required,
          wrongPath ? "not found\n" : "websocket upgrade required\n",
          kServerName, yield);
      if (!st) {
        return OnSetupError("reject", st.error());
      }
      return false;
    }
    wsops::ConfigureWebSocket(ws_, kServerName);
    if (auto st = wsops::AsyncWsAccept(ws_, req, yield); BRANCH_UNLIKELY(!st)) {
      return OnSetupError("ws accept", st.error());
    }
    return true;
  }

  beast::error_code ReadLoop(net::yield_context yield) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    for (;;) {
      buffer.clear();
      std::size_t n = ws_.async_read(buffer, yield[ec]);
      if (BRANCH_UNLIKELY(ec)) {
        return ec;
      }
      const void *data = buffer.data().data();
      if (ws_.got_text()) {
        session_->OnText(
            std::string_view(static_cast<const char *>(data), n), yield);
      } else {
        session_->OnBinary(
            std::span<const std::uint8_t>(
                static_cast<const std::uint8_t *>(data), n),
            yield);
      }
      if (session_->IsClosed()) {
        return {};
      }
    }
  }

  // Client asked to close: let queued replies go out, then send a close frame.
  void CloseGracefully(net::yield_context yield) {
    beast::error_code ec;
    while (writing_) {
      drained_.expires_at(net::steady_timer::time_point::max());
      drained_.async_wait(yield[ec]);
    }
    closing_ = true;
    ws_.async_close(websocket::close_code::normal, yield[ec]);
    if (ec && !wsops::IsOrderlyClose(ec)) {
      std::cerr << "[session " << id_ << "] close error: " << ec.message()
                << "\n";
    }
  }

  void WriteNext() {
    writing_ = true;
    ws_.text(true);
    ws_.async_write(
        net::buffer(outbox_.front()),
        net::bind_executor(strand_, [self = this->shared_from_this()](
                                        beast::error_code ec, std::size_t) {
          self->OnWrite(ec);
        }));
  }

  void OnWrite(const beast::error_code &ec) {
    outbox_.pop_front();
    if (BRANCH_UNLIKELY(ec)) {
      if (!wsops::IsOrderlyClose(ec)) {
        std::cerr << "[session " << id_ << "] write error: " << ec.message()
                  << "\n";
      }
      outbox_.clear();
      closing_ = true;
    }
    if (!outbox_.empty()) {
      WriteNext();
      return;
    }
    writing_ = false;
    drained_.cancel();
  }

  bool OnSetupError(const char *stage, const beast::error_code &ec) {
    std::cerr << "[session " << id_ << "] " << stage
              << " error: " << ec.message() << "\n";
    return false;
  }

  std::uint64_t id_;
  SessionStrand strand_;
  engine::ProcessingDispatcher &dispatcher_;
  std::shared_ptr<std::atomic<std::size_t>> active_;
  WsStream ws_;
  net::steady_timer drained_;
  std::shared_ptr<StreamSession> session_;
  std::deque<std::string> outbox_;
  bool writing_ = false;
  bool closing_ = false;
};
