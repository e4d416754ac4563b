#pragma once

#include "core/isession.hpp"
#include "engine/dispatcher.hpp"
#include "net/backoff.hpp"
#include "net/ws_ops.hpp"
#include "sessions/ws_session.hpp"
#include "util/branch.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <cstdint>
#include <iostream>
#include <memory>

// Listener
// Threading model:
// - Accept loop is a coroutine on the acceptor's own strand.
// - Every accepted socket gets a fresh strand; its session runs there.
// - Accept errors are retried with exponential backoff; operation_aborted
//   (acceptor closed by Stop) ends the loop.
class Listener {
public:
  Listener(net::io_context &ioc, engine::ProcessingDispatcher &dispatcher,
           ssl::context *tls = nullptr)
      : ioc_(ioc), strand_(net::make_strand(ioc)), acceptor_(strand_),
        dispatcher_(dispatcher), tls_(tls) {}

  wsops::Status Open(const tcp::endpoint &endpoint) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    return wsops::MakeStatus(ec);
  }

  tcp::endpoint LocalEndpoint() const {
    beast::error_code ec;
    return acceptor_.local_endpoint(ec);
  }

  void Start() {
    net::spawn(strand_,
               [this](net::yield_context yield) { this->AcceptLoop(yield); });
  }

  void Stop() {
    net::post(strand_, [this] {
      beast::error_code ec;
      acceptor_.close(ec);
    });
  }

  std::size_t ActiveSessions() const {
    return active_->load(std::memory_order_relaxed);
  }
  std::uint64_t Accepted() const { return next_id_ - 1; }

private:
  void AcceptLoop(net::yield_context yield) {
    retry::Backoff backoff;
    for (;;) {
      SessionStrand strand = net::make_strand(ioc_);
      tcp::socket socket(strand);
      beast::error_code ec;
      acceptor_.async_accept(socket, yield[ec]);
      if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
        break;
      }
      if (BRANCH_UNLIKELY(ec)) {
        std::cerr << "[listener] accept error: " << ec.message() << "\n";
        retry::WaitAsync(strand_, yield, backoff.Next());
        continue;
      }
      backoff.Reset();
      MakeSession(next_id_++, std::move(strand), std::move(socket))->Start();
    }
    std::cerr << "[listener] stopped after " << Accepted()
              << " connections\n";
  }

  std::shared_ptr<ISession> MakeSession(std::uint64_t id, SessionStrand strand,
                                        tcp::socket socket) {
    if (tls_ != nullptr) {
      return std::make_shared<WebSocketSession<TlsWebSocket>>(
          id, std::move(strand), dispatcher_, active_, std::move(socket),
          *tls_);
    }
    return std::make_shared<WebSocketSession<PlainWebSocket>>(
        id, std::move(strand), dispatcher_, active_, std::move(socket));
  }

  net::io_context &ioc_;
  SessionStrand strand_;
  tcp::acceptor acceptor_;
  engine::ProcessingDispatcher &dispatcher_;
  ssl::context *tls_;
  std::shared_ptr<std::atomic<std::size_t>> active_ =
      std::make_shared<std::atomic<std::size_t>>(0);
  std::atomic<std::uint64_t> next_id_{1};
};
