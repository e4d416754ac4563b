#pragma once

#include "net/ws_ops.hpp"
#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ssl.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace net = boost::asio;
namespace ssl = net::ssl;

// Reactor
// Threading model:
// - Owns the io_context shared by the listener and every connection
// - Runs io_context::run() on N std::jthread workers; sessions execute as
//   coroutines on these threads, serialised per connection by strands
// - Owns the server TLS context, used only when a certificate is loaded
class Reactor {
public:
  Reactor() : ssl_ctx_(ssl::context::tls_server) {
    ssl_ctx_.set_options(ssl::context::default_workarounds |
                         ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                         ssl::context::single_dh_use);
  }

  net::io_context &GetIoContext() { return ioc_; }
  ssl::context &GetSslContext() { return ssl_ctx_; }
  bool TlsEnabled() const { return tls_loaded_; }

  // PEM certificate chain and private key for wss://.
  wsops::Status LoadCertificate(const std::string &certFile,
                                const std::string &keyFile) {
    boost::system::error_code ec;
    ssl_ctx_.use_certificate_chain_file(certFile, ec);
    if (!ec) {
      ssl_ctx_.use_private_key_file(keyFile, ssl::context::pem, ec);
    }
    if (ec) {
      return std::unexpected(ec);
    }
    tls_loaded_ = true;
    return {};
  }

  void Start(int numThreads = 1) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
  }

  // Stop and wait for every worker to leave run().
  void Join() {
    Stop();
    threads_.clear();
  }

  ~Reactor() { Join(); }

private:
  net::io_context ioc_;
  ssl::context ssl_ctx_;
  bool tls_loaded_ = false;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};
