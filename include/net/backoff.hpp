#pragma once

#include <algorithm>
#include <utility> // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstddef>

// namespace retry: exponential backoff for the accept loop. Transient accept
// failures (descriptor exhaustion, aborted handshakes) are retried after a
// growing pause instead of spinning.
namespace retry {

namespace net = boost::asio;

struct Backoff {
  std::size_t current_ms = 50;
  std::size_t max_ms = 2000;

  void Reset() { current_ms = 50; }
  std::size_t Next() {
    std::size_t v = current_ms;
    current_ms = std::min(max_ms, current_ms * 2);
    return v;
  }
};

template <typename Executor>
inline void WaitAsync(const Executor &ex, net::yield_context yield,
                      std::size_t ms) {
  boost::system::error_code ec;
  net::steady_timer t(ex);
  t.expires_after(std::chrono::milliseconds(ms));
  t.async_wait(yield[ec]);
  (void)ec;
}

} // namespace retry
