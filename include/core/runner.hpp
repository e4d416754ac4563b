#pragma once

#include "core/reactor.hpp"
#include "engine/config.hpp"
#include "engine/dispatcher.hpp"
#include "engine/services.hpp"
#include "logging/journal.hpp"
#include "net/listener.hpp"
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>

// Runner composition/threading overview:
// - Reactor: io_context on N threads; hosts the Listener accept coroutine and
//   one coroutine per WebSocketSession, each on its own strand
// - ProcessingDispatcher: fixed thread_pool running decode → transcribe →
//   translate; results are posted back to the owning session strand
// - JobJournal: dedicated jthread; drains job events from a lock-free queue
//   with batched writev (only when --journal is given)
// - Main thread: waits for SIGINT/SIGTERM or the deadline, then stops the
//   listener, the reactor, the dispatcher and the journal in that order
struct RunOptions {
  std::string address = "0.0.0.0";
  unsigned short port = 8765;
  int reactorThreads = 1;
  std::size_t workers = 2;
  engine::EngineConfig engineConfig;
  std::optional<std::string> certFile;
  std::optional<std::string> keyFile;
  std::optional<std::string> journalPath;
  int seconds = 0;
};

inline int Run(const RunOptions &opt, engine::SpeechServices services) {
  // Init
  logging::JobJournal journal;
  if (opt.journalPath.has_value()) {
    if (!journal.Open(*opt.journalPath)) {
      std::cerr << "[runner] cannot open journal '" << *opt.journalPath
                << "'\n";
      return 1;
    }
    journal.Start();
  }

  Reactor reactor;
  if (opt.certFile.has_value() != opt.keyFile.has_value()) {
    std::cerr << "[runner] --cert and --key must be given together\n";
    return 1;
  }
  if (opt.certFile.has_value()) {
    if (auto st = reactor.LoadCertificate(*opt.certFile, *opt.keyFile); !st) {
      std::cerr << "[runner] cannot load certificate: " << st.error().message()
                << "\n";
      return 1;
    }
  }

  engine::ProcessingDispatcher dispatcher(
      std::move(services), opt.engineConfig, opt.workers,
      journal.IsOpen() ? &journal : nullptr);

  boost::system::error_code ec;
  auto address = net::ip::make_address(opt.address, ec);
  if (ec) {
    std::cerr << "[runner] invalid address '" << opt.address
              << "': " << ec.message() << "\n";
    return 1;
  }
  Listener listener(reactor.GetIoContext(), dispatcher,
                    reactor.TlsEnabled() ? &reactor.GetSslContext() : nullptr);
  if (auto st = listener.Open(tcp::endpoint(address, opt.port)); !st) {
    std::cerr << "[runner] cannot listen on " << opt.address << ":"
              << opt.port << ": " << st.error().message() << "\n";
    return 1;
  }

  // Start
  listener.Start();
  reactor.Start(opt.reactorThreads);
  std::cerr << "[runner] listening on " << (reactor.TlsEnabled() ? "wss" : "ws")
            << "://" << listener.LocalEndpoint() << protocol::kEndpointPath
            << " (reactor threads=" << opt.reactorThreads
            << ", workers=" << dispatcher.Workers() << ")\n";

  // Wait for a signal or the deadline
  net::io_context signals_ioc;
  net::signal_set signals(signals_ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &err, int signo) {
    if (!err) {
      std::cerr << "[runner] signal " << signo << ", shutting down\n";
    }
    signals_ioc.stop();
  });
  if (opt.seconds > 0) {
    signals_ioc.run_for(std::chrono::seconds(opt.seconds));
  } else {
    signals_ioc.run();
  }

  // Stop
  listener.Stop();
  reactor.Join();
  dispatcher.Stop();
  dispatcher.Join();
  journal.Join();
  std::cerr << "[runner] jobs submitted=" << dispatcher.Submitted()
            << " completed=" << dispatcher.Completed()
            << " peak_concurrency=" << dispatcher.PeakActive();
  if (journal.IsOpen()) {
    std::cerr << " journal_written=" << journal.Written()
              << " journal_dropped=" << journal.Dropped();
  }
  std::cerr << "\n";
  return 0;
}
