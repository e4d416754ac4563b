#pragma once

#include "io/file_writer.hpp"
#include "logging/job_event.hpp"
#include "util/branch.hpp"
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <sys/uio.h>
#include <thread>

namespace logging {

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_relaxed);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// JobJournal
// Threading model:
// - Dispatcher pool threads are the producers: Record() is a lock-free push
//   that never blocks a job; when the queue is full the event is counted as
//   dropped
// - A single background thread drains the queue and appends one text line
//   per job with batched writev
// Line format:
//   <epoch_ms> session=<id> kind=<interim|final> outcome=<o> samples=<n>
//   latency_ms=<n> translation_skipped=<0|1>
class JobJournal : public LoggerBase<JobJournal> {
public:
  static constexpr std::size_t kLineMax = 192;

  JobJournal() = default;

  ~JobJournal() {
    Join();
    file_.Close();
  }

  bool Open(const std::string &path) { return file_.Open(path); }
  bool IsOpen() const { return file_.IsOpen(); }

  bool Record(const JobEvent &ev) {
    if (BRANCH_UNLIKELY(!queue_.push(ev))) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    return true;
  }

  std::size_t Dropped() const {
    return dropped_.load(std::memory_order_relaxed);
  }
  std::size_t Written() const {
    return written_.load(std::memory_order_relaxed);
  }

  void RunLoop() {
    for (;;) {
      if (BRANCH_UNLIKELY(!this->running_.load(std::memory_order_relaxed))) {
        break;
      }
      if (Drain() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
    }
    Drain();
  }

  // Formats one event; returns the number of characters written to `out`.
  static std::size_t FormatLine(const JobEvent &ev, char (&out)[kLineMax]) {
    char *p = out;
    char *const end = out + kLineMax;
    auto num = [&](auto v) {
      auto [ptr, ec] = std::to_chars(p, end, v);
      if (ec == std::errc()) {
        p = ptr;
      }
    };
    auto str = [&](std::string_view s) {
      for (char c : s) {
        if (p == end) {
          return;
        }
        *p++ = c;
      }
    };
    num(ev.finished_ms);
    str(" session=");
    num(ev.session_id);
    str(" kind=");
    str(engine::ToString(ev.kind));
    str(" outcome=");
    str(engine::ToString(ev.outcome));
    str(" samples=");
    num(ev.samples);
    str(" latency_ms=");
    num(ev.latency_ms);
    str(" translation_skipped=");
    str(ev.translation_skipped ? "1" : "0");
    str("\n");
    return static_cast<std::size_t>(p - out);
  }

private:
  static constexpr int kBatch = 64;

  // batch consume to reduce syscalls
  std::size_t Drain() {
    std::size_t total = 0;
    JobEvent ev;
    struct iovec iov[kBatch];
    char lines[kBatch][kLineMax];
    int cnt = 0;
    while (queue_.pop(ev)) {
      const std::size_t len = FormatLine(ev, lines[cnt]);
      iov[cnt] = {lines[cnt], len};
      ++cnt;
      ++total;
      if (cnt == kBatch) {
        Flush(iov, cnt);
        cnt = 0;
      }
    }
    if (cnt > 0) {
      Flush(iov, cnt);
    }
    return total;
  }

  void Flush(struct iovec *iov, int cnt) {
    if (file_.IsOpen() && file_.WritevAll(iov, cnt)) {
      written_.fetch_add(static_cast<std::size_t>(cnt),
                         std::memory_order_relaxed);
    }
  }

  JobEventQueue queue_;
  io::AppendFile file_;
  std::atomic<std::size_t> dropped_{0};
  std::atomic<std::size_t> written_{0};
};

} // namespace logging
