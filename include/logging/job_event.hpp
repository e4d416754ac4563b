#pragma once

#include "engine/job.hpp"
#include "util/time.hpp"
#include <boost/lockfree/queue.hpp>
#include <cstdint>

namespace logging {

// One completed dispatcher job. Trivially copyable so it can travel through
// the lock-free queue.
struct JobEvent {
  std::int64_t finished_ms;
  std::uint64_t session_id;
  std::uint64_t samples;
  std::int64_t latency_ms;
  engine::JobKind kind;
  engine::Outcome outcome;
  bool translation_skipped;
};

inline constexpr std::size_t kJobEventCapacity = 4096;

// Multi-producer (pool threads), single consumer (journal thread).
using JobEventQueue =
    boost::lockfree::queue<JobEvent,
                           boost::lockfree::capacity<kJobEventCapacity>>;

inline JobEvent MakeJobEvent(std::uint64_t session_id,
                             const engine::JobResult &r) {
  return JobEvent{timeutil::EpochMillisUtc(),
                  session_id,
                  static_cast<std::uint64_t>(r.samples),
                  r.latencyMs,
                  r.kind,
                  r.outcome,
                  r.translationSkipped};
}

} // namespace logging
