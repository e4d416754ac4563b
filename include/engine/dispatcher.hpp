#pragma once

#include "engine/config.hpp"
#include "engine/job.hpp"
#include "engine/services.hpp"
#include "logging/journal.hpp"
#include "util/text.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <exception>
#include <iostream>
#include <utility>

namespace engine {

namespace net = boost::asio;

// ProcessingDispatcher
// Threading model:
// - Owns a boost::asio::thread_pool of fixed size shared by every session;
//   when all workers are busy further jobs wait in the pool's queue
// - Run() executes on a pool thread and never touches session state; the
//   result is posted back to the submitting session's executor
// - Every collaborator exception is converted to Outcome::failed here and
//   never reaches the connection coroutine
class ProcessingDispatcher {
public:
  ProcessingDispatcher(SpeechServices services, EngineConfig config,
                       std::size_t workers,
                       logging::JobJournal *journal = nullptr)
      : services_(std::move(services)), config_(std::move(config)),
        workers_(std::max<std::size_t>(1, workers)), pool_(workers_),
        journal_(journal) {}

  ~ProcessingDispatcher() { Join(); }

  ProcessingDispatcher(const ProcessingDispatcher &) = delete;
  ProcessingDispatcher &operator=(const ProcessingDispatcher &) = delete;

  const EngineConfig &Config() const { return config_; }
  std::size_t Workers() const { return workers_; }

  // Queues `job` on the pool. `handler(JobResult)` is invoked through
  // `completion` once the job finishes. The work guard keeps the completion
  // executor's context alive while the job is queued or running.
  template <typename Executor, typename Handler>
  void Submit(Job job, const Executor &completion, Handler &&handler) {
    submitted_.fetch_add(1, std::memory_order_relaxed);
    net::post(pool_, [this, job = std::move(job), completion,
                      handler = std::forward<Handler>(handler),
                      work = net::make_work_guard(completion)]() mutable {
      JobResult result = Run(job);
      completed_.fetch_add(1, std::memory_order_relaxed);
      if (journal_ != nullptr) {
        journal_->Record(logging::MakeJobEvent(job.sessionId, result));
      }
      net::post(completion, [handler = std::move(handler),
                             result = std::move(result)]() mutable {
        handler(std::move(result));
      });
    });
  }

  // decode → minimum duration → transcribe → translate
  JobResult Run(const Job &job) {
    const std::int64_t started = timeutil::SteadyMillis();
    ActiveScope active(*this);
    JobResult result;
    result.kind = job.kind;
    result.submittedBytes = job.audio.size();
    try {
      if (job.audio.empty()) {
        RunCarried(job, result);
      } else {
        RunAudio(job, result);
      }
    } catch (const std::exception &e) {
      result.outcome = Outcome::failed;
      result.failure = e.what();
      std::cerr << "[dispatcher] session " << job.sessionId << " "
                << ToString(job.kind) << " job failed: " << e.what() << "\n";
    }
    result.latencyMs = timeutil::SteadyMillis() - started;
    return result;
  }

  void Join() { pool_.join(); }

  // Abandons queued jobs; running jobs finish and their results are still
  // posted.
  void Stop() { pool_.stop(); }

  std::size_t Submitted() const {
    return submitted_.load(std::memory_order_relaxed);
  }
  std::size_t Completed() const {
    return completed_.load(std::memory_order_relaxed);
  }
  // Highest number of jobs observed running at the same time.
  std::size_t PeakActive() const {
    return peak_active_.load(std::memory_order_relaxed);
  }

private:
  struct ActiveScope {
    explicit ActiveScope(ProcessingDispatcher &d) : d_(d) {
      const std::size_t now =
          d_.active_.fetch_add(1, std::memory_order_acq_rel) + 1;
      std::size_t peak = d_.peak_active_.load(std::memory_order_relaxed);
      while (now > peak && !d_.peak_active_.compare_exchange_weak(
                               peak, now, std::memory_order_relaxed)) {
      }
    }
    ~ActiveScope() { d_.active_.fetch_sub(1, std::memory_order_acq_rel); }
    ProcessingDispatcher &d_;
  };

  static bool IsDigitalSilence(const audio::Samples &samples) {
    return std::all_of(samples.begin(), samples.end(),
                       [](float s) { return s == 0.0f; });
  }

  void RunAudio(const Job &job, JobResult &result) {
    const audio::Samples samples = services_.decoder->Decode(job.audio);
    result.samples = samples.size();
    if (samples.empty() || IsDigitalSilence(samples)) {
      result.outcome = Outcome::no_audio;
      return;
    }
    if (samples.size() < config_.minSamples) {
      std::cerr << "[dispatcher] session " << job.sessionId << " "
                << samples.size() << " samples below minimum "
                << config_.minSamples << ", waiting for more audio\n";
      result.outcome = Outcome::too_short;
      return;
    }
    Transcript t =
        services_.transcriber->Transcribe(samples, job.config.sourceLanguage);
    result.text = text::CleanTranscript(t.text);
    result.detectedLanguage = t.language.empty() ? "unknown" : t.language;
    result.outcome = Outcome::transcribed;
    Translate(job, result);
  }

  // Final pass with nothing buffered: re-use the last partial result.
  void RunCarried(const Job &job, JobResult &result) {
    if (job.kind != JobKind::final) {
      result.outcome = Outcome::no_audio;
      return;
    }
    result.text = job.carriedText;
    result.detectedLanguage =
        job.carriedLanguage.empty() ? "unknown" : job.carriedLanguage;
    result.outcome = Outcome::transcribed;
    Translate(job, result);
  }

  void Translate(const Job &job, JobResult &result) {
    result.translatedText = result.text;
    const std::string &target = job.config.targetLanguage;
    if (result.text.empty() || target == result.detectedLanguage) {
      return;
    }
    try {
      result.translatedText = services_.translator->Translate(
          result.text, result.detectedLanguage, target);
    } catch (const UnsupportedPair &) {
      result.translationSkipped = true;
      result.translatedText = result.text;
    }
  }

  SpeechServices services_;
  EngineConfig config_;
  std::size_t workers_;
  net::thread_pool pool_;
  logging::JobJournal *journal_;
  std::atomic<std::size_t> submitted_{0};
  std::atomic<std::size_t> completed_{0};
  std::atomic<std::size_t> active_{0};
  std::atomic<std::size_t> peak_active_{0};
};

} // namespace engine
