#pragma once

#include "audio/audio_buffer.hpp"
#include "engine/dispatcher.hpp"
#include "engine/job.hpp"
#include "protocol/codec.hpp"
#include "sessions/result_emitter.hpp"
#include "util/text.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace net = boost::asio;

using SessionStrand = net::strand<net::io_context::executor_type>;

// StreamSession: per-connection streaming state machine.
// States: unconfigured → configured (streaming ⇄ processing) → closed
// Threading model:
// - Every member runs on the session strand: message handlers are called from
//   the connection coroutine, job completions are posted back by the
//   dispatcher. No locks.
// - At most one dispatcher job is in flight (processing_). Chunks arriving
//   meanwhile only grow the buffer; the completion re-evaluates readiness.
// - Flush suspends the calling coroutine until the in-flight job and the
//   final pass complete, so later messages queue behind it.
// - After close/detach, results of jobs still running are discarded.
class StreamSession : public std::enable_shared_from_this<StreamSession> {
public:
  enum class State { unconfigured, configured, closed };

  static constexpr std::size_t kSampleBytes = 2;

  StreamSession(std::uint64_t id, SessionStrand strand,
                engine::ProcessingDispatcher &dispatcher,
                std::shared_ptr<MessageSink> sink)
      : id_(id), strand_(std::move(strand)), dispatcher_(dispatcher),
        emitter_(std::move(sink)), signal_(strand_) {}

  StreamSession(const StreamSession &) = delete;
  StreamSession &operator=(const StreamSession &) = delete;

  // One JSON text frame. Malformed frames are answered with `error` and leave
  // the session untouched.
  void OnText(std::string_view frame, net::yield_context yield) {
    if (state_ == State::closed) {
      return;
    }
    auto msg = protocol::ParseClientMessage(frame);
    if (!msg) {
      emitter_.Error(msg.error().detail);
      return;
    }
    std::visit([&](auto &m) { Handle(m, yield); }, *msg);
  }

  // One binary frame: raw chunk bytes.
  void OnBinary(std::span<const std::uint8_t> bytes, net::yield_context yield) {
    if (state_ == State::closed) {
      return;
    }
    protocol::ChunkRequest req{audio::Bytes(bytes.begin(), bytes.end())};
    Handle(req, yield);
  }

  // Transport is gone. Buffered audio is discarded, in-flight work is left to
  // finish and its result dropped.
  void Detach() {
    if (state_ != State::closed) {
      std::cerr << "[session " << id_ << "] detached with "
                << buffer_.Size() << " unprocessed bytes\n";
    }
    state_ = State::closed;
    emitter_.Detach();
    signal_.cancel();
  }

  std::uint64_t Id() const { return id_; }
  State GetState() const { return state_; }
  bool IsClosed() const { return state_ == State::closed; }
  bool Processing() const { return processing_; }
  std::size_t BufferedBytes() const { return buffer_.Size(); }
  const std::optional<engine::SessionConfig> &Config() const { return config_; }
  const PartialResult &LastPartial() const { return last_; }
  std::size_t JobsSubmitted() const { return jobs_submitted_; }
  // Highest number of this session's jobs ever in flight at once.
  std::size_t PeakInFlight() const { return peak_in_flight_; }

private:
  void Handle(protocol::ConfigRequest &req, net::yield_context) {
    std::string target = text::ToLower(req.targetLanguage);
    const auto &cfg = dispatcher_.Config();
    if (!text::ContainsIgnoreCase(cfg.supportedTargets, target)) {
      emitter_.Error("unsupported target_language '" + req.targetLanguage +
                     "'");
      return;
    }
    std::optional<std::string> source;
    if (req.sourceLanguage.has_value()) {
      source = text::ToLower(*req.sourceLanguage);
      if (!text::ContainsIgnoreCase(engine::RecognisedLanguages(), *source)) {
        emitter_.Error("unsupported source_language '" + *req.sourceLanguage +
                       "'");
        return;
      }
    }
    const bool replaced = config_.has_value();
    config_ = engine::SessionConfig{std::move(source), std::move(target)};
    state_ = State::configured;
    std::cerr << "[session " << id_ << "] "
              << (replaced ? "configuration replaced" : "configured")
              << ": source=" << config_->sourceLanguage.value_or("auto")
              << " target=" << config_->targetLanguage << "\n";
    emitter_.ConfigAccepted(*config_);
  }

  void Handle(protocol::ChunkRequest &req, net::yield_context) {
    if (state_ != State::configured) {
      emitter_.Error("session not configured: send a config message first");
      return;
    }
    buffer_.Append(req.data);
    MaybeSubmitInterim();
  }

  void Handle(protocol::FlushRequest &, net::yield_context yield) {
    if (state_ != State::configured) {
      emitter_.Error("session not configured: send a config message first");
      return;
    }
    flushing_ = true;
    RunFlush(yield);
    flushing_ = false;
    MaybeSubmitInterim();
  }

  void Handle(protocol::CloseRequest &, net::yield_context) {
    std::cerr << "[session " << id_ << "] close requested, discarding "
              << buffer_.Size() << " buffered bytes\n";
    state_ = State::closed;
    signal_.cancel();
  }

  void RunFlush(net::yield_context yield) {
    while (processing_) {
      WaitForCompletion(yield);
      if (state_ == State::closed) {
        return;
      }
    }
    const engine::SessionConfig cfg = *config_;
    if (!buffer_.Empty()) {
      auto r = RunFinal(MakeJob(engine::JobKind::final, buffer_.Snapshot()),
                        yield);
      buffer_.DrainAll();
      short_floor_.reset();
      if (!r.has_value()) {
        return;
      }
      if (r->outcome == engine::Outcome::failed) {
        emitter_.Error("processing failed: " + r->failure);
      } else if (r->outcome == engine::Outcome::transcribed &&
                 !r->text.empty()) {
        Remember(*r, cfg.targetLanguage);
        emitter_.Final(*r, cfg.targetLanguage);
        return;
      }
    }
    // Nothing new was recognised: answer from the last partial result,
    // translating it again only if the target changed since.
    if (last_.FreshFor(cfg.targetLanguage)) {
      emitter_.Final(last_, cfg.targetLanguage);
      return;
    }
    engine::Job job = MakeJob(engine::JobKind::final, {});
    job.carriedText = last_.text;
    job.carriedLanguage = last_.language;
    auto r = RunFinal(std::move(job), yield);
    if (!r.has_value()) {
      return;
    }
    if (r->outcome == engine::Outcome::failed) {
      emitter_.Error("processing failed: " + r->failure);
      PartialResult untranslated = last_;
      untranslated.translated = untranslated.text;
      untranslated.translationSkipped = true;
      emitter_.Final(untranslated, cfg.targetLanguage);
      return;
    }
    Remember(*r, cfg.targetLanguage);
    emitter_.Final(*r, cfg.targetLanguage);
  }

  void MaybeSubmitInterim() {
    if (processing_ || flushing_ || state_ != State::configured) {
      return;
    }
    if (!buffer_.Ready(dispatcher_.Config().interimThresholdBytes)) {
      return;
    }
    // Interim passes take whole s16 samples only, so the bytes left behind
    // after DrainFront still start on a sample boundary.
    const std::size_t aligned = buffer_.AlignedSize(kSampleBytes);
    if (aligned == 0) {
      return;
    }
    // The same bytes were already found too short; wait for more audio.
    if (short_floor_.has_value() && aligned <= *short_floor_) {
      return;
    }
    BeginJob();
    dispatcher_.Submit(
        MakeJob(engine::JobKind::interim, buffer_.Snapshot(aligned)), strand_,
        [self = shared_from_this(),
         target = config_->targetLanguage](engine::JobResult r) {
          self->OnInterimDone(std::move(r), target);
        });
  }

  void OnInterimDone(engine::JobResult r, const std::string &target) {
    EndJob();
    signal_.cancel();
    if (state_ == State::closed) {
      return;
    }
    if (r.outcome == engine::Outcome::too_short) {
      short_floor_ = r.submittedBytes;
    } else {
      buffer_.DrainFront(r.submittedBytes);
      short_floor_.reset();
    }
    if (r.outcome == engine::Outcome::transcribed && !r.text.empty()) {
      Remember(r, target);
    }
    emitter_.Interim(r);
    MaybeSubmitInterim();
  }

  std::optional<engine::JobResult> RunFinal(engine::Job job,
                                            net::yield_context yield) {
    BeginJob();
    final_result_.reset();
    dispatcher_.Submit(std::move(job), strand_,
                       [self = shared_from_this()](engine::JobResult r) {
                         self->EndJob();
                         self->final_result_ = std::move(r);
                         self->signal_.cancel();
                       });
    while (!final_result_.has_value()) {
      WaitForCompletion(yield);
      if (state_ == State::closed) {
        return std::nullopt;
      }
    }
    return std::exchange(final_result_, std::nullopt);
  }

  // Suspends until a completion handler cancels the signal timer.
  void WaitForCompletion(net::yield_context yield) {
    boost::system::error_code ec;
    signal_.expires_at(net::steady_timer::time_point::max());
    signal_.async_wait(yield[ec]);
  }

  engine::Job MakeJob(engine::JobKind kind, audio::Bytes bytes) const {
    engine::Job job;
    job.sessionId = id_;
    job.kind = kind;
    job.audio = std::move(bytes);
    job.config = *config_;
    return job;
  }

  void Remember(const engine::JobResult &r, const std::string &target) {
    last_.text = r.text;
    last_.language = r.detectedLanguage;
    last_.translated = r.translatedText;
    last_.translationSkipped = r.translationSkipped;
    last_.target = target;
  }

  void BeginJob() {
    processing_ = true;
    ++jobs_submitted_;
    ++in_flight_;
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
  }

  void EndJob() {
    processing_ = false;
    --in_flight_;
  }

  std::uint64_t id_;
  SessionStrand strand_;
  engine::ProcessingDispatcher &dispatcher_;
  ResultEmitter emitter_;
  net::steady_timer signal_;

  State state_ = State::unconfigured;
  std::optional<engine::SessionConfig> config_;
  audio::AudioBuffer buffer_;
  bool processing_ = false;
  bool flushing_ = false;
  std::optional<std::size_t> short_floor_;
  std::optional<engine::JobResult> final_result_;
  PartialResult last_;

  std::size_t jobs_submitted_ = 0;
  std::size_t in_flight_ = 0;
  std::size_t peak_in_flight_ = 0;
};
