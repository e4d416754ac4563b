#pragma once

#include "engine/job.hpp"
#include "protocol/codec.hpp"
#include <memory>
#include <string>
#include <utility>

// MessageSink: the single ordered outbound channel of one connection.
// Send() is only called from the owning session's strand; implementations
// queue frames and write them in call order.
class MessageSink {
public:
  virtual ~MessageSink() = default;
  virtual void Send(std::string frame) = 0;
};

// Last non-empty result of a session, kept for final-result fallback and for
// idempotent re-emission on repeated flush.
struct PartialResult {
  std::string text;
  std::string language;
  std::string translated;
  std::string target;
  bool translationSkipped = false;

  bool FreshFor(const std::string &t) const { return text.empty() || target == t; }
};

// ResultEmitter maps dispatcher outcomes to wire messages. Interim outcomes
// produce at most one message; a final pass always produces one `final`,
// preceded by `error` when the attempt failed.
class ResultEmitter {
public:
  explicit ResultEmitter(std::shared_ptr<MessageSink> sink)
      : sink_(std::move(sink)) {}

  // Drops the sink; later emissions are discarded.
  void Detach() { sink_.reset(); }

  void ConfigAccepted(const engine::SessionConfig &cfg) {
    Send(protocol::Serialize(
        protocol::ConfigAck{cfg.sourceLanguage, cfg.targetLanguage}));
  }

  void Error(std::string detail) {
    Send(protocol::Serialize(protocol::ErrorReply{std::move(detail)}));
  }

  // Returns true if an `interim` message was sent.
  bool Interim(const engine::JobResult &r) {
    switch (r.outcome) {
    case engine::Outcome::transcribed:
      if (r.text.empty()) {
        return false;
      }
      Send(protocol::Serialize(
          protocol::InterimResult{r.text, r.detectedLanguage}));
      return true;
    case engine::Outcome::failed:
      Error("processing failed: " + r.failure);
      return false;
    case engine::Outcome::no_audio:
    case engine::Outcome::too_short:
      return false;
    }
    return false;
  }

  void Final(const engine::JobResult &r, const std::string &target) {
    Send(protocol::Serialize(protocol::FinalResult{
        r.text, r.translatedText, r.detectedLanguage, target,
        r.translationSkipped}));
  }

  void Final(const PartialResult &p, const std::string &target) {
    Send(protocol::Serialize(protocol::FinalResult{
        p.text, p.text.empty() ? std::string() : p.translated,
        p.language.empty() ? std::string("unknown") : p.language, target,
        p.translationSkipped}));
  }

private:
  void Send(std::string frame) {
    if (sink_) {
      sink_->Send(std::move(frame));
    }
  }

  std::shared_ptr<MessageSink> sink_;
};
