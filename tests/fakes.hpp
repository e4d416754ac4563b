#pragma once

#include "audio/audio_buffer.hpp"
#include "audio/chunk_decoder.hpp"
#include "engine/config.hpp"
#include "engine/dispatcher.hpp"
#include "engine/services.hpp"
#include "protocol/codec.hpp"
#include "sessions/result_emitter.hpp"
#include "sessions/stream_session.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fakes {

using json = nlohmann::json;

// Blocks callers of Wait() until Open(); lets a test hold a job on a worker.
class Gate {
public:
  void Close() {
    std::lock_guard lk(m_);
    open_ = false;
  }
  void Open() {
    {
      std::lock_guard lk(m_);
      open_ = true;
    }
    cv_.notify_all();
  }
  void Wait() {
    std::unique_lock lk(m_);
    ++waiters_;
    cv_.notify_all();
    cv_.wait(lk, [this] { return open_; });
    --waiters_;
  }
  // True if `n` callers were blocked at some point before the timeout.
  bool WaitForWaiters(int n, std::chrono::milliseconds timeout =
                                 std::chrono::seconds(5)) {
    std::unique_lock lk(m_);
    return cv_.wait_for(lk, timeout, [&] { return waiters_ >= n; });
  }

private:
  std::mutex m_;
  std::condition_variable cv_;
  bool open_ = true;
  int waiters_ = 0;
};

class FakeTranscriber : public engine::Transcriber {
public:
  engine::Transcript Transcribe(const audio::Samples &samples,
                                const std::optional<std::string> &hint) override {
    std::string text;
    std::string language;
    std::optional<std::string> failure;
    {
      std::lock_guard lk(m_);
      ++calls_;
      sampleCounts_.push_back(samples.size());
      firstSamples_.push_back(samples.empty() ? 0.0f : samples.front());
      hints_.push_back(hint);
      text = text_;
      language = language_;
      failure = failure_;
    }
    gate.Wait();
    if (failure.has_value()) {
      throw std::runtime_error(*failure);
    }
    return {text, hint.value_or(language)};
  }

  void Reply(std::string text, std::string language) {
    std::lock_guard lk(m_);
    text_ = std::move(text);
    language_ = std::move(language);
  }
  void FailWith(std::optional<std::string> reason) {
    std::lock_guard lk(m_);
    failure_ = std::move(reason);
  }

  int Calls() const {
    std::lock_guard lk(m_);
    return calls_;
  }
  std::vector<std::size_t> SampleCounts() const {
    std::lock_guard lk(m_);
    return sampleCounts_;
  }
  std::vector<float> FirstSamples() const {
    std::lock_guard lk(m_);
    return firstSamples_;
  }
  std::vector<std::optional<std::string>> Hints() const {
    std::lock_guard lk(m_);
    return hints_;
  }

  Gate gate;

private:
  mutable std::mutex m_;
  std::string text_ = "hello world";
  std::string language_ = "en";
  std::optional<std::string> failure_;
  int calls_ = 0;
  std::vector<std::size_t> sampleCounts_;
  std::vector<float> firstSamples_;
  std::vector<std::optional<std::string>> hints_;
};

// Prefixes the text with the target tag: "hello" en→ar gives "[ar] hello".
class FakeTranslator : public engine::Translator {
public:
  std::string Translate(const std::string &text, const std::string &source,
                        const std::string &target) override {
    std::lock_guard lk(m_);
    ++calls_;
    if (unsupported_.contains({source, target})) {
      throw engine::UnsupportedPair(source, target);
    }
    if (failure_.has_value()) {
      throw std::runtime_error(*failure_);
    }
    return "[" + target + "] " + text;
  }

  void Unsupported(std::string source, std::string target) {
    std::lock_guard lk(m_);
    unsupported_.emplace(std::move(source), std::move(target));
  }
  void FailWith(std::optional<std::string> reason) {
    std::lock_guard lk(m_);
    failure_ = std::move(reason);
  }
  int Calls() const {
    std::lock_guard lk(m_);
    return calls_;
  }

private:
  mutable std::mutex m_;
  std::set<std::pair<std::string, std::string>> unsupported_;
  std::optional<std::string> failure_;
  int calls_ = 0;
};

class RecordingSink : public MessageSink {
public:
  void Send(std::string frame) override {
    std::lock_guard lk(m_);
    frames_.push_back(std::move(frame));
  }

  std::vector<json> Messages() const {
    std::lock_guard lk(m_);
    std::vector<json> out;
    out.reserve(frames_.size());
    for (const auto &f : frames_) {
      out.push_back(json::parse(f));
    }
    return out;
  }

  std::vector<std::string> Types() const {
    std::vector<std::string> out;
    for (const auto &m : Messages()) {
      out.push_back(m.at("type").get<std::string>());
    }
    return out;
  }

  std::vector<json> OfType(const std::string &type) const {
    std::vector<json> out;
    for (const auto &m : Messages()) {
      if (m.at("type") == type) {
        out.push_back(m);
      }
    }
    return out;
  }

private:
  mutable std::mutex m_;
  std::vector<std::string> frames_;
};

// 16 kHz s16le samples alternating ±amplitude.
inline audio::Bytes Tone(std::size_t samples, std::int16_t amplitude = 1000) {
  audio::Bytes out;
  out.reserve(samples * 2);
  for (std::size_t i = 0; i < samples; ++i) {
    const auto v = static_cast<std::uint16_t>(
        i % 2 == 0 ? amplitude : static_cast<std::int16_t>(-amplitude));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
  }
  return out;
}

inline audio::Bytes Silence(std::size_t bytes) { return audio::Bytes(bytes, 0); }

inline std::string ConfigFrame(const std::string &target,
                               std::optional<std::string> source = std::nullopt) {
  json j{{"type", "config"}, {"target_language", target}};
  j["source_language"] = source.has_value() ? json(*source) : json(nullptr);
  return j.dump();
}

inline std::string ChunkFrame(const audio::Bytes &bytes) {
  return json{{"type", "chunk"},
              {"encoding", "base64"},
              {"data", protocol::EncodeBase64(bytes)}}
      .dump();
}

inline const std::string kFlushFrame = R"({"type":"flush"})";
inline const std::string kCloseFrame = R"({"type":"close"})";

// Small thresholds keep fixtures short: 0.1 s triggers an interim pass,
// 0.05 s is the shortest transcribable audio.
inline engine::EngineConfig TestEngineConfig() {
  engine::EngineConfig cfg;
  cfg.interimThresholdBytes = 3200;
  cfg.minSamples = 800;
  cfg.supportedTargets = {"en", "ar", "fr"};
  return cfg;
}

// Rig: io_context, fake collaborators and a real dispatcher. Scripts run as
// coroutines on a session strand; Run() returns once every script finished
// and every submitted job delivered its result.
class Rig {
public:
  using Script = std::function<void(StreamSession &, net::yield_context)>;

  struct Client {
    SessionStrand strand;
    std::shared_ptr<RecordingSink> sink;
    std::shared_ptr<StreamSession> session;
  };

  explicit Rig(engine::EngineConfig cfg = TestEngineConfig(),
               std::size_t workers = 2)
      : dispatcher(engine::SpeechServices{decoder, transcriber, translator},
                   std::move(cfg), workers) {}

  Client Connect(std::uint64_t id = 1) {
    SessionStrand strand = net::make_strand(ioc);
    auto sink = std::make_shared<RecordingSink>();
    auto session =
        std::make_shared<StreamSession>(id, strand, dispatcher, sink);
    return Client{std::move(strand), std::move(sink), std::move(session)};
  }

  void Spawn(const Client &c, Script script) {
    net::spawn(c.strand, [session = c.session, script = std::move(script)](
                             net::yield_context yield) {
      script(*session, yield);
    });
  }

  void Run() {
    ioc.run();
    ioc.restart();
  }

  // Single-client shorthand.
  void Drive(const Client &c, Script script) {
    Spawn(c, std::move(script));
    Run();
  }

  net::io_context ioc;
  std::shared_ptr<audio::PcmChunkDecoder> decoder =
      std::make_shared<audio::PcmChunkDecoder>();
  std::shared_ptr<FakeTranscriber> transcriber =
      std::make_shared<FakeTranscriber>();
  std::shared_ptr<FakeTranslator> translator =
      std::make_shared<FakeTranslator>();
  engine::ProcessingDispatcher dispatcher;
};

} // namespace fakes
