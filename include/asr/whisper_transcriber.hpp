#pragma once

#include "engine/services.hpp"
#include <optional>
#include <stdexcept>
#include <string>

struct whisper_context;

namespace asr {

// Model file missing or unreadable.
class ModelError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct WhisperOptions {
  std::string modelPath = "models/ggml-base.bin";
  int threads = 2;
  bool useGpu = false;
};

// WhisperTranscriber
// Threading model:
// - The model (whisper_context) is loaded once and shared read-only.
// - Each Transcribe() call allocates its own whisper_state, so calls from
//   several dispatcher workers run concurrently without a lock.
class WhisperTranscriber : public engine::Transcriber {
public:
  explicit WhisperTranscriber(WhisperOptions opt);
  ~WhisperTranscriber() override;

  WhisperTranscriber(const WhisperTranscriber &) = delete;
  WhisperTranscriber &operator=(const WhisperTranscriber &) = delete;

  engine::Transcript
  Transcribe(const audio::Samples &samples,
             const std::optional<std::string> &languageHint) override;

private:
  WhisperOptions opt_;
  whisper_context *ctx_ = nullptr;
};

} // namespace asr
