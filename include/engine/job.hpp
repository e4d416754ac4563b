#pragma once

#include "audio/audio_buffer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace engine {

struct SessionConfig {
  std::optional<std::string> sourceLanguage;
  std::string targetLanguage;
};

enum class JobKind : std::uint8_t { interim, final };

// Dispatcher job. For a final pass over an empty buffer `audio` is empty and
// `carriedText`/`carriedLanguage` hold the last partial result, which is only
// translated.
struct Job {
  std::uint64_t sessionId = 0;
  JobKind kind = JobKind::interim;
  audio::Bytes audio;
  SessionConfig config;
  std::string carriedText;
  std::string carriedLanguage;
};

enum class Outcome : std::uint8_t { transcribed, no_audio, too_short, failed };

struct JobResult {
  Outcome outcome = Outcome::no_audio;
  JobKind kind = JobKind::interim;
  std::size_t submittedBytes = 0;
  std::size_t samples = 0;
  std::string text;
  std::string translatedText;
  std::string detectedLanguage;
  bool translationSkipped = false;
  std::string failure;
  std::int64_t latencyMs = 0;
};

inline std::string_view ToString(Outcome o) {
  switch (o) {
  case Outcome::transcribed:
    return "transcribed";
  case Outcome::no_audio:
    return "no_audio";
  case Outcome::too_short:
    return "too_short";
  case Outcome::failed:
    return "failed";
  }
  return "unknown";
}

inline std::string_view ToString(JobKind k) {
  return k == JobKind::final ? "final" : "interim";
}

} // namespace engine
