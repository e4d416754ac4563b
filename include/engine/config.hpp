#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace engine {

// Languages the acoustic model may report. Detections outside this set are
// reported as "en".
inline const std::vector<std::string> &RecognisedLanguages() {
  static const std::vector<std::string> langs = {
      "en", "ar", "es", "fr", "de", "it", "pt", "ru", "ja", "ko", "zh", "hi"};
  return langs;
}

// Process-wide streaming parameters; never tunable per session.
struct EngineConfig {
  // Buffered bytes that trigger an interim pass (2 s of 16 kHz s16 mono).
  std::size_t interimThresholdBytes = 64000;
  // Decoded samples below this are discarded as too short (0.5 s).
  std::size_t minSamples = 8000;
  // Target languages a client may select.
  std::vector<std::string> supportedTargets = {"en", "ar"};
};

} // namespace engine
