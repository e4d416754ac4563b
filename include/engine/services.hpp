#pragma once

#include "audio/chunk_decoder.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace engine {

struct Transcript {
  std::string text;
  std::string language;
};

// Acoustic model boundary. Implementations are loaded once and
// shared by all worker threads; per-request inference state must be created
// inside Transcribe(), never kept in members mutated per call.
class Transcriber {
public:
  virtual ~Transcriber() = default;
  virtual Transcript Transcribe(const audio::Samples &samples,
                                const std::optional<std::string> &hint) = 0;
};

// Thrown by a Translator that has no model for the requested direction.
class UnsupportedPair : public std::runtime_error {
public:
  UnsupportedPair(const std::string &source, const std::string &target)
      : std::runtime_error("unsupported language pair " + source + "-" +
                           target),
        source_(source), target_(target) {}

  const std::string &Source() const { return source_; }
  const std::string &Target() const { return target_; }

private:
  std::string source_;
  std::string target_;
};

class Translator {
public:
  virtual ~Translator() = default;
  virtual std::string Translate(const std::string &text,
                                const std::string &source,
                                const std::string &target) = 0;
};

// Translator used when no translation models are configured: every
// cross-language request degrades to untranslated output.
class UnavailableTranslator : public Translator {
public:
  std::string Translate(const std::string &text, const std::string &source,
                        const std::string &target) override {
    if (source == target) {
      return text;
    }
    throw UnsupportedPair(source, target);
  }
};

// Read-mostly handle to the process-wide collaborators,
// injected into the dispatcher at construction.
struct SpeechServices {
  std::shared_ptr<const audio::ChunkDecoder> decoder;
  std::shared_ptr<Transcriber> transcriber;
  std::shared_ptr<Translator> translator;
};

} // namespace engine
