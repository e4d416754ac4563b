#pragma once

#include "audio/audio_buffer.hpp"
#include <optional>
#include <string>
#include <variant>

// Wire messages exchanged over /ws/transcribe-translate. Client messages are
// JSON text frames; a binary frame is shorthand for a chunk carrying raw
// bytes.
namespace protocol {

inline constexpr const char *kEndpointPath = "/ws/transcribe-translate";

struct ConfigRequest {
  std::optional<std::string> sourceLanguage;
  std::string targetLanguage;
};

struct ChunkRequest {
  audio::Bytes data;
};

struct FlushRequest {};

struct CloseRequest {};

using ClientMessage =
    std::variant<ConfigRequest, ChunkRequest, FlushRequest, CloseRequest>;

struct ConfigAck {
  std::optional<std::string> sourceLanguage;
  std::string targetLanguage;
};

struct InterimResult {
  std::string text;
  std::string detectedLanguage;
};

struct FinalResult {
  std::string originalText;
  std::string translatedText;
  std::string detectedLanguage;
  std::string targetLanguage;
  bool translationSkipped = false;
};

struct ErrorReply {
  std::string detail;
};

// MalformedInput: the frame could not be turned into a ClientMessage.
struct ProtocolError {
  std::string detail;
};

} // namespace protocol
