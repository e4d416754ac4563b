#pragma once

#include "protocol/messages.hpp"
#include "util/branch.hpp"
#include <boost/beast/core/detail/base64.hpp>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace protocol {

using json = nlohmann::json;

// Strict padded base64 (RFC 4648 alphabet, no whitespace). Empty input
// decodes to zero bytes.
inline std::expected<audio::Bytes, ProtocolError>
DecodeBase64(std::string_view in) {
  namespace b64 = boost::beast::detail::base64;
  if (BRANCH_UNLIKELY(in.size() % 4 != 0)) {
    return std::unexpected(ProtocolError{"invalid base64 length"});
  }
  audio::Bytes out(b64::decoded_size(in.size()));
  auto [written, read] = b64::decode(out.data(), in.data(), in.size());
  // decode() stops at the first '=' or invalid character; only up to two
  // trailing '=' may remain.
  const std::size_t rest = in.size() - read;
  if (BRANCH_UNLIKELY(rest > 2)) {
    return std::unexpected(ProtocolError{"invalid base64 data"});
  }
  for (std::size_t i = read; i < in.size(); ++i) {
    if (in[i] != '=') {
      return std::unexpected(ProtocolError{"invalid base64 data"});
    }
  }
  out.resize(written);
  return out;
}

inline std::string EncodeBase64(const audio::Bytes &bytes) {
  namespace b64 = boost::beast::detail::base64;
  std::string out(b64::encoded_size(bytes.size()), '\0');
  out.resize(b64::encode(out.data(), bytes.data(), bytes.size()));
  return out;
}

namespace detail {

inline std::expected<std::string, ProtocolError>
RequireString(const json &obj, const char *field) {
  auto it = obj.find(field);
  if (it == obj.end() || !it->is_string()) {
    return std::unexpected(
        ProtocolError{std::string("missing or non-string field '") + field +
                      "'"});
  }
  return it->get<std::string>();
}

inline std::expected<ClientMessage, ProtocolError>
ParseConfig(const json &obj) {
  ConfigRequest req;
  if (auto it = obj.find("source_language");
      it != obj.end() && !it->is_null()) {
    if (!it->is_string()) {
      return std::unexpected(
          ProtocolError{"field 'source_language' must be a string or null"});
    }
    std::string src = it->get<std::string>();
    if (!src.empty() && src != "auto") {
      req.sourceLanguage = std::move(src);
    }
  }
  auto target = RequireString(obj, "target_language");
  if (!target) {
    return std::unexpected(target.error());
  }
  req.targetLanguage = std::move(*target);
  return req;
}

inline std::expected<ClientMessage, ProtocolError> ParseChunk(const json &obj) {
  std::string encoding = "base64";
  if (auto it = obj.find("encoding"); it != obj.end()) {
    if (!it->is_string()) {
      return std::unexpected(ProtocolError{"field 'encoding' must be a string"});
    }
    encoding = it->get<std::string>();
  }
  if (encoding != "base64") {
    return std::unexpected(
        ProtocolError{"unsupported chunk encoding '" + encoding + "'"});
  }
  auto data = RequireString(obj, "data");
  if (!data) {
    return std::unexpected(data.error());
  }
  auto bytes = DecodeBase64(*data);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  return ChunkRequest{std::move(*bytes)};
}

} // namespace detail

// Parses one text frame. Never throws.
inline std::expected<ClientMessage, ProtocolError>
ParseClientMessage(std::string_view frame) {
  json obj = json::parse(frame, nullptr, /*allow_exceptions=*/false);
  if (BRANCH_UNLIKELY(obj.is_discarded())) {
    return std::unexpected(ProtocolError{"invalid JSON"});
  }
  if (BRANCH_UNLIKELY(!obj.is_object())) {
    return std::unexpected(ProtocolError{"message must be a JSON object"});
  }
  auto type = detail::RequireString(obj, "type");
  if (!type) {
    return std::unexpected(type.error());
  }
  if (*type == "chunk") {
    return detail::ParseChunk(obj);
  }
  if (*type == "config") {
    return detail::ParseConfig(obj);
  }
  if (*type == "flush") {
    return FlushRequest{};
  }
  if (*type == "close") {
    return CloseRequest{};
  }
  return std::unexpected(
      ProtocolError{"unknown message type '" + *type + "'"});
}

// Transcripts may end inside a multibyte sequence; invalid UTF-8 is written
// as U+FFFD instead of throwing.
inline std::string Dump(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

inline json LanguageOrNull(const std::optional<std::string> &lang) {
  return lang.has_value() ? json(*lang) : json(nullptr);
}

inline std::string Serialize(const ConfigAck &m) {
  return Dump({{"type", "config_ack"},
               {"config",
                {{"source_language", LanguageOrNull(m.sourceLanguage)},
                 {"target_language", m.targetLanguage}}}});
}

inline std::string Serialize(const InterimResult &m) {
  return Dump({{"type", "interim"},
               {"text", m.text},
               {"detected_language", m.detectedLanguage}});
}

inline std::string Serialize(const FinalResult &m) {
  return Dump({{"type", "final"},
               {"original_text", m.originalText},
               {"translated_text", m.translatedText},
               {"detected_language", m.detectedLanguage},
               {"target_language", m.targetLanguage},
               {"translation_skipped", m.translationSkipped}});
}

inline std::string Serialize(const ErrorReply &m) {
  return Dump({{"type", "error"}, {"detail", m.detail}});
}

} // namespace protocol
