#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace audio {

inline constexpr int kSampleRate = 16000;

using Samples = std::vector<float>;

// Thrown when the bytes announce a container we recognise but cannot read
// (truncated header, unsupported sample format). Unrecognised bytes are not
// an error: they are read as raw PCM.
class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Collaborator boundary for the container/codec step.
// Implementations are shared read-only across worker threads: Decode() must
// not mutate shared state.
class ChunkDecoder {
public:
  virtual ~ChunkDecoder() = default;
  // Returns 16 kHz mono samples in [-1, 1], or an empty vector when nothing
  // usable was recovered.
  virtual Samples Decode(std::span<const std::uint8_t> bytes) const = 0;
};

// PcmChunkDecoder
// - RIFF/WAVE: 8-bit unsigned, 16-bit signed or 32-bit float PCM, any channel
//   count (down-mixed), 4 kHz to 384 kHz (linearly resampled to 16 kHz)
// - anything else: raw 16-bit little-endian mono at 16 kHz; an odd trailing
//   byte is zero-padded
class PcmChunkDecoder : public ChunkDecoder {
public:
  Samples Decode(std::span<const std::uint8_t> bytes) const override {
    if (bytes.empty()) {
      return {};
    }
    if (LooksLikeWav(bytes)) {
      return DecodeWav(bytes);
    }
    return DecodeRawS16(bytes);
  }

  static Samples DecodeRawS16(std::span<const std::uint8_t> bytes) {
    const std::size_t n = (bytes.size() + 1) / 2;
    Samples out(n);
    for (std::size_t i = 0; i < n; ++i) {
      const std::uint8_t lo = bytes[2 * i];
      const std::uint8_t hi = 2 * i + 1 < bytes.size() ? bytes[2 * i + 1] : 0;
      const auto v = static_cast<std::int16_t>(
          static_cast<std::uint16_t>(lo) |
          static_cast<std::uint16_t>(static_cast<std::uint16_t>(hi) << 8));
      out[i] = static_cast<float>(v) / 32768.0f;
    }
    return out;
  }

  // Linear interpolation; adequate for speech recognition front ends.
  static Samples Resample(const Samples &in, int from_rate, int to_rate) {
    if (from_rate == to_rate || in.empty()) {
      return in;
    }
    const double ratio = static_cast<double>(from_rate) / to_rate;
    const auto n = static_cast<std::size_t>(
        static_cast<double>(in.size()) / ratio);
    Samples out(n);
    for (std::size_t i = 0; i < n; ++i) {
      const double pos = static_cast<double>(i) * ratio;
      const auto idx = static_cast<std::size_t>(pos);
      const double frac = pos - static_cast<double>(idx);
      const float a = in[idx];
      const float b = idx + 1 < in.size() ? in[idx + 1] : a;
      out[i] = static_cast<float>(a + (b - a) * frac);
    }
    return out;
  }

private:
  struct WavFormat {
    std::uint16_t format = 0;
    std::uint16_t channels = 0;
    std::uint32_t rate = 0;
    std::uint16_t bits = 0;
  };

  static constexpr std::uint16_t kFormatPcm = 1;
  static constexpr std::uint16_t kFormatFloat = 3;
  static constexpr std::uint16_t kFormatExtensible = 0xFFFE;
  // Declared rates outside this range are rejected before resampling.
  static constexpr std::uint32_t kMinWavRate = 4000;
  static constexpr std::uint32_t kMaxWavRate = 384000;

  static std::uint16_t Le16(const std::uint8_t *p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
  }
  static std::uint32_t Le32(const std::uint8_t *p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
  }

  static bool LooksLikeWav(std::span<const std::uint8_t> b) {
    return b.size() >= 12 && std::memcmp(b.data(), "RIFF", 4) == 0 &&
           std::memcmp(b.data() + 8, "WAVE", 4) == 0;
  }

  static Samples DecodeWav(std::span<const std::uint8_t> b) {
    std::optional<WavFormat> fmt;
    std::size_t pos = 12;
    while (pos + 8 <= b.size()) {
      const std::uint8_t *hdr = b.data() + pos;
      const std::uint32_t size = Le32(hdr + 4);
      const std::size_t body = pos + 8;
      const std::size_t avail = b.size() - body;
      if (std::memcmp(hdr, "fmt ", 4) == 0) {
        if (size < 16 || avail < 16) {
          throw DecodeError("truncated WAV fmt chunk");
        }
        const std::uint8_t *f = b.data() + body;
        WavFormat w;
        w.format = Le16(f);
        w.channels = Le16(f + 2);
        w.rate = Le32(f + 4);
        w.bits = Le16(f + 14);
        if (w.format == kFormatExtensible && size >= 26 && avail >= 26) {
          w.format = Le16(f + 24);
        }
        fmt = w;
      } else if (std::memcmp(hdr, "data", 4) == 0) {
        if (!fmt.has_value()) {
          throw DecodeError("WAV data chunk before fmt chunk");
        }
        // Streamed WAV headers often carry a placeholder size; trust what
        // actually arrived.
        const std::size_t len = std::min<std::size_t>(size, avail);
        return Convert(*fmt, b.subspan(body, len));
      }
      pos = body + size + (size & 1u);
    }
    if (!fmt.has_value()) {
      throw DecodeError("WAV stream without fmt chunk");
    }
    return {};
  }

  static Samples Convert(const WavFormat &w, std::span<const std::uint8_t> d) {
    if (w.channels == 0) {
      throw DecodeError("WAV fmt chunk declares zero channels");
    }
    if (w.rate < kMinWavRate || w.rate > kMaxWavRate) {
      throw DecodeError("unsupported WAV sample rate " +
                        std::to_string(w.rate) + " Hz");
    }
    const bool pcm = w.format == kFormatPcm;
    const bool flt = w.format == kFormatFloat;
    if (!((pcm && (w.bits == 8 || w.bits == 16)) || (flt && w.bits == 32))) {
      throw DecodeError("unsupported WAV sample format " +
                        std::to_string(w.format) + "/" +
                        std::to_string(w.bits) + "bit");
    }
    const std::size_t width = w.bits / 8u;
    const std::size_t frame = width * w.channels;
    const std::size_t frames = d.size() / frame;
    Samples mono(frames);
    for (std::size_t i = 0; i < frames; ++i) {
      float acc = 0.0f;
      for (std::size_t c = 0; c < w.channels; ++c) {
        const std::uint8_t *p = d.data() + i * frame + c * width;
        float v = 0.0f;
        if (w.bits == 8) {
          v = (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        } else if (w.bits == 16) {
          v = static_cast<float>(static_cast<std::int16_t>(Le16(p))) / 32768.0f;
        } else {
          const std::uint32_t raw = Le32(p);
          std::memcpy(&v, &raw, sizeof(v));
        }
        acc += v;
      }
      mono[i] = acc / static_cast<float>(w.channels);
    }
    return Resample(mono, static_cast<int>(w.rate), kSampleRate);
  }
};

} // namespace audio
