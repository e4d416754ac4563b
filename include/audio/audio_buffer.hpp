#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace audio {

using Bytes = std::vector<std::uint8_t>;

// AudioBuffer: per-session accumulator of not-yet-processed chunk bytes.
// Threading model:
// - Owned by one StreamSession and touched only from that session's strand;
//   no internal locking
// - Dispatcher jobs receive a Snapshot() copy, never a reference, so chunks
//   appended while a job runs cannot race with decode
class AudioBuffer {
public:
  void Append(std::span<const std::uint8_t> bytes) {
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
  }

  std::size_t Size() const { return bytes_.size(); }
  bool Empty() const { return bytes_.empty(); }

  // Readiness predicate for threshold-triggered interim processing.
  bool Ready(std::size_t threshold) const { return bytes_.size() >= threshold; }

  Bytes Snapshot() const { return bytes_; }

  // Copy of the first n bytes.
  Bytes Snapshot(std::size_t n) const {
    n = std::min(n, bytes_.size());
    return Bytes(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(n));
  }

  // Length of the longest prefix holding only whole `frame`-byte samples.
  std::size_t AlignedSize(std::size_t frame) const {
    return frame == 0 ? bytes_.size() : bytes_.size() - bytes_.size() % frame;
  }

  // Returns the full contents and leaves the buffer empty.
  Bytes DrainAll() {
    Bytes out;
    out.swap(bytes_);
    return out;
  }

  // Removes the first n bytes (the part a finished job was submitted with),
  // keeping anything appended after the snapshot was taken.
  void DrainFront(std::size_t n) {
    n = std::min(n, bytes_.size());
    bytes_.erase(bytes_.begin(),
                 bytes_.begin() + static_cast<std::ptrdiff_t>(n));
  }

private:
  Bytes bytes_;
};

} // namespace audio
