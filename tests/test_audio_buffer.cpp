#include "audio/audio_buffer.hpp"
#include <gtest/gtest.h>

namespace {

using audio::AudioBuffer;
using audio::Bytes;

TEST(AudioBuffer, AppendGrowsInOrder) {
  AudioBuffer buf;
  EXPECT_TRUE(buf.Empty());
  buf.Append(Bytes{1, 2});
  buf.Append(Bytes{3});
  EXPECT_EQ(buf.Size(), 3u);
  EXPECT_EQ(buf.Snapshot(), (Bytes{1, 2, 3}));
}

TEST(AudioBuffer, ReadyAtThreshold) {
  AudioBuffer buf;
  buf.Append(Bytes(99, 0));
  EXPECT_FALSE(buf.Ready(100));
  buf.Append(Bytes{0});
  EXPECT_TRUE(buf.Ready(100));
}

TEST(AudioBuffer, SnapshotDoesNotDrain) {
  AudioBuffer buf;
  buf.Append(Bytes{1, 2, 3});
  auto snap = buf.Snapshot();
  buf.Append(Bytes{4});
  EXPECT_EQ(snap.size(), 3u);
  EXPECT_EQ(buf.Size(), 4u);
}

TEST(AudioBuffer, DrainAllEmpties) {
  AudioBuffer buf;
  buf.Append(Bytes{1, 2, 3});
  EXPECT_EQ(buf.DrainAll(), (Bytes{1, 2, 3}));
  EXPECT_TRUE(buf.Empty());
  EXPECT_TRUE(buf.DrainAll().empty());
}

TEST(AudioBuffer, DrainFrontKeepsLaterChunks) {
  AudioBuffer buf;
  buf.Append(Bytes{1, 2, 3});
  auto submitted = buf.Snapshot().size();
  buf.Append(Bytes{4, 5});
  buf.DrainFront(submitted);
  EXPECT_EQ(buf.Snapshot(), (Bytes{4, 5}));
  buf.DrainFront(10);
  EXPECT_TRUE(buf.Empty());
}

TEST(AudioBuffer, AlignedSizeAndPrefixSnapshot) {
  audio::AudioBuffer buf;
  buf.Append(audio::Bytes{1, 2, 3, 4, 5});
  EXPECT_EQ(buf.AlignedSize(2), 4u);
  EXPECT_EQ(buf.Snapshot(buf.AlignedSize(2)), (audio::Bytes{1, 2, 3, 4}));
  EXPECT_EQ(buf.Snapshot(100).size(), 5u);
  buf.DrainFront(4);
  EXPECT_EQ(buf.AlignedSize(2), 0u);
  EXPECT_EQ(buf.Snapshot(), (audio::Bytes{5}));
}

} // namespace
