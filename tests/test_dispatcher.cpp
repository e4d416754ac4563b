#include "fakes.hpp"
#include <atomic>
#include <gtest/gtest.h>

using namespace fakes;

namespace {

engine::Job MakeJob(engine::JobKind kind, audio::Bytes bytes,
                    std::string target = "ar",
                    std::optional<std::string> source = std::nullopt) {
  engine::Job job;
  job.sessionId = 7;
  job.kind = kind;
  job.audio = std::move(bytes);
  job.config = engine::SessionConfig{std::move(source), std::move(target)};
  return job;
}

class DispatcherTest : public ::testing::Test {
protected:
  Rig rig;
};

TEST_F(DispatcherTest, EmptyInterimJobHasNoAudio) {
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::interim, {}));
  EXPECT_EQ(r.outcome, engine::Outcome::no_audio);
  EXPECT_EQ(rig.transcriber->Calls(), 0);
}

TEST_F(DispatcherTest, DigitalSilenceHasNoAudio) {
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::interim, Silence(6400)));
  EXPECT_EQ(r.outcome, engine::Outcome::no_audio);
  EXPECT_EQ(r.samples, 3200u);
  EXPECT_EQ(r.submittedBytes, 6400u);
  EXPECT_EQ(rig.transcriber->Calls(), 0);
}

TEST_F(DispatcherTest, ShortAudioIsTooShort) {
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::interim, Tone(799)));
  EXPECT_EQ(r.outcome, engine::Outcome::too_short);
  EXPECT_EQ(rig.transcriber->Calls(), 0);
}

TEST_F(DispatcherTest, TranscribesCleansAndTranslates) {
  rig.transcriber->Reply("  hello  //  world , again ", "en");
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::interim, Tone(800)));
  EXPECT_EQ(r.outcome, engine::Outcome::transcribed);
  EXPECT_EQ(r.text, "hello world, again");
  EXPECT_EQ(r.translatedText, "[ar] hello world, again");
  EXPECT_EQ(r.detectedLanguage, "en");
  EXPECT_FALSE(r.translationSkipped);
}

TEST_F(DispatcherTest, EmptyLanguageIsReportedUnknown) {
  rig.transcriber->Reply("hello", "");
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::interim, Tone(800)));
  EXPECT_EQ(r.detectedLanguage, "unknown");
}

TEST_F(DispatcherTest, EmptyTranscriptIsNotTranslated) {
  rig.transcriber->Reply("", "en");
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::interim, Tone(800)));
  EXPECT_EQ(r.outcome, engine::Outcome::transcribed);
  EXPECT_TRUE(r.text.empty());
  EXPECT_EQ(rig.translator->Calls(), 0);
}

TEST_F(DispatcherTest, SameLanguageDoesNotCallTranslator) {
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::final, Tone(800), "en"));
  EXPECT_EQ(r.translatedText, r.text);
  EXPECT_FALSE(r.translationSkipped);
  EXPECT_EQ(rig.translator->Calls(), 0);
}

TEST_F(DispatcherTest, UnsupportedPairIsSkippedNotFailed) {
  rig.translator->Unsupported("en", "ar");
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::final, Tone(800)));
  EXPECT_EQ(r.outcome, engine::Outcome::transcribed);
  EXPECT_TRUE(r.translationSkipped);
  EXPECT_EQ(r.translatedText, "hello world");
}

TEST_F(DispatcherTest, TranslatorExceptionFailsJob) {
  rig.translator->FailWith("mt offline");
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::final, Tone(800)));
  EXPECT_EQ(r.outcome, engine::Outcome::failed);
  EXPECT_EQ(r.failure, "mt offline");
}

TEST_F(DispatcherTest, DecodeErrorFailsJob) {
  // RIFF/WAVE header followed by a truncated fmt chunk.
  audio::Bytes wav = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E',
                      'f', 'm', 't', ' ', 16, 0, 0, 0, 1, 0};
  auto r = rig.dispatcher.Run(MakeJob(engine::JobKind::interim, wav));
  EXPECT_EQ(r.outcome, engine::Outcome::failed);
  EXPECT_NE(r.failure.find("fmt"), std::string::npos);
}

TEST_F(DispatcherTest, SourceHintIsPassedThrough) {
  auto r = rig.dispatcher.Run(
      MakeJob(engine::JobKind::interim, Tone(800), "en", "ar"));
  ASSERT_EQ(rig.transcriber->Hints().size(), 1u);
  EXPECT_EQ(rig.transcriber->Hints()[0], std::optional<std::string>("ar"));
  EXPECT_EQ(r.detectedLanguage, "ar");
  EXPECT_EQ(r.translatedText, "[en] hello world");
}

TEST_F(DispatcherTest, CarriedFinalOnlyTranslates) {
  auto job = MakeJob(engine::JobKind::final, {}, "fr");
  job.carriedText = "good morning";
  job.carriedLanguage = "en";
  auto r = rig.dispatcher.Run(job);
  EXPECT_EQ(r.outcome, engine::Outcome::transcribed);
  EXPECT_EQ(r.text, "good morning");
  EXPECT_EQ(r.translatedText, "[fr] good morning");
  EXPECT_EQ(rig.transcriber->Calls(), 0);
}

TEST(Dispatcher, SaturatedPoolQueuesEveryJob) {
  constexpr int kJobs = 16;
  Rig rig(TestEngineConfig(), 2);
  std::atomic<int> delivered{0};
  std::atomic<int> failures{0};
  auto strand = net::make_strand(rig.ioc);
  for (int i = 0; i < kJobs; ++i) {
    rig.dispatcher.Submit(MakeJob(engine::JobKind::interim, Tone(800)), strand,
                          [&](engine::JobResult r) {
                            if (r.outcome != engine::Outcome::transcribed) {
                              ++failures;
                            }
                            ++delivered;
                          });
  }
  rig.Run();
  EXPECT_EQ(delivered.load(), kJobs);
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(rig.dispatcher.Submitted(), static_cast<std::size_t>(kJobs));
  EXPECT_EQ(rig.dispatcher.Completed(), static_cast<std::size_t>(kJobs));
  EXPECT_LE(rig.dispatcher.PeakActive(), 2u);
}

TEST(Dispatcher, CompletionRunsOnSubmittingExecutor) {
  Rig rig;
  auto strand = net::make_strand(rig.ioc);
  bool onStrand = false;
  rig.dispatcher.Submit(MakeJob(engine::JobKind::interim, Tone(800)), strand,
                        [&](engine::JobResult) {
                          onStrand = strand.running_in_this_thread();
                        });
  rig.Run();
  EXPECT_TRUE(onStrand);
}

} // namespace
