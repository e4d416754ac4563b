#include "mt/pair_translator.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Upper-cases ASCII and records every sentence it was given.
class EchoModel : public mt::SentenceModel {
public:
  explicit EchoModel(std::vector<std::string> *seen) : seen_(seen) {}

  std::string TranslateSentence(const std::string &sentence) override {
    std::lock_guard lk(m_);
    seen_->push_back(sentence);
    if (sentence == "drop.") {
      return "  ";
    }
    if (sentence == "boom.") {
      throw std::runtime_error("decoder failure");
    }
    std::string out = sentence;
    for (auto &c : out) {
      if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
      }
    }
    return out;
  }

private:
  std::mutex m_;
  std::vector<std::string> *seen_;
};

class PairTranslatorTest : public ::testing::Test {
protected:
  PairTranslatorTest() {
    mt::ModelMap models;
    models[mt::PairKey("en", "ar")] = std::make_unique<EchoModel>(&seen);
    translator = std::make_unique<mt::PairTranslator>(std::move(models));
  }

  std::vector<std::string> seen;
  std::unique_ptr<mt::PairTranslator> translator;
};

TEST_F(PairTranslatorTest, TranslatesSentenceBySentence) {
  EXPECT_EQ(translator->Translate("hello there. how are you?", "en", "ar"),
            "HELLO THERE. HOW ARE YOU?");
  EXPECT_EQ(seen, (std::vector<std::string>{"hello there.", "how are you?"}));
}

TEST_F(PairTranslatorTest, MissingDirectionIsUnsupported) {
  EXPECT_THROW(translator->Translate("marhaba", "ar", "en"),
               engine::UnsupportedPair);
  EXPECT_THROW(translator->Translate("bonjour", "fr", "ar"),
               engine::UnsupportedPair);
  EXPECT_TRUE(seen.empty());
}

TEST_F(PairTranslatorTest, SameLanguageIsReturnedAsIs) {
  EXPECT_EQ(translator->Translate("hello.", "fr", "fr"), "hello.");
  EXPECT_TRUE(seen.empty());
}

TEST_F(PairTranslatorTest, EmptyPiecesAreDroppedAndAllEmptyKeepsInput) {
  EXPECT_EQ(translator->Translate("drop. keep", "en", "ar"), "KEEP");
  EXPECT_EQ(translator->Translate("drop.", "en", "ar"), "drop.");
}

TEST_F(PairTranslatorTest, ModelFailurePropagates) {
  EXPECT_THROW(translator->Translate("fine. boom.", "en", "ar"),
               std::runtime_error);
}

TEST_F(PairTranslatorTest, ListsLoadedDirections) {
  EXPECT_EQ(translator->Pairs(), (std::vector<std::string>{"en-ar"}));
}

} // namespace
