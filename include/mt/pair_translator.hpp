#pragma once

#include "engine/services.hpp"
#include "util/text.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mt {

// One translation direction, one sentence per call. Shared by every
// dispatcher worker: TranslateSentence() may run concurrently.
class SentenceModel {
public:
  virtual ~SentenceModel() = default;
  virtual std::string TranslateSentence(const std::string &sentence) = 0;
};

// Keyed by direction, e.g. "en-ar".
using ModelMap = std::map<std::string, std::unique_ptr<SentenceModel>>;

inline std::string PairKey(const std::string &source,
                           const std::string &target) {
  return source + "-" + target;
}

// PairTranslator
// - A direction without a model throws UnsupportedPair.
// - Input is cut into sentences and each is translated on its own; the
//   translated pieces are joined with single spaces. If every piece comes
//   back empty the input is returned unchanged.
class PairTranslator : public engine::Translator {
public:
  explicit PairTranslator(ModelMap models) : models_(std::move(models)) {}

  std::string Translate(const std::string &input, const std::string &source,
                        const std::string &target) override {
    if (source == target) {
      return input;
    }
    auto it = models_.find(PairKey(source, target));
    if (it == models_.end()) {
      throw engine::UnsupportedPair(source, target);
    }
    std::string out;
    for (const auto &sentence : text::SplitSentences(input)) {
      std::string piece = it->second->TranslateSentence(sentence);
      boost::algorithm::trim(piece);
      if (piece.empty()) {
        continue;
      }
      if (!out.empty()) {
        out.push_back(' ');
      }
      out += piece;
    }
    return out.empty() ? input : out;
  }

  std::vector<std::string> Pairs() const {
    std::vector<std::string> out;
    for (const auto &[key, model] : models_) {
      out.push_back(key);
    }
    return out;
  }

private:
  ModelMap models_;
};

} // namespace mt
