#include "mt/marian_model.hpp"

#include <ctranslate2/models/model.h>
#include <ctranslate2/translator.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sentencepiece_processor.h>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace mt {

namespace fs = std::filesystem;

namespace {

constexpr const char *kEndOfSentence = "</s>";

// MarianModel
// Threading model:
// - ctranslate2::Translator queues concurrent calls onto its own replica
//   threads; SentencePiece encode/decode are const. No lock here.
class MarianModel : public SentenceModel {
public:
  MarianModel(const fs::path &dir, const MarianOptions &opt) {
    LoadVocabulary(source_, dir / "source.spm");
    LoadVocabulary(target_, dir / "target.spm");

    ctranslate2::models::ModelLoader loader(dir.string());
    loader.device = ctranslate2::Device::CPU;
    loader.compute_type = ctranslate2::ComputeType::DEFAULT;
    ctranslate2::ReplicaPoolConfig pool;
    pool.num_threads_per_replica = static_cast<std::size_t>(opt.threads);
    translator_ = std::make_unique<ctranslate2::Translator>(loader, pool);

    options_.beam_size = opt.beamSize;
    options_.max_input_length = opt.maxLength;
    options_.max_decoding_length = opt.maxLength;
  }

  std::string TranslateSentence(const std::string &sentence) override {
    std::vector<std::string> tokens;
    const auto encoded = source_.Encode(sentence, &tokens);
    if (!encoded.ok()) {
      throw std::runtime_error("sentencepiece encode failed: " +
                               encoded.ToString());
    }
    // Hugging Face Marian tokenizers end every source with </s>.
    tokens.push_back(kEndOfSentence);

    const std::vector<std::vector<std::string>> batch(1, std::move(tokens));
    const auto results = translator_->translate_batch(batch, options_);
    if (results.empty() || results[0].hypotheses.empty()) {
      return {};
    }
    std::vector<std::string> pieces;
    for (const auto &t : results[0].output()) {
      if (t != kEndOfSentence && t != "<pad>" && t != "<unk>") {
        pieces.push_back(t);
      }
    }
    std::string out;
    const auto decoded = target_.Decode(pieces, &out);
    if (!decoded.ok()) {
      throw std::runtime_error("sentencepiece decode failed: " +
                               decoded.ToString());
    }
    return out;
  }

private:
  static void LoadVocabulary(sentencepiece::SentencePieceProcessor &sp,
                             const fs::path &path) {
    const auto st = sp.Load(path.string());
    if (!st.ok()) {
      throw ModelError("failed to load " + path.string() + ": " +
                       st.ToString());
    }
  }

  sentencepiece::SentencePieceProcessor source_;
  sentencepiece::SentencePieceProcessor target_;
  std::unique_ptr<ctranslate2::Translator> translator_;
  ctranslate2::TranslationOptions options_;
};

// "en-ar" or "opus-mt-en-ar" -> "en-ar"; anything else -> "".
std::string DirectionOf(std::string name) {
  const std::string prefix = "opus-mt-";
  if (name.rfind(prefix, 0) == 0) {
    name.erase(0, prefix.size());
  }
  const auto dash = name.find('-');
  if (dash == std::string::npos || dash == 0 || dash + 1 == name.size() ||
      name.find('-', dash + 1) != std::string::npos) {
    return {};
  }
  return text::ToLower(name);
}

bool HasModelFiles(const fs::path &dir) {
  std::error_code ec;
  return fs::is_regular_file(dir / "model.bin", ec) &&
         fs::is_regular_file(dir / "source.spm", ec) &&
         fs::is_regular_file(dir / "target.spm", ec);
}

} // namespace

ModelMap LoadMarianModels(const MarianOptions &opt) {
  std::error_code ec;
  fs::directory_iterator it(opt.modelDir, ec);
  if (ec) {
    throw ModelError("cannot read translation model directory '" +
                     opt.modelDir + "': " + ec.message());
  }
  ModelMap models;
  for (const auto &entry : it) {
    if (!entry.is_directory(ec)) {
      continue;
    }
    const std::string direction =
        DirectionOf(entry.path().filename().string());
    if (direction.empty()) {
      continue;
    }
    if (!HasModelFiles(entry.path())) {
      std::cerr << "[mt] skipping " << entry.path().string()
                << ": needs model.bin, source.spm and target.spm\n";
      continue;
    }
    try {
      models[direction] = std::make_unique<MarianModel>(entry.path(), opt);
    } catch (const ModelError &) {
      throw;
    } catch (const std::exception &e) {
      throw ModelError("failed to load translation model " +
                       entry.path().string() + ": " + e.what());
    }
    std::cerr << "[mt] loaded " << direction << " from "
              << entry.path().string() << "\n";
  }
  if (models.empty()) {
    throw ModelError("no translation models found in '" + opt.modelDir + "'");
  }
  return models;
}

} // namespace mt
