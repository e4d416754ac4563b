#pragma once

#include "mt/pair_translator.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace mt {

// Model directory missing, unreadable, or holding no usable direction.
class ModelError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct MarianOptions {
  std::string modelDir;
  int threads = 2;
  std::size_t beamSize = 4;
  std::size_t maxLength = 512;
};

// Loads every "<src>-<tgt>" (or "opus-mt-<src>-<tgt>") subdirectory of
// opt.modelDir that holds a CTranslate2 conversion of a Marian model
// (model.bin) next to its source.spm and target.spm vocabularies.
// Subdirectories missing one of those files are skipped.
ModelMap LoadMarianModels(const MarianOptions &opt);

} // namespace mt
