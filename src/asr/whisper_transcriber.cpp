#include "asr/whisper_transcriber.hpp"

#include "engine/config.hpp"
#include "util/text.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <whisper.h>

namespace asr {

namespace {

struct StateDeleter {
  void operator()(whisper_state *s) const { whisper_free_state(s); }
};

using StatePtr = std::unique_ptr<whisper_state, StateDeleter>;

// whisper_log_set callback; the library is chatty at info level.
void QuietLog(ggml_log_level level, const char *text, void *) {
  if (level == GGML_LOG_LEVEL_ERROR) {
    std::cerr << "[whisper] " << text;
  }
}

} // namespace

WhisperTranscriber::WhisperTranscriber(WhisperOptions opt)
    : opt_(std::move(opt)) {
  whisper_log_set(QuietLog, nullptr);
  whisper_context_params cparams = whisper_context_default_params();
  cparams.use_gpu = opt_.useGpu;
  ctx_ = whisper_init_from_file_with_params(opt_.modelPath.c_str(), cparams);
  if (ctx_ == nullptr) {
    throw ModelError("failed to load whisper model from '" + opt_.modelPath +
                     "'");
  }
  std::cerr << "[whisper] loaded " << opt_.modelPath << " ("
            << whisper_model_type_readable(ctx_) << ", "
            << (whisper_is_multilingual(ctx_) ? "multilingual" : "english-only")
            << ")\n";
}

WhisperTranscriber::~WhisperTranscriber() {
  if (ctx_ != nullptr) {
    whisper_free(ctx_);
  }
}

engine::Transcript
WhisperTranscriber::Transcribe(const audio::Samples &samples,
                               const std::optional<std::string> &languageHint) {
  StatePtr state(whisper_init_state(ctx_));
  if (!state) {
    throw std::runtime_error("whisper_init_state failed");
  }

  whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
  params.n_threads = opt_.threads;
  params.translate = false;
  params.no_context = true;
  params.no_timestamps = true;
  params.single_segment = false;
  params.print_progress = false;
  params.print_realtime = false;
  params.print_special = false;
  params.print_timestamps = false;
  params.suppress_blank = true;
  params.language = languageHint.has_value() ? languageHint->c_str() : "auto";
  params.detect_language = false;

  const int rc = whisper_full_with_state(ctx_, state.get(), params,
                                         samples.data(),
                                         static_cast<int>(samples.size()));
  if (rc != 0) {
    throw std::runtime_error("whisper_full failed with code " +
                             std::to_string(rc));
  }

  std::string joined;
  const int segments = whisper_full_n_segments_from_state(state.get());
  for (int i = 0; i < segments; ++i) {
    const char *seg = whisper_full_get_segment_text_from_state(state.get(), i);
    if (seg != nullptr) {
      joined += seg;
      joined += ' ';
    }
  }

  engine::Transcript out;
  out.text = text::CleanTranscript(joined);
  if (languageHint.has_value()) {
    out.language = *languageHint;
  } else {
    const int id = whisper_full_lang_id_from_state(state.get());
    const char *lang = id >= 0 ? whisper_lang_str(id) : nullptr;
    out.language = lang != nullptr ? lang : "en";
  }
  if (!text::ContainsIgnoreCase(engine::RecognisedLanguages(), out.language)) {
    out.language = "en";
  }
  return out;
}

} // namespace asr
