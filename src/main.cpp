#include "asr/whisper_transcriber.hpp"
#include "audio/chunk_decoder.hpp"
#include "core/runner.hpp"
#include "engine/services.hpp"
#include "mt/marian_model.hpp"
#include "mt/pair_translator.hpp"
#include "util/text.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

struct Options {
  std::string address = "0.0.0.0";
  int port = 8765;
  int reactor_threads = 1;
  int workers = 2;
  std::string model = "models/ggml-base.bin";
  int whisper_threads = 2;
  std::string mt_models; // empty: no translation, cross-language finals skip
  int mt_threads = 2;
  long threshold = 64000;
  long min_samples = 8000;
  std::string languages = "en,ar";
  std::string cert;
  std::string key;
  std::string journal;
  int seconds = 0; // 0 = run until SIGINT/SIGTERM
  bool help = false;
};

static void PrintUsage(const char *argv0) {
  std::cout
      << "usage: " << argv0 << " [options]\n"
      << "  -a, --address <ip>        listen address (0.0.0.0)\n"
      << "  -p, --port <n>            listen port (8765)\n"
      << "  -r, --reactor-threads <n> io threads (1)\n"
      << "  -w, --workers <n>         concurrent processing jobs (2)\n"
      << "  -m, --model <path>        whisper ggml model (models/ggml-base.bin)\n"
      << "      --whisper-threads <n> threads per transcription (2)\n"
      << "      --mt-models <dir>     CTranslate2 Marian models, one <src>-<tgt> dir each\n"
      << "      --mt-threads <n>      threads per translation model (2)\n"
      << "      --threshold <bytes>   buffered bytes per interim pass (64000)\n"
      << "      --min-samples <n>     shortest transcribed audio (8000)\n"
      << "      --languages <list>    selectable target languages (en,ar)\n"
      << "      --cert <pem> --key <pem>  serve wss:// instead of ws://\n"
      << "      --journal <path>      append one line per processing job\n"
      << "  -t, --seconds <n>         stop after n seconds (0 = never)\n";
}

static Options ParseArgs(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-a" || a == "--address") && i + 1 < argc)
      opt.address = argv[++i];
    else if ((a == "-p" || a == "--port") && i + 1 < argc)
      opt.port = std::clamp(std::atoi(argv[++i]), 0, 65535);
    else if ((a == "-r" || a == "--reactor-threads") && i + 1 < argc)
      opt.reactor_threads = std::max(1, std::atoi(argv[++i]));
    else if ((a == "-w" || a == "--workers") && i + 1 < argc)
      opt.workers = std::max(1, std::atoi(argv[++i]));
    else if ((a == "-m" || a == "--model") && i + 1 < argc)
      opt.model = argv[++i];
    else if (a == "--whisper-threads" && i + 1 < argc)
      opt.whisper_threads = std::max(1, std::atoi(argv[++i]));
    else if (a == "--mt-models" && i + 1 < argc)
      opt.mt_models = argv[++i];
    else if (a == "--mt-threads" && i + 1 < argc)
      opt.mt_threads = std::max(1, std::atoi(argv[++i]));
    else if (a == "--threshold" && i + 1 < argc)
      opt.threshold = std::max(1L, std::atol(argv[++i]));
    else if (a == "--min-samples" && i + 1 < argc)
      opt.min_samples = std::max(0L, std::atol(argv[++i]));
    else if (a == "--languages" && i + 1 < argc)
      opt.languages = argv[++i];
    else if (a == "--cert" && i + 1 < argc)
      opt.cert = argv[++i];
    else if (a == "--key" && i + 1 < argc)
      opt.key = argv[++i];
    else if (a == "--journal" && i + 1 < argc)
      opt.journal = argv[++i];
    else if ((a == "-t" || a == "--seconds") && i + 1 < argc)
      opt.seconds = std::max(0, std::atoi(argv[++i]));
    else if (a == "-h" || a == "--help")
      opt.help = true;
    else
      std::cerr << "ignoring unknown argument '" << a << "'\n";
  }
  return opt;
}

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  if (opt.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  RunOptions ro;
  ro.address = opt.address;
  ro.port = static_cast<unsigned short>(opt.port);
  ro.reactorThreads = opt.reactor_threads;
  ro.workers = static_cast<std::size_t>(opt.workers);
  ro.engineConfig.interimThresholdBytes = static_cast<std::size_t>(opt.threshold);
  ro.engineConfig.minSamples = static_cast<std::size_t>(opt.min_samples);
  ro.engineConfig.supportedTargets = text::SplitList(opt.languages);
  if (ro.engineConfig.supportedTargets.empty()) {
    std::cerr << "--languages must name at least one language\n";
    return 1;
  }
  if (!opt.cert.empty())
    ro.certFile = opt.cert;
  if (!opt.key.empty())
    ro.keyFile = opt.key;
  if (!opt.journal.empty())
    ro.journalPath = opt.journal;
  ro.seconds = opt.seconds;

  engine::SpeechServices services;
  services.decoder = std::make_shared<audio::PcmChunkDecoder>();
  if (opt.mt_models.empty()) {
    std::cerr << "[mt] no --mt-models given, translation disabled\n";
    services.translator = std::make_shared<engine::UnavailableTranslator>();
  } else {
    try {
      services.translator = std::make_shared<mt::PairTranslator>(
          mt::LoadMarianModels(mt::MarianOptions{.modelDir = opt.mt_models,
                                                 .threads = opt.mt_threads}));
    } catch (const mt::ModelError &e) {
      std::cerr << e.what() << "\n";
      return 1;
    }
  }
  try {
    services.transcriber = std::make_shared<asr::WhisperTranscriber>(
        asr::WhisperOptions{.modelPath = opt.model,
                            .threads = opt.whisper_threads});
  } catch (const asr::ModelError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return Run(ro, std::move(services));
}
