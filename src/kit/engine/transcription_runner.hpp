#pragma once

#include "audio/audio_normalizer.hpp"
#include "build/build_cache.hpp"
#include "config.hpp"
#include "engine/transcription.hpp"
#include "error.hpp"
#include "model/model_resolver.hpp"
#include "platform/process_runner.hpp"

#include <stop_token>
#include <string>
#include <vector>

// Model + engine binary + audio -> transcript. Keeps no state between
// requests: every call runs the engine again.
class TranscriptionRunner {
public:
    TranscriptionRunner(Config config, ModelResolver& models, BuildCache& builds,
                        AudioNormalizer& audio, ProcessRunner& runner);

    Result<TranscriptionResult> transcribe(const TranscriptionRequest& request,
                                           std::stop_token stop = {});

private:
    struct Plan {
        ModelSpec model;
        uint32_t threads;
        OutputFormat format;
        std::string language;
        bool translate;
        std::string prompt;
    };

    // Applies Config defaults and checks the hints the engine is known to accept.
    Result<Plan> plan(const TranscriptionRequest& request) const;

    std::vector<std::string> engine_argv(const Plan& plan, const std::string& binary,
                                         const std::string& model, const std::string& audio,
                                         const std::vector<std::string>& extra) const;

    void log(const std::string& msg);

    Config config_;
    ModelResolver& models_;
    BuildCache& builds_;
    AudioNormalizer& audio_;
    ProcessRunner& runner_;
};

// Language codes whisper.cpp accepts for -l, plus "auto".
bool is_known_language(const std::string& code);
