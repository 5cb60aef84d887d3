#pragma once

#include "audio/audio_normalizer.hpp"
#include "build/build_cache.hpp"
#include "build/cmake_toolchain.hpp"
#include "build/git_source_fetcher.hpp"
#include "config.hpp"
#include "engine/transcription_runner.hpp"
#include "error.hpp"
#include "model/curl_model_fetcher.hpp"
#include "model/model_resolver.hpp"
#include "platform/linux/posix_process_runner.hpp"
#include "probe/dependency_prober.hpp"
#include "storage/cache_db.hpp"

#include <filesystem>
#include <memory>
#include <stop_token>

// Wires the production collaborators (git, cmake, ffmpeg, libcurl) under
// one cache root:
//   <root>/builds/  engine trees, one per cache key
//   <root>/models/  ggml-<name>.bin
//   <root>/tmp/     normalized audio
//   <root>/cache.db
class WhisperKit {
public:
    explicit WhisperKit(Config config);
    ~WhisperKit();

    WhisperKit(const WhisperKit&) = delete;
    WhisperKit& operator=(const WhisperKit&) = delete;

    // Creates the cache root and opens the database.
    Result<void> init();

    ProbeReport probe() const { return prober_.probe(); }

    Result<EngineInstallation> ensure_binary(std::stop_token stop = {});
    Result<EngineInstallation> rebuild(std::stop_token stop = {});
    Result<TranscriptionResult> transcribe(const TranscriptionRequest& request,
                                           std::stop_token stop = {});

    ModelResolver& models() { return *models_; }

private:
    Config config_;
    std::filesystem::path root_;

    PosixProcessRunner runner_;
    CacheDb db_;
    DependencyProber prober_;
    GitSourceFetcher source_;
    CMakeToolchain toolchain_;
    CurlModelFetcher fetcher_;

    std::unique_ptr<BuildCache> builds_;
    std::unique_ptr<ModelResolver> models_;
    std::unique_ptr<AudioNormalizer> audio_;
    std::unique_ptr<TranscriptionRunner> transcriber_;
};
