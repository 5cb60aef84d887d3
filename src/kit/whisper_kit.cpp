#include "whisper_kit.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <print>

namespace fs = std::filesystem;

namespace {

std::vector<Requirement> requirements_for(const Config& config) {
    auto reqs = DependencyProber::default_requirements();
    for (auto& r : reqs) {
        if (r.tool == "ffmpeg") r.tool = config.audio.ffmpeg;
    }
    return reqs;
}

// Download progress in tenths on stderr, for -v.
CurlModelFetcher::ProgressCallback download_progress(bool verbose) {
    if (!verbose) return nullptr;
    auto last = std::make_shared<std::atomic<int>>(-1);
    return [last](uint64_t now, uint64_t total) {
        int tenth = static_cast<int>(now * 10 / total);
        if (last->exchange(tenth) == tenth) return;
        std::println(stderr, "[whisper-kit] model: downloaded {} of {} MiB", now >> 20, total >> 20);
    };
}

} // namespace

WhisperKit::WhisperKit(Config config)
    : config_(std::move(config)),
      root_(config_.resolved_cache_dir()),
      prober_(runner_, requirements_for(config_)),
      source_(runner_, config_.engine.repo_url),
      toolchain_(runner_, config_.engine.binary_name, config_.engine.build_jobs),
      fetcher_(download_progress(config_.verbose)) {}

WhisperKit::~WhisperKit() = default;

Result<void> WhisperKit::init() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return fail(ErrorKind::Storage, "could not create " + root_.string() + ": " + ec.message());
    }
    if (!db_.open((root_ / "cache.db").string())) {
        return fail(ErrorKind::Storage, "could not open " + (root_ / "cache.db").string());
    }

    builds_ = std::make_unique<BuildCache>(
        BuildCacheOptions{
            .root = root_ / "builds",
            .timeout = std::chrono::seconds(config_.engine.build_timeout_s),
            .self_check_args = {},
            .self_check_expect = {},
            .verbose = config_.verbose,
        },
        db_, source_, toolchain_, prober_, runner_);

    models_ = std::make_unique<ModelResolver>(
        ModelResolverOptions{
            .root = root_ / "models",
            .timeout = std::chrono::seconds(config_.model.download_timeout_s),
            .verbose = config_.verbose,
        },
        ModelCatalog::whisper_cpp(config_.model.base_url), fetcher_, db_);

    audio_ = std::make_unique<AudioNormalizer>(
        AudioNormalizerOptions{
            .ffmpeg = config_.audio.ffmpeg,
            .sample_rate = config_.audio.sample_rate,
            .temp_dir = root_ / "tmp",
            .timeout = std::chrono::seconds(config_.audio.conversion_timeout_s),
            .verbose = config_.verbose,
        },
        runner_);

    transcriber_ = std::make_unique<TranscriptionRunner>(config_, *models_, *builds_, *audio_,
                                                         runner_);
    return {};
}

Result<EngineInstallation> WhisperKit::ensure_binary(std::stop_token stop) {
    return builds_->ensure_binary(config_.engine.revision, config_.engine.build_flags, stop);
}

Result<EngineInstallation> WhisperKit::rebuild(std::stop_token stop) {
    return builds_->force_rebuild(config_.engine.revision, config_.engine.build_flags, stop);
}

Result<TranscriptionResult> WhisperKit::transcribe(const TranscriptionRequest& request,
                                                   std::stop_token stop) {
    return transcriber_->transcribe(request, stop);
}
