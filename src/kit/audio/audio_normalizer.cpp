#include "audio/audio_normalizer.hpp"

#include "audio/wav.hpp"

#include <atomic>
#include <format>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::atomic<uint64_t> temp_counter{0};

} // namespace

NormalizedAudio::NormalizedAudio(fs::path path, bool owned)
    : path_(std::move(path)), owned_(owned) {}

NormalizedAudio::~NormalizedAudio() {
    release();
}

NormalizedAudio::NormalizedAudio(NormalizedAudio&& other) noexcept
    : path_(std::move(other.path_)), owned_(other.owned_) {
    other.owned_ = false;
}

NormalizedAudio& NormalizedAudio::operator=(NormalizedAudio&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        owned_ = other.owned_;
        other.owned_ = false;
    }
    return *this;
}

void NormalizedAudio::release() {
    if (owned_ && !path_.empty()) {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    owned_ = false;
}

AudioNormalizer::AudioNormalizer(AudioNormalizerOptions options, ProcessRunner& runner)
    : options_(std::move(options)), runner_(runner) {}

bool AudioNormalizer::conforms(const fs::path& input) const {
    auto fmt = wav::inspect(input);
    return fmt && fmt->audio_format == 1 && fmt->channels == 1 &&
           fmt->sample_rate == options_.sample_rate && fmt->bits_per_sample == 16;
}

Result<NormalizedAudio> AudioNormalizer::normalize(const fs::path& input, bool force,
                                                   std::stop_token stop) {
    std::error_code ec;
    if (!fs::is_regular_file(input, ec)) {
        return fail(ErrorKind::AudioConversionFailed,
                    "input " + input.string() + " does not exist");
    }

    if (!force && conforms(input)) {
        log("input already 16-bit mono " + std::to_string(options_.sample_rate) +
            " Hz, skipping conversion");
        return NormalizedAudio(input, false);
    }

    fs::create_directories(options_.temp_dir, ec);
    if (ec) {
        return fail(ErrorKind::Storage,
                    "could not create " + options_.temp_dir.string() + ": " + ec.message());
    }

    // Owned from here on, so every failure path below removes the file.
    NormalizedAudio out(temp_path(), true);

    ProcessOptions opts;
    opts.deadline = deadline_after(options_.timeout);
    opts.stop = stop;

    log("converting " + input.string());
    auto res = runner_.run({options_.ffmpeg, "-nostdin", "-hide_banner", "-loglevel", "error",
                            "-y", "-i", input.string(),
                            "-ar", std::to_string(options_.sample_rate), "-ac", "1",
                            "-c:a", "pcm_s16le", out.path().string()},
                           opts);
    if (!res) {
        return fail(ErrorKind::AudioConversionFailed, res.error());
    }
    if (res->interrupted()) {
        return fail(ErrorKind::Cancelled,
                    res->timed_out ? "audio conversion timed out" : "audio conversion cancelled",
                    res->err);
    }
    if (res->exit_code != 0) {
        return fail(ErrorKind::AudioConversionFailed,
                    std::format("{} failed on {} (exit status {})", options_.ffmpeg,
                                input.string(), res->exit_code),
                    res->err);
    }
    if (!fs::is_regular_file(out.path(), ec)) {
        return fail(ErrorKind::AudioConversionFailed,
                    options_.ffmpeg + " reported success but wrote no output", res->err);
    }

    return out;
}

fs::path AudioNormalizer::temp_path() const {
    return options_.temp_dir /
           std::format("audio-{}-{}.wav", ::getpid(), temp_counter.fetch_add(1));
}

void AudioNormalizer::log(const std::string& msg) {
    if (options_.verbose) {
        std::println(stderr, "[whisper-kit] audio: {}", msg);
    }
}
