#pragma once

#include "error.hpp"
#include "platform/process_runner.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>

struct AudioNormalizerOptions {
    std::string ffmpeg = "ffmpeg";
    uint32_t sample_rate = 16000;
    std::filesystem::path temp_dir;
    std::chrono::seconds timeout{0};
    bool verbose = false;
};

// The engine's input file. Owns (and deletes) it when it is a conversion
// product; refers to the caller's file when no conversion was needed.
class NormalizedAudio {
public:
    NormalizedAudio() = default;
    NormalizedAudio(std::filesystem::path path, bool owned);
    ~NormalizedAudio();

    NormalizedAudio(NormalizedAudio&& other) noexcept;
    NormalizedAudio& operator=(NormalizedAudio&& other) noexcept;
    NormalizedAudio(const NormalizedAudio&) = delete;
    NormalizedAudio& operator=(const NormalizedAudio&) = delete;

    const std::filesystem::path& path() const { return path_; }
    bool converted() const { return owned_; }

private:
    void release();

    std::filesystem::path path_;
    bool owned_ = false;
};

// Brings input audio to 16-bit PCM mono WAV at the engine's sample rate.
// Conversion failures are reported, never retried: the cause is the input.
class AudioNormalizer {
public:
    AudioNormalizer(AudioNormalizerOptions options, ProcessRunner& runner);

    Result<NormalizedAudio> normalize(const std::filesystem::path& input, bool force = false,
                                      std::stop_token stop = {});

    // True when `input` already matches the engine's format.
    bool conforms(const std::filesystem::path& input) const;

private:
    std::filesystem::path temp_path() const;
    void log(const std::string& msg);

    AudioNormalizerOptions options_;
    ProcessRunner& runner_;
};
