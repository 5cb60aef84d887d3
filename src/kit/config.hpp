#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class OutputFormat { Text, Segments };

struct Config {
    // Empty means platform::cache_dir(), see resolved_cache_dir().
    std::string cache_dir;
    bool verbose = false;

    struct Engine {
        std::string repo_url = "https://github.com/ggerganov/whisper.cpp.git";
        std::string revision = "v1.7.6";
        std::vector<std::string> build_flags = {"-DCMAKE_BUILD_TYPE=Release"};
        std::string binary_name = "whisper-cli";
        uint32_t build_jobs = 0;       // 0 = hardware concurrency
        uint32_t build_timeout_s = 0;  // 0 = no deadline
    } engine;

    struct Model {
        std::string name = "base.en";
        std::string path;  // wins over name when set
        std::string base_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";
        uint32_t download_timeout_s = 0;
    } model;

    struct Transcription {
        uint32_t threads = 0;  // 0 = hardware concurrency
        OutputFormat output_format = OutputFormat::Text;
        std::string language;
        bool translate = false;
        std::string prompt;
        uint32_t timeout_s = 0;
    } transcription;

    struct Audio {
        std::string ffmpeg = "ffmpeg";
        uint32_t sample_rate = 16000;
        uint32_t conversion_timeout_s = 0;
    } audio;

    std::string resolved_cache_dir() const;
    uint32_t resolved_threads() const;

    static Config load(const std::string& path);
    static Config load_default();
};

const char* to_string(OutputFormat format);
bool parse_output_format(const std::string& s, OutputFormat& out);
