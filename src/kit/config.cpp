#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* to_string(OutputFormat format) {
    return format == OutputFormat::Segments ? "segments" : "text";
}

bool parse_output_format(const std::string& s, OutputFormat& out) {
    if (s == "text") {
        out = OutputFormat::Text;
        return true;
    }
    if (s == "segments") {
        out = OutputFormat::Segments;
        return true;
    }
    return false;
}

std::string Config::resolved_cache_dir() const {
    if (!cache_dir.empty()) return cache_dir;
    auto dir = platform::cache_dir();
    if (!dir.empty()) return dir;
    return (fs::temp_directory_path() / "whisper-kit").string();
}

uint32_t Config::resolved_threads() const {
    if (transcription.threads > 0) return transcription.threads;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("cache_dir")) cfg.cache_dir = j["cache_dir"].get<std::string>();
        if (j.contains("verbose")) cfg.verbose = j["verbose"].get<bool>();

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("repo_url")) cfg.engine.repo_url = e["repo_url"].get<std::string>();
            if (e.contains("revision")) cfg.engine.revision = e["revision"].get<std::string>();
            if (e.contains("build_flags"))
                cfg.engine.build_flags = e["build_flags"].get<std::vector<std::string>>();
            if (e.contains("binary_name")) cfg.engine.binary_name = e["binary_name"].get<std::string>();
            if (e.contains("build_jobs")) cfg.engine.build_jobs = e["build_jobs"].get<uint32_t>();
            if (e.contains("build_timeout_s"))
                cfg.engine.build_timeout_s = e["build_timeout_s"].get<uint32_t>();
        }

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("name")) cfg.model.name = m["name"].get<std::string>();
            if (m.contains("path")) cfg.model.path = m["path"].get<std::string>();
            if (m.contains("base_url")) cfg.model.base_url = m["base_url"].get<std::string>();
            if (m.contains("download_timeout_s"))
                cfg.model.download_timeout_s = m["download_timeout_s"].get<uint32_t>();
        }

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("threads")) cfg.transcription.threads = t["threads"].get<uint32_t>();
            if (t.contains("output_format")) {
                auto s = t["output_format"].get<std::string>();
                if (!parse_output_format(s, cfg.transcription.output_format)) {
                    std::println(stderr, "config: unknown output_format '{}', using text", s);
                }
            }
            if (t.contains("language")) cfg.transcription.language = t["language"].get<std::string>();
            if (t.contains("translate")) cfg.transcription.translate = t["translate"].get<bool>();
            if (t.contains("prompt")) cfg.transcription.prompt = t["prompt"].get<std::string>();
            if (t.contains("timeout_s")) cfg.transcription.timeout_s = t["timeout_s"].get<uint32_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("ffmpeg")) cfg.audio.ffmpeg = a["ffmpeg"].get<std::string>();
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("conversion_timeout_s"))
                cfg.audio.conversion_timeout_s = a["conversion_timeout_s"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
