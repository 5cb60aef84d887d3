#pragma once

#include "config.hpp"
#include "model/model_spec.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct TranscriptionRequest {
    std::filesystem::path audio;
    // Unset hints fall back to the runner's Config.
    std::optional<ModelSpec> model;
    std::optional<uint32_t> threads;
    std::optional<OutputFormat> format;
    std::optional<std::string> language;
    std::optional<bool> translate;
    std::optional<std::string> prompt;
    bool force_normalize = false;
    // Appended to the engine command line unchecked.
    std::vector<std::string> extra_args;
};

struct Segment {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string text;
};

struct TranscriptionResult {
    std::string text;
    std::vector<Segment> segments;  // filled for OutputFormat::Segments
    OutputFormat format = OutputFormat::Text;
    int exit_status = 0;
    double elapsed_s = 0.0;
    double engine_s = 0.0;
    bool normalized = false;
    std::string model_path;
    std::string binary_path;
};
