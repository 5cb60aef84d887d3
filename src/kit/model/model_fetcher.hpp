#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

struct FetchResult {
    uint64_t bytes_written = 0;
    // What the source announced (Content-Length); nullopt when it did not say.
    std::optional<uint64_t> reported_size;
};

struct FetchFailure {
    std::string message;
    bool cancelled = false;
};

struct FetchOptions {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::stop_token stop;
};

class ModelFetcher {
public:
    virtual ~ModelFetcher() = default;
    // Writes the body of `url` to `dest`, truncating it. On failure `dest`
    // may hold a partial body; the caller discards it.
    virtual std::expected<FetchResult, FetchFailure>
        fetch(const std::string& url, const std::filesystem::path& dest,
              const FetchOptions& options) = 0;
};
