#pragma once

#include "model/model_fetcher.hpp"

#include <functional>

class CurlModelFetcher : public ModelFetcher {
public:
    using ProgressCallback = std::function<void(uint64_t now, uint64_t total)>;

    explicit CurlModelFetcher(ProgressCallback progress = nullptr);
    ~CurlModelFetcher() override;

    CurlModelFetcher(const CurlModelFetcher&) = delete;
    CurlModelFetcher& operator=(const CurlModelFetcher&) = delete;

    std::expected<FetchResult, FetchFailure>
        fetch(const std::string& url, const std::filesystem::path& dest,
              const FetchOptions& options) override;

private:
    ProgressCallback progress_;
};
