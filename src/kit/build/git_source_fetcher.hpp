#pragma once

#include "build/source_fetcher.hpp"
#include "platform/process_runner.hpp"

#include <string>

class GitSourceFetcher : public SourceFetcher {
public:
    GitSourceFetcher(ProcessRunner& runner, std::string repo_url, std::string git = "git");

    std::expected<void, StepFailure>
        fetch(const std::string& revision, const std::filesystem::path& dest,
              const ProcessOptions& options) override;

private:
    ProcessRunner& runner_;
    std::string repo_url_;
    std::string git_;
};
