#pragma once

#include "build/build_step.hpp"

#include <expected>
#include <filesystem>
#include <string>

class SourceFetcher {
public:
    virtual ~SourceFetcher() = default;
    // Leaves a checkout of `revision` at `dest`, which must not exist yet.
    virtual std::expected<void, StepFailure>
        fetch(const std::string& revision, const std::filesystem::path& dest,
              const ProcessOptions& options) = 0;
};
