#pragma once

#include "build/build_step.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

class BuildToolchain {
public:
    virtual ~BuildToolchain() = default;
    // Configures and builds the tree in `source_dir`; returns the engine executable.
    virtual std::expected<std::filesystem::path, StepFailure>
        build(const std::filesystem::path& source_dir, const std::vector<std::string>& flags,
              const ProcessOptions& options) = 0;
};
