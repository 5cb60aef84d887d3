#pragma once

#include "build/build_toolchain.hpp"
#include "platform/process_runner.hpp"

#include <cstdint>
#include <string>

class CMakeToolchain : public BuildToolchain {
public:
    // jobs == 0 uses the hardware concurrency.
    CMakeToolchain(ProcessRunner& runner, std::string binary_name, uint32_t jobs = 0,
                   std::string cmake = "cmake");

    std::expected<std::filesystem::path, StepFailure>
        build(const std::filesystem::path& source_dir, const std::vector<std::string>& flags,
              const ProcessOptions& options) override;

private:
    ProcessRunner& runner_;
    std::string binary_name_;
    uint32_t jobs_;
    std::string cmake_;
};
