#pragma once

#include "platform/process_runner.hpp"

#include <chrono>

// fork/exec runner. The child runs in its own process group so that
// cancellation reaches everything it spawned (cmake -> make -> cc).
class PosixProcessRunner : public ProcessRunner {
public:
    explicit PosixProcessRunner(std::chrono::milliseconds kill_grace = std::chrono::seconds(2));

    std::expected<ProcessResult, std::string>
        run(const std::vector<std::string>& argv, const ProcessOptions& options = {}) override;

private:
    std::chrono::milliseconds kill_grace_;
};
