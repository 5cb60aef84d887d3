#pragma once

#include "platform/process_runner.hpp"

#include <expected>
#include <string>
#include <vector>

// Failure of one external build step (git, cmake).
struct StepFailure {
    std::string message;
    std::string output;
    bool cancelled = false;
};

// Runs one command and folds "could not start", "interrupted" and
// "non-zero exit" into a StepFailure labelled with `what`.
std::expected<ProcessResult, StepFailure> run_step(ProcessRunner& runner,
                                                   const std::vector<std::string>& argv,
                                                   const ProcessOptions& options,
                                                   const std::string& what);
