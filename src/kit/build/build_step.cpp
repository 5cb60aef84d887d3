#include "build/build_step.hpp"

#include <format>

std::expected<ProcessResult, StepFailure> run_step(ProcessRunner& runner,
                                                   const std::vector<std::string>& argv,
                                                   const ProcessOptions& options,
                                                   const std::string& what) {
    auto res = runner.run(argv, options);
    if (!res) {
        return std::unexpected(StepFailure{.message = what + ": " + res.error()});
    }
    if (res->interrupted()) {
        return std::unexpected(StepFailure{
            .message = what + (res->timed_out ? ": timed out" : ": cancelled"),
            .output = res->out + res->err,
            .cancelled = true,
        });
    }
    if (res->exit_code != 0) {
        auto status = res->signal ? std::format("killed by signal {}", res->signal)
                                  : std::format("exit status {}", res->exit_code);
        return std::unexpected(StepFailure{
            .message = std::format("{} failed ({})", what, status),
            .output = res->out + res->err,
        });
    }
    return std::move(*res);
}
