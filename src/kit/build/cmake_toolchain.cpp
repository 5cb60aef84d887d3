#include "build/cmake_toolchain.hpp"

#include <algorithm>
#include <thread>

namespace fs = std::filesystem;

CMakeToolchain::CMakeToolchain(ProcessRunner& runner, std::string binary_name, uint32_t jobs,
                               std::string cmake)
    : runner_(runner), binary_name_(std::move(binary_name)), jobs_(jobs),
      cmake_(std::move(cmake)) {}

std::expected<fs::path, StepFailure>
CMakeToolchain::build(const fs::path& source_dir, const std::vector<std::string>& flags,
                      const ProcessOptions& options) {
    auto build_dir = source_dir / "build";

    ProcessOptions opts = options;
    opts.cwd = source_dir;

    std::vector<std::string> configure = {cmake_, "-S", source_dir.string(), "-B",
                                          build_dir.string()};
    configure.insert(configure.end(), flags.begin(), flags.end());

    auto configured = run_step(runner_, configure, opts, "cmake configure");
    if (!configured) return std::unexpected(configured.error());

    uint32_t jobs = jobs_ > 0 ? jobs_ : std::max(1u, std::thread::hardware_concurrency());
    auto built = run_step(runner_,
                          {cmake_, "--build", build_dir.string(), "--config", "Release", "-j",
                           std::to_string(jobs)},
                          opts, "cmake build");
    if (!built) return std::unexpected(built.error());

    auto binary = build_dir / "bin" / binary_name_;
    std::error_code ec;
    if (!fs::is_regular_file(binary, ec)) {
        return std::unexpected(StepFailure{
            .message = "build finished but " + binary.string() + " was not produced",
            .output = built->out + built->err,
        });
    }
    return binary;
}
