#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

struct ProcessOptions {
    std::filesystem::path cwd;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::stop_token stop;
};

struct ProcessResult {
    int exit_code = -1;  // -1 when terminated by a signal
    int signal = 0;
    bool cancelled = false;
    bool timed_out = false;
    std::string out;
    std::string err;

    bool interrupted() const { return cancelled || timed_out; }
    bool ok() const { return exit_code == 0 && !interrupted(); }
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Blocks until the child exits. The error side is used only when the
    // program could not be started at all; non-zero exits are results.
    virtual std::expected<ProcessResult, std::string>
        run(const std::vector<std::string>& argv, const ProcessOptions& options = {}) = 0;
};

// A zero timeout means "no deadline".
inline std::optional<std::chrono::steady_clock::time_point>
deadline_after(std::chrono::seconds timeout) {
    if (timeout.count() <= 0) return std::nullopt;
    return std::chrono::steady_clock::now() + timeout;
}

// PATH lookup. `search_path` overrides $PATH when non-empty.
std::optional<std::filesystem::path> find_executable(const std::string& name,
                                                     const std::string& search_path = {});
