#include "build/git_source_fetcher.hpp"

GitSourceFetcher::GitSourceFetcher(ProcessRunner& runner, std::string repo_url, std::string git)
    : runner_(runner), repo_url_(std::move(repo_url)), git_(std::move(git)) {}

std::expected<void, StepFailure>
GitSourceFetcher::fetch(const std::string& revision, const std::filesystem::path& dest,
                        const ProcessOptions& options) {
    ProcessOptions opts = options;
    opts.cwd = dest.parent_path();

    auto cloned = run_step(runner_,
                           {git_, "clone", "--recurse-submodules", repo_url_, dest.string()},
                           opts, "git clone");
    if (!cloned) return std::unexpected(cloned.error());

    opts.cwd = dest;
    auto checked_out = run_step(runner_, {git_, "checkout", revision}, opts, "git checkout");
    if (!checked_out) return std::unexpected(checked_out.error());

    // Submodules must follow the checked-out revision, not the default branch.
    auto updated = run_step(runner_, {git_, "submodule", "update", "--init", "--recursive"},
                            opts, "git submodule update");
    if (!updated) return std::unexpected(updated.error());

    return {};
}
