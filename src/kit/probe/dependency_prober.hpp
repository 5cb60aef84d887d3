#pragma once

#include "platform/process_runner.hpp"

#include <string>
#include <vector>

struct Requirement {
    std::string tool;
    std::vector<std::string> version_args = {"--version"};
    std::string min_version;  // empty: presence is enough
};

enum class DependencyStatus { Found, Missing, TooOld };

struct DependencyCheck {
    std::string tool;
    DependencyStatus status = DependencyStatus::Missing;
    std::string path;
    std::string version;  // empty when the tool did not report one
    std::string min_version;
};

struct ProbeReport {
    std::vector<DependencyCheck> checks;

    bool ok() const;
    // "cmake (missing)", "git (2.1.0 < 2.20)".
    std::vector<std::string> problems() const;
    // Package manager command lines naming every tool that is not usable.
    std::string install_hint() const;
};

// Read-only: looks tools up on PATH and asks each for its version.
class DependencyProber {
public:
    DependencyProber(ProcessRunner& runner, std::vector<Requirement> requirements,
                     std::string search_path = {});

    ProbeReport probe() const;

    static std::vector<Requirement> default_requirements();

private:
    DependencyCheck check(const Requirement& req) const;

    ProcessRunner& runner_;
    std::vector<Requirement> requirements_;
    std::string search_path_;
};

// First dotted number in `text` ("cmake version 3.28.3" -> "3.28.3").
std::string extract_version(const std::string& text);
// -1, 0, 1 comparing dotted numeric versions; missing components count as 0.
int compare_versions(const std::string& a, const std::string& b);

const char* to_string(DependencyStatus status);
