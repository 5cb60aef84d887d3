#include "probe/dependency_prober.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <regex>
#include <sstream>

const char* to_string(DependencyStatus status) {
    switch (status) {
        case DependencyStatus::Found: return "found";
        case DependencyStatus::Missing: return "missing";
        case DependencyStatus::TooOld: return "too old";
    }
    return "unknown";
}

bool ProbeReport::ok() const {
    for (const auto& c : checks) {
        if (c.status != DependencyStatus::Found) return false;
    }
    return true;
}

std::vector<std::string> ProbeReport::problems() const {
    std::vector<std::string> out;
    for (const auto& c : checks) {
        if (c.status == DependencyStatus::Missing) {
            out.push_back(c.tool + " (missing)");
        } else if (c.status == DependencyStatus::TooOld) {
            out.push_back(std::format("{} ({} < {})", c.tool, c.version, c.min_version));
        }
    }
    return out;
}

std::string ProbeReport::install_hint() const {
    std::string tools;
    for (const auto& c : checks) {
        if (c.status == DependencyStatus::Found) continue;
        if (!tools.empty()) tools += " ";
        tools += c.tool;
    }
    if (tools.empty()) return {};

    return std::format(
        "Please install them using your system's package manager:\n"
        "- For Ubuntu/Debian: sudo apt-get install {0} build-essential\n"
        "- For CentOS/RHEL: sudo yum install {0} gcc-c++ make\n"
        "- For macOS: brew install {0}",
        tools);
}

DependencyProber::DependencyProber(ProcessRunner& runner, std::vector<Requirement> requirements,
                                   std::string search_path)
    : runner_(runner), requirements_(std::move(requirements)),
      search_path_(std::move(search_path)) {}

std::vector<Requirement> DependencyProber::default_requirements() {
    return {
        {.tool = "git", .version_args = {"--version"}, .min_version = "2.0"},
        {.tool = "cmake", .version_args = {"--version"}, .min_version = "3.5"},
        {.tool = "make", .version_args = {"--version"}, .min_version = ""},
        {.tool = "gcc", .version_args = {"--version"}, .min_version = ""},
        {.tool = "g++", .version_args = {"--version"}, .min_version = ""},
        {.tool = "ffmpeg", .version_args = {"-version"}, .min_version = ""},
    };
}

ProbeReport DependencyProber::probe() const {
    ProbeReport report;
    report.checks.reserve(requirements_.size());
    for (const auto& req : requirements_) {
        report.checks.push_back(check(req));
    }
    return report;
}

DependencyCheck DependencyProber::check(const Requirement& req) const {
    DependencyCheck c{.tool = req.tool, .min_version = req.min_version};

    auto path = find_executable(req.tool, search_path_);
    if (!path) return c;
    c.path = path->string();

    std::vector<std::string> argv = {c.path};
    argv.insert(argv.end(), req.version_args.begin(), req.version_args.end());

    ProcessOptions opts;
    opts.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    auto res = runner_.run(argv, opts);
    if (!res) return c;  // present on PATH but not runnable

    // Some tools print their banner on stderr.
    c.version = extract_version(res->out.empty() ? res->err : res->out);
    c.status = DependencyStatus::Found;

    if (!req.min_version.empty() && !c.version.empty() &&
        compare_versions(c.version, req.min_version) < 0) {
        c.status = DependencyStatus::TooOld;
    }
    return c;
}

std::string extract_version(const std::string& text) {
    static const std::regex re(R"((\d+)\.(\d+)(\.\d+)?)");
    std::smatch m;
    if (std::regex_search(text, m, re)) return m.str(0);
    return {};
}

int compare_versions(const std::string& a, const std::string& b) {
    auto split = [](const std::string& v) {
        std::vector<long> parts;
        std::stringstream ss(v);
        std::string item;
        while (std::getline(ss, item, '.')) {
            try {
                parts.push_back(std::stol(item));
            } catch (const std::exception&) {
                parts.push_back(0);
            }
        }
        return parts;
    };

    auto pa = split(a);
    auto pb = split(b);
    size_t n = std::max(pa.size(), pb.size());
    for (size_t i = 0; i < n; ++i) {
        long x = i < pa.size() ? pa[i] : 0;
        long y = i < pb.size() ? pb[i] : 0;
        if (x != y) return x < y ? -1 : 1;
    }
    return 0;
}
