#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sys/utsname.h>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/whisper-kit";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/whisper-kit";
}

std::string cache_dir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/whisper-kit";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.cache/whisper-kit";
}

std::string target_triple() {
    utsname info{};
    if (::uname(&info) != 0) return "unknown-unknown";

    std::string os = info.sysname;
    std::ranges::transform(os, os.begin(), [](unsigned char c) { return std::tolower(c); });
    return std::string(info.machine) + "-" + os;
}

} // namespace platform
