#pragma once

#include <string>

namespace platform {

// Empty string when neither the XDG variable nor $HOME is set.
std::string config_dir();
std::string cache_dir();

// "<machine>-<os>", e.g. "x86_64-linux". Part of every build cache key.
std::string target_triple();

} // namespace platform
