#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct EngineInstallation {
    std::string cache_key;
    std::string revision;
    std::vector<std::string> build_flags;
    std::string platform;
    std::string source_dir;
    std::string binary_path;
    // Recorded at build time; a mismatch later means the file was replaced.
    uint64_t binary_size = 0;
    int64_t binary_mtime = 0;
    std::string built_at;
};
