#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace wav {

struct Format {
    uint16_t audio_format = 0;  // 1 = PCM
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    uint32_t data_size = 0;
};

// Reads the RIFF header of a file. nullopt for anything that is not a
// readable RIFF/WAVE with both a fmt and a data chunk.
std::optional<Format> inspect(const std::filesystem::path& path);

} // namespace wav
