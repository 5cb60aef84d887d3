#include "audio/wav.hpp"

#include <cstring>
#include <fstream>

namespace wav {

namespace {

template <typename T>
bool read_le(std::istream& in, T& v) {
    // Little-endian hosts only.
    return static_cast<bool>(in.read(reinterpret_cast<char*>(&v), sizeof(T)));
}

} // namespace

std::optional<Format> inspect(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::nullopt;

    char riff[4], wave[4];
    uint32_t riff_size;
    if (!f.read(riff, 4) || !read_le(f, riff_size) || !f.read(wave, 4)) return std::nullopt;
    if (std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(wave, "WAVE", 4) != 0) return std::nullopt;

    Format fmt;
    bool have_fmt = false;
    char id[4];
    uint32_t size;
    while (f.read(id, 4) && read_le(f, size)) {
        if (std::memcmp(id, "fmt ", 4) == 0) {
            if (size < 16) return std::nullopt;
            uint32_t byte_rate;
            uint16_t block_align;
            if (!read_le(f, fmt.audio_format) || !read_le(f, fmt.channels) ||
                !read_le(f, fmt.sample_rate) || !read_le(f, byte_rate) ||
                !read_le(f, block_align) || !read_le(f, fmt.bits_per_sample)) {
                return std::nullopt;
            }
            f.seekg(size - 16 + (size & 1), std::ios::cur);
            have_fmt = true;
        } else if (std::memcmp(id, "data", 4) == 0) {
            if (!have_fmt) return std::nullopt;
            fmt.data_size = size;
            return fmt;
        } else {
            // Chunks are word aligned.
            f.seekg(size + (size & 1), std::ios::cur);
        }
    }
    return std::nullopt;
}

} // namespace wav
