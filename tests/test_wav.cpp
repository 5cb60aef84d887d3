#include <catch2/catch_test_macros.hpp>

#include "audio/wav.hpp"
#include "test_support.hpp"

#include <cstdint>
#include <string>
#include <vector>

using test_support::TmpDir;
using test_support::wav_bytes;

TEST_CASE("wav::inspect", "[wav]") {
    TmpDir dir;
    std::vector<int16_t> samples(1600, 7);

    SECTION("EncodedMono") {
        test_support::write_file(dir / "a.wav", wav_bytes(samples, 16000));
        auto fmt = wav::inspect(dir / "a.wav");
        REQUIRE(fmt.has_value());
        REQUIRE(fmt->audio_format == 1);
        REQUIRE(fmt->channels == 1);
        REQUIRE(fmt->sample_rate == 16000);
        REQUIRE(fmt->bits_per_sample == 16);
        REQUIRE(fmt->data_size == samples.size() * 2);
    }

    SECTION("StereoAt44k") {
        test_support::write_file(dir / "b.wav", wav_bytes(samples, 44100, 2));
        auto fmt = wav::inspect(dir / "b.wav");
        REQUIRE(fmt.has_value());
        REQUIRE(fmt->channels == 2);
        REQUIRE(fmt->sample_rate == 44100);
    }

    SECTION("SkipsUnknownChunks") {
        auto bytes = wav_bytes(samples, 16000);
        // Splice a LIST chunk with an odd payload between fmt and data.
        bytes.insert(36, std::string("LIST\x03\0\0\0abc\0", 12));
        test_support::write_file(dir / "c.wav", bytes);

        auto fmt = wav::inspect(dir / "c.wav");
        REQUIRE(fmt.has_value());
        REQUIRE(fmt->data_size == samples.size() * 2);
    }

    SECTION("NotAWav") {
        test_support::write_file(dir / "d.mp3", "ID3\x03 definitely not riff data");
        REQUIRE_FALSE(wav::inspect(dir / "d.mp3").has_value());
        REQUIRE_FALSE(wav::inspect(dir / "missing.wav").has_value());
    }

    SECTION("HeaderOnlyTruncated") {
        auto bytes = wav_bytes(samples, 16000);
        bytes.resize(30);
        test_support::write_file(dir / "e.wav", bytes);
        REQUIRE_FALSE(wav::inspect(dir / "e.wav").has_value());
    }
}

TEST_CASE("wav::inspect odd headers", "[wav]") {
    TmpDir dir;

    SECTION("EmptyData") {
        test_support::write_file(dir / "empty.wav", wav_bytes({}, 8000));
        auto fmt = wav::inspect(dir / "empty.wav");
        REQUIRE(fmt.has_value());
        REQUIRE(fmt->sample_rate == 8000);
        REQUIRE(fmt->data_size == 0);
    }

    SECTION("MissingDataChunk") {
        auto bytes = wav_bytes({1, 2, 3}, 16000);
        bytes.resize(36);
        test_support::write_file(dir / "nodata.wav", bytes);
        REQUIRE_FALSE(wav::inspect(dir / "nodata.wav").has_value());
    }
}
