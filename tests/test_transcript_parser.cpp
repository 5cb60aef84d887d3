#include <catch2/catch_test_macros.hpp>

#include "engine/transcript_parser.hpp"

#include <nlohmann/json.hpp>

TEST_CASE("transcript::parse_timestamp", "[transcript]") {
    REQUIRE(transcript::parse_timestamp("00:00:00.000") == 0);
    REQUIRE(transcript::parse_timestamp("00:00:02.500") == 2500);
    REQUIRE(transcript::parse_timestamp("01:02:03.004") == 3723004);
    REQUIRE(transcript::parse_timestamp("00:00:01,250") == 1250);

    REQUIRE_FALSE(transcript::parse_timestamp("00:61:00.000").has_value());
    REQUIRE_FALSE(transcript::parse_timestamp("0:0:1.5").has_value());
    REQUIRE_FALSE(transcript::parse_timestamp("garbage").has_value());
}

TEST_CASE("transcript::parse_segments", "[transcript]") {
    std::string output =
        "\n"
        "[00:00:00.000 --> 00:00:02.500]   And so my fellow Americans,\n"
        "[00:00:02.500 --> 00:00:07.000]   ask not what your country can do for you\n"
        "whisper_print_timings:     load time =    12.34 ms\n"
        "[00:00:07.000 --> 00:00:07.000]\n";

    auto segments = transcript::parse_segments(output);
    REQUIRE(segments.size() == 3);
    REQUIRE(segments[0].start_ms == 0);
    REQUIRE(segments[0].end_ms == 2500);
    REQUIRE(segments[0].text == "And so my fellow Americans,");
    REQUIRE(segments[1].start_ms == 2500);
    REQUIRE(segments[1].text == "ask not what your country can do for you");
    REQUIRE(segments[2].text.empty());

    SECTION("JoinSkipsEmptySegments") {
        REQUIRE(transcript::join(segments) ==
                "And so my fellow Americans, ask not what your country can do for you");
    }

    SECTION("NoSegments") {
        REQUIRE(transcript::parse_segments("plain text\n").empty());
        REQUIRE(transcript::join({}).empty());
    }
}

TEST_CASE("transcript::trim", "[transcript]") {
    REQUIRE(transcript::trim("  hello world \n") == "hello world");
    REQUIRE(transcript::trim("\n\t ").empty());
}

TEST_CASE("transcript::to_json", "[transcript]") {
    TranscriptionResult r;
    r.format = OutputFormat::Segments;
    r.model_path = "/models/ggml-tiny.en.bin";
    r.segments = {{0, 1200, "hello"}, {1200, 2400, "world"}};
    r.text = transcript::join(r.segments);

    SECTION("fields") {
        auto j = nlohmann::json::parse(transcript::to_json(r));
        REQUIRE(j["text"] == "hello world");
        REQUIRE(j["format"] == "segments");
        REQUIRE(j["model"] == "/models/ggml-tiny.en.bin");
        REQUIRE(j["segments"].size() == 2);
        REQUIRE(j["segments"][1]["start_ms"] == 1200);
        REQUIRE(j["segments"][1]["text"] == "world");
    }

    SECTION("truncated multi-byte character is replaced") {
        // First two bytes of U+4F60.
        r.segments[1].text = "\xe4\xbd";
        r.text = "hello \xe4\xbd";
        std::string out;
        REQUIRE_NOTHROW(out = transcript::to_json(r));
        REQUIRE(out.find("\xEF\xBF\xBD") != std::string::npos);
        REQUIRE_NOTHROW(nlohmann::json::parse(out));
    }
}
