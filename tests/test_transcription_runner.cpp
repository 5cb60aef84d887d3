#include <catch2/catch_test_macros.hpp>

#include "engine/transcription_runner.hpp"
#include "platform/linux/posix_process_runner.hpp"
#include "test_support.hpp"
#include "util/digest.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using test_support::TmpDir;

namespace {

const std::string kModelBody = "ggml tiny.en weights";

struct NoopSource : SourceFetcher {
    std::expected<void, StepFailure> fetch(const std::string&, const fs::path& dest,
                                           const ProcessOptions&) override {
        fs::create_directories(dest);
        return {};
    }
};

// Waits until `stop` fires, giving up after ten seconds.
void wait_for_stop(const std::stop_token& stop) {
    auto until = std::chrono::steady_clock::now() + 10s;
    while (!stop.stop_requested() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
    }
}

// "Builds" the engine by dropping a shell script in place.
struct ScriptToolchain : BuildToolchain {
    std::string engine;
    std::atomic<int> builds{0};
    bool hang = false;

    std::expected<fs::path, StepFailure> build(const fs::path& source_dir,
                                               const std::vector<std::string>&,
                                               const ProcessOptions& options) override {
        ++builds;
        if (hang) {
            wait_for_stop(options.stop);
            return std::unexpected(StepFailure{.message = "cmake build: cancelled",
                                               .cancelled = true});
        }
        auto bin = source_dir / "build" / "bin" / "whisper-cli";
        test_support::write_script(bin, engine);
        return bin;
    }
};

struct ModelServer : ModelFetcher {
    std::atomic<int> fetches{0};
    bool hang = false;
    bool fail = false;

    std::expected<FetchResult, FetchFailure> fetch(const std::string&, const fs::path& dest,
                                                   const FetchOptions& options) override {
        ++fetches;
        if (hang) {
            wait_for_stop(options.stop);
            return std::unexpected(FetchFailure{.message = "download cancelled", .cancelled = true});
        }
        if (fail) return std::unexpected(FetchFailure{.message = "HTTP 503"});
        test_support::write_file(dest, kModelBody);
        return FetchResult{.bytes_written = kModelBody.size(), .reported_size = std::nullopt};
    }
};

void write_wav(const fs::path& p, uint32_t sample_rate, uint16_t channels) {
    test_support::write_wav(p, 1600, sample_rate, channels);
}

// Everything wired the way WhisperKit does it, with fake git/cmake/network
// and shell scripts standing in for ffmpeg and the engine.
struct Harness {
    TmpDir dir;
    PosixProcessRunner runner;
    CacheDb db;
    NoopSource source;
    ScriptToolchain toolchain;
    ModelServer server;
    DependencyProber prober;
    Config config;
    std::unique_ptr<BuildCache> builds;
    std::unique_ptr<ModelResolver> models;
    std::unique_ptr<AudioNormalizer> audio;
    std::unique_ptr<TranscriptionRunner> runner_under_test;

    explicit Harness(std::vector<Requirement> requirements = {})
        : prober(runner, std::move(requirements), (dir / "no-tools").string()) {
        auto args_log = (dir / "args.log").string();
        // Output depends only on the audio bytes, so converted and
        // pre-normalized inputs transcribe identically.
        toolchain.engine =
            "echo \"$@\" > \"" + args_log + "\"\n"
            "for a; do\n"
            "  if [ \"$a\" = --fail ]; then echo 'model load error' >&2; exit 1; fi\n"
            "done\n"
            "sum=$(cksum < \"$4\" | cut -d' ' -f1)\n"
            "for a; do\n"
            "  if [ \"$a\" = -nt ]; then echo \" heard $sum\"; exit 0; fi\n"
            "done\n"
            "echo \"[00:00:00.000 --> 00:00:01.500]   heard\"\n"
            "echo \"[00:00:01.500 --> 00:00:03.000]   $sum\"\n";

        test_support::write_script(dir / "ffmpeg",
                                   "while [ $# -gt 1 ]; do\n"
                                   "  if [ \"$1\" = -i ]; then in=\"$2\"; fi\n"
                                   "  shift\n"
                                   "done\n"
                                   "cp \"$in\" \"$1\"\n");

        config.model.name = "tiny.en";
        config.transcription.threads = 1;

        db.open((dir / "cache.db").string());
        builds = std::make_unique<BuildCache>(BuildCacheOptions{.root = dir / "builds"}, db,
                                              source, toolchain, prober, runner);
        models = std::make_unique<ModelResolver>(
            ModelResolverOptions{.root = dir / "models"},
            ModelCatalog({{.name = "tiny.en", .url = "http://models/ggml-tiny.en.bin",
                           .size = kModelBody.size(), .sha1 = digest::sha1_hex(kModelBody)}}),
            server, db);
        audio = std::make_unique<AudioNormalizer>(
            AudioNormalizerOptions{.ffmpeg = (dir / "ffmpeg").string(), .sample_rate = 16000,
                                   .temp_dir = dir / "tmp"},
            runner);
        runner_under_test =
            std::make_unique<TranscriptionRunner>(config, *models, *builds, *audio, runner);
    }

    Result<TranscriptionResult> transcribe(const TranscriptionRequest& req,
                                           std::stop_token stop = {}) {
        return runner_under_test->transcribe(req, stop);
    }

    std::string engine_args() const {
        auto s = test_support::read_file(dir / "args.log");
        if (!s.empty() && s.back() == '\n') s.pop_back();
        return s;
    }
};

} // namespace

TEST_CASE("TranscriptionRunner", "[engine]") {
    Harness h;
    write_wav(h.dir / "clip.wav", 16000, 1);
    write_wav(h.dir / "clip-stereo.wav", 44100, 2);

    SECTION("PlainText") {
        auto res = h.transcribe({.audio = h.dir / "clip.wav"});
        REQUIRE(res.has_value());
        REQUIRE(res->text.starts_with("heard "));
        REQUIRE(res->format == OutputFormat::Text);
        REQUIRE(res->exit_status == 0);
        REQUIRE_FALSE(res->normalized);
        REQUIRE(res->segments.empty());
        REQUIRE(res->model_path == (h.dir / "models" / "ggml-tiny.en.bin").string());
        REQUIRE(res->elapsed_s >= res->engine_s);
        REQUIRE(h.engine_args() == "-m " + res->model_path + " -f " +
                                       (h.dir / "clip.wav").string() + " -t 1 -nt");
    }

    SECTION("Segments") {
        auto res = h.transcribe({.audio = h.dir / "clip.wav", .format = OutputFormat::Segments});
        REQUIRE(res.has_value());
        REQUIRE(res->segments.size() == 2);
        REQUIRE(res->segments[0].start_ms == 0);
        REQUIRE(res->segments[0].end_ms == 1500);
        REQUIRE(res->segments[0].text == "heard");
        REQUIRE(res->segments[1].end_ms == 3000);
        REQUIRE(res->text == "heard " + res->segments[1].text);
    }

    SECTION("HintsReachTheEngine") {
        auto res = h.transcribe({.audio = h.dir / "clip.wav",
                                 .language = "de",
                                 .translate = true,
                                 .prompt = "Glossary",
                                 .extra_args = {"--max-len", "40"}});
        REQUIRE(res.has_value());
        REQUIRE(h.engine_args().ends_with(" -t 1 -nt -l de -tr --prompt Glossary --max-len 40"));
    }

    SECTION("ConvertedAndPreNormalizedAgree") {
        auto direct = h.transcribe({.audio = h.dir / "clip.wav"});
        auto forced = h.transcribe({.audio = h.dir / "clip.wav", .force_normalize = true});
        REQUIRE(direct.has_value());
        REQUIRE(forced.has_value());
        REQUIRE_FALSE(direct->normalized);
        REQUIRE(forced->normalized);
        REQUIRE(direct->text == forced->text);
        REQUIRE(test_support::count_files(h.dir / "tmp") == 0);
    }

    SECTION("EngineFailureKeepsStderrAndCleansUp") {
        auto res = h.transcribe({.audio = h.dir / "clip-stereo.wav", .extra_args = {"--fail"}});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::EngineInvocationFailed);
        REQUIRE(res.error().output == "model load error\n");
        REQUIRE(test_support::count_files(h.dir / "tmp") == 0);
    }

    SECTION("RepeatedCallsReuseBinaryAndModel") {
        auto first = h.transcribe({.audio = h.dir / "clip.wav"});
        auto second = h.transcribe({.audio = h.dir / "clip.wav"});
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->binary_path == second->binary_path);
        REQUIRE(first->text == second->text);
    }

    SECTION("ExplicitModelPath") {
        test_support::write_file(h.dir / "custom.bin", "custom weights");
        auto res = h.transcribe({.audio = h.dir / "clip.wav",
                                 .model = ModelSpec::at_path((h.dir / "custom.bin").string())});
        REQUIRE(res.has_value());
        REQUIRE(fs::equivalent(res->model_path, h.dir / "custom.bin"));
    }
}

TEST_CASE("TranscriptionRunner rejects bad requests", "[engine]") {
    Harness h;
    write_wav(h.dir / "clip.wav", 16000, 1);

    SECTION("ZeroThreads") {
        auto res = h.transcribe({.audio = h.dir / "clip.wav", .threads = 0u});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::InvalidArgument);
    }

    SECTION("MoreThreadsThanCores") {
        unsigned hw = std::max(1u, std::thread::hardware_concurrency());
        auto res = h.transcribe({.audio = h.dir / "clip.wav", .threads = hw + 1});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::InvalidArgument);
    }

    SECTION("UnknownLanguage") {
        auto res = h.transcribe({.audio = h.dir / "clip.wav", .language = "klingon"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::InvalidArgument);
    }

    SECTION("NoAudio") {
        auto res = h.transcribe({});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::InvalidArgument);
    }

    SECTION("MissingModelFile") {
        auto res = h.transcribe({.audio = h.dir / "clip.wav",
                                 .model = ModelSpec::at_path((h.dir / "absent.bin").string())});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::ModelNotFound);
        REQUIRE_FALSE(fs::exists(h.dir / "args.log"));
    }

    SECTION("MissingAudio") {
        auto res = h.transcribe({.audio = h.dir / "absent.wav"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::AudioConversionFailed);
    }
}

TEST_CASE("TranscriptionRunner stops early", "[engine]") {
    auto since = [](std::chrono::steady_clock::time_point start) {
        return std::chrono::steady_clock::now() - start;
    };

    SECTION("MissingToolDoesNotWaitForTheDownload") {
        Harness h({{.tool = "wk-missing-cmake"}});
        write_wav(h.dir / "clip.wav", 16000, 1);
        h.server.hang = true;

        auto start = std::chrono::steady_clock::now();
        auto res = h.transcribe({.audio = h.dir / "clip.wav"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::MissingDependency);
        REQUIRE(since(start) < 5s);
        REQUIRE(h.toolchain.builds == 0);
    }

    SECTION("DownloadFailureDoesNotWaitForTheBuild") {
        Harness h;
        write_wav(h.dir / "clip.wav", 16000, 1);
        h.server.fail = true;
        h.toolchain.hang = true;

        auto start = std::chrono::steady_clock::now();
        auto res = h.transcribe({.audio = h.dir / "clip.wav"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::ModelDownloadFailed);
        REQUIRE(since(start) < 5s);
    }

    SECTION("UnknownModelStartsNothing") {
        Harness h;
        write_wav(h.dir / "clip.wav", 16000, 1);
        auto res = h.transcribe({.audio = h.dir / "clip.wav", .model = ModelSpec::named("huge")});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::UnknownModel);
        REQUIRE(res.error().names == std::vector<std::string>{"tiny.en"});
        REQUIRE(h.toolchain.builds == 0);
        REQUIRE(h.server.fetches == 0);
    }

    SECTION("CallerCancelStopsBoth") {
        Harness h;
        write_wav(h.dir / "clip.wav", 16000, 1);
        h.server.hang = true;
        h.toolchain.hang = true;

        std::stop_source stop;
        std::jthread canceller([&stop] {
            std::this_thread::sleep_for(100ms);
            stop.request_stop();
        });
        auto start = std::chrono::steady_clock::now();
        auto res = h.transcribe({.audio = h.dir / "clip.wav"}, stop.get_token());
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::Cancelled);
        REQUIRE(since(start) < 5s);
    }
}

TEST_CASE("Language table", "[engine]") {
    REQUIRE(is_known_language("en"));
    REQUIRE(is_known_language("auto"));
    REQUIRE(is_known_language("yue"));
    REQUIRE_FALSE(is_known_language("EN"));
    REQUIRE_FALSE(is_known_language(""));
}
