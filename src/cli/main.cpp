#include "config.hpp"
#include "engine/transcript_parser.hpp"
#include "whisper_kit.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <print>
#include <pthread.h>
#include <signal.h>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command> [args]", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -h, --help          Show this help");
    std::println(stderr, "Commands:");
    std::println(stderr, "  transcribe <audio> [--model NAME | --model-path PATH] [--threads N]");
    std::println(stderr, "             [--language L] [--translate] [--prompt P] [--segments]");
    std::println(stderr, "             [--force-convert] [--json] [-- ENGINE_ARGS...]");
    std::println(stderr, "  probe                Check required external tools");
    std::println(stderr, "  models               List known models and local presence");
    std::println(stderr, "  build                Build the engine if needed, print its path");
    std::println(stderr, "  rebuild              Rebuild the engine from scratch");
}

static void print_error(const Error& e) {
    std::println(stderr, "Error: {}", e.describe());
    if (!e.output.empty()) {
        std::print(stderr, "{}", e.output);
        if (e.output.back() != '\n') std::println(stderr, "");
    }
}

static std::string format_timestamp(int64_t ms) {
    return std::format("{:02}:{:02}:{:02}.{:03}", ms / 3600000, (ms / 60000) % 60,
                       (ms / 1000) % 60, ms % 1000);
}

static int cmd_probe(WhisperKit& kit) {
    auto report = kit.probe();
    for (const auto& c : report.checks) {
        std::println("{:<8} {:<8} {} {}", c.tool, to_string(c.status), c.version, c.path);
    }
    if (!report.ok()) {
        std::println(stderr, "{}", report.install_hint());
        return 1;
    }
    return 0;
}

static int cmd_models(WhisperKit& kit) {
    for (const auto& e : kit.models().catalog().entries()) {
        std::error_code ec;
        auto path = kit.models().local_path(e.name);
        bool present = std::filesystem::exists(path, ec);
        std::println("{:<20} {}", e.name, present ? path.string() : "-");
    }
    return 0;
}

static int cmd_build(WhisperKit& kit, bool force, std::stop_token stop) {
    auto inst = force ? kit.rebuild(stop) : kit.ensure_binary(stop);
    if (!inst) {
        print_error(inst.error());
        return 1;
    }
    std::println("{}", inst->binary_path);
    return 0;
}

static int cmd_transcribe(WhisperKit& kit, const std::vector<std::string>& args,
                          std::stop_token stop) {
    TranscriptionRequest req;
    bool as_json = false;

    for (size_t i = 0; i < args.size(); i++) {
        const auto& arg = args[i];
        bool has_value = i + 1 < args.size();
        if (arg == "--model" && has_value) {
            req.model = ModelSpec::named(args[++i]);
        } else if (arg == "--model-path" && has_value) {
            req.model = ModelSpec::at_path(args[++i]);
        } else if (arg == "--threads" && has_value) {
            req.threads = static_cast<uint32_t>(std::atoi(args[++i].c_str()));
        } else if (arg == "--language" && has_value) {
            req.language = args[++i];
        } else if (arg == "--prompt" && has_value) {
            req.prompt = args[++i];
        } else if (arg == "--translate") {
            req.translate = true;
        } else if (arg == "--segments") {
            req.format = OutputFormat::Segments;
        } else if (arg == "--force-convert") {
            req.force_normalize = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--") {
            req.extra_args.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            break;
        } else if (req.audio.empty() && !arg.starts_with("-")) {
            req.audio = arg;
        } else {
            std::println(stderr, "Unknown argument: {}", arg);
            return 2;
        }
    }

    if (req.audio.empty()) {
        std::println(stderr, "transcribe: no audio file given");
        return 2;
    }

    auto result = kit.transcribe(req, stop);
    if (!result) {
        print_error(result.error());
        return 1;
    }

    if (as_json) {
        std::println("{}", transcript::to_json(*result));
    } else if (result->format == OutputFormat::Segments) {
        for (const auto& s : result->segments) {
            std::println("[{} --> {}]  {}", format_timestamp(s.start_ms),
                         format_timestamp(s.end_ms), s.text);
        }
    } else {
        std::println("{}", result->text);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!command.empty()) {
            args.push_back(arg);
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            command = arg;
        }
    }

    if (command.empty()) {
        usage(argv[0]);
        return 2;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (verbose) config.verbose = true;

    // SIGINT/SIGTERM cancel the running build, download or transcription.
    // Blocked before any thread starts so only the watcher receives them.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    std::stop_source cancel;
    std::jthread watcher([&cancel, mask](std::stop_token self) {
        timespec tick{0, 200 * 1000 * 1000};
        while (!self.stop_requested()) {
            if (sigtimedwait(&mask, nullptr, &tick) > 0) {
                std::println(stderr, "[whisper-kit] interrupted, cancelling");
                cancel.request_stop();
                return;
            }
        }
    });

    WhisperKit kit(std::move(config));
    if (auto ok = kit.init(); !ok) {
        print_error(ok.error());
        return 1;
    }

    auto stop = cancel.get_token();
    if (command == "transcribe") return cmd_transcribe(kit, args, stop);
    if (command == "probe") return cmd_probe(kit);
    if (command == "models") return cmd_models(kit);
    if (command == "build") return cmd_build(kit, false, stop);
    if (command == "rebuild") return cmd_build(kit, true, stop);

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 2;
}
