#include "engine/transcription_runner.hpp"

#include "engine/transcript_parser.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <future>
#include <iterator>
#include <print>
#include <stop_token>
#include <string_view>
#include <thread>

namespace {

constexpr std::string_view kLanguages[] = {
    "auto", "en", "zh", "de", "es", "ru", "ko", "fr", "ja", "pt", "tr", "pl", "ca", "nl",
    "ar", "sv", "it", "id", "hi", "fi", "vi", "he", "uk", "el", "ms", "cs", "ro", "da",
    "hu", "ta", "no", "th", "ur", "hr", "bg", "lt", "la", "mi", "ml", "cy", "sk", "te",
    "fa", "lv", "bn", "sr", "az", "sl", "kn", "et", "mk", "br", "eu", "is", "hy", "ne",
    "mn", "bs", "kk", "sq", "sw", "gl", "mr", "pa", "si", "km", "sn", "yo", "so", "af",
    "oc", "ka", "be", "tg", "sd", "gu", "am", "yi", "lo", "uz", "fo", "ht", "ps", "tk",
    "nn", "mt", "sa", "lb", "my", "bo", "tl", "mg", "as", "tt", "haw", "ln", "ha", "ba",
    "jw", "su", "yue",
};

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

bool is_known_language(const std::string& code) {
    return std::ranges::find(kLanguages, code) != std::end(kLanguages);
}

TranscriptionRunner::TranscriptionRunner(Config config, ModelResolver& models, BuildCache& builds,
                                         AudioNormalizer& audio, ProcessRunner& runner)
    : config_(std::move(config)), models_(models), builds_(builds), audio_(audio),
      runner_(runner) {}

Result<TranscriptionRunner::Plan>
TranscriptionRunner::plan(const TranscriptionRequest& request) const {
    Plan p{
        .model = request.model.value_or(config_.model.path.empty()
                                            ? ModelSpec::named(config_.model.name)
                                            : ModelSpec::at_path(config_.model.path)),
        .threads = request.threads.value_or(config_.resolved_threads()),
        .format = request.format.value_or(config_.transcription.output_format),
        .language = request.language.value_or(config_.transcription.language),
        .translate = request.translate.value_or(config_.transcription.translate),
        .prompt = request.prompt.value_or(config_.transcription.prompt),
    };

    unsigned hw = std::max(1u, std::thread::hardware_concurrency());
    if (p.threads < 1 || p.threads > hw) {
        return fail(ErrorKind::InvalidArgument,
                    std::format("thread count {} outside 1..{}", p.threads, hw));
    }
    if (!p.language.empty() && !is_known_language(p.language)) {
        return fail(ErrorKind::InvalidArgument, "unknown language '" + p.language + "'");
    }
    if (request.audio.empty()) {
        return fail(ErrorKind::InvalidArgument, "no input audio given");
    }
    return p;
}

std::vector<std::string> TranscriptionRunner::engine_argv(const Plan& plan,
                                                          const std::string& binary,
                                                          const std::string& model,
                                                          const std::string& audio,
                                                          const std::vector<std::string>& extra) const {
    std::vector<std::string> argv = {binary, "-m", model, "-f", audio,
                                     "-t", std::to_string(plan.threads)};
    if (plan.format == OutputFormat::Text) argv.push_back("-nt");
    if (!plan.language.empty()) {
        argv.push_back("-l");
        argv.push_back(plan.language);
    }
    if (plan.translate) argv.push_back("-tr");
    if (!plan.prompt.empty()) {
        argv.push_back("--prompt");
        argv.push_back(plan.prompt);
    }
    argv.insert(argv.end(), extra.begin(), extra.end());
    return argv;
}

Result<TranscriptionResult> TranscriptionRunner::transcribe(const TranscriptionRequest& request,
                                                            std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();

    auto p = plan(request);
    if (!p) return std::unexpected(p.error());
    if (auto known = models_.check(p->model); !known) return std::unexpected(known.error());

    // Model and binary are independent; the download overlaps the build.
    // The first of the two to fail stops the other.
    std::stop_source request_stop;
    std::stop_callback forward(stop, [&request_stop] { request_stop.request_stop(); });

    auto model_future = std::async(std::launch::async,
                                   [this, spec = p->model, &request_stop] {
        auto m = models_.resolve(spec, request_stop.get_token());
        if (!m) request_stop.request_stop();
        return m;
    });
    auto engine = builds_.ensure_binary(config_.engine.revision, config_.engine.build_flags,
                                        request_stop.get_token());
    if (!engine) request_stop.request_stop();
    auto model = model_future.get();

    if (!model && !engine) {
        // Report the cause, not the cancellation it triggered.
        if (engine.error().kind == ErrorKind::Cancelled &&
            model.error().kind != ErrorKind::Cancelled) {
            return std::unexpected(model.error());
        }
        return std::unexpected(engine.error());
    }
    if (!model) return std::unexpected(model.error());
    if (!engine) return std::unexpected(engine.error());

    auto audio = audio_.normalize(request.audio, request.force_normalize, stop);
    if (!audio) return std::unexpected(audio.error());

    auto argv = engine_argv(*p, engine->binary_path, model->path, audio->path().string(),
                            request.extra_args);

    ProcessOptions opts;
    opts.deadline = deadline_after(std::chrono::seconds(config_.transcription.timeout_s));
    opts.stop = stop;

    log(std::format("running {} on {} ({} threads)", engine->binary_path,
                    audio->path().string(), p->threads));
    auto engine_start = std::chrono::steady_clock::now();
    auto res = runner_.run(argv, opts);
    double engine_s = seconds_since(engine_start);

    if (!res) {
        return fail(ErrorKind::EngineInvocationFailed, res.error());
    }
    if (res->interrupted()) {
        return fail(ErrorKind::Cancelled,
                    res->timed_out ? "transcription timed out" : "transcription cancelled",
                    res->err);
    }
    if (res->exit_code != 0) {
        auto status = res->signal ? std::format("killed by signal {}", res->signal)
                                  : std::format("exit status {}", res->exit_code);
        return fail(ErrorKind::EngineInvocationFailed, "engine failed (" + status + ")", res->err);
    }

    TranscriptionResult result;
    result.format = p->format;
    result.exit_status = res->exit_code;
    result.normalized = audio->converted();
    result.model_path = model->path;
    result.binary_path = engine->binary_path;
    result.engine_s = engine_s;

    if (p->format == OutputFormat::Segments) {
        result.segments = transcript::parse_segments(res->out);
        result.text = transcript::join(result.segments);
    } else {
        result.text = transcript::trim(res->out);
    }

    result.elapsed_s = seconds_since(start);
    log(std::format("transcribed in {:.2f}s ({:.2f}s in engine), {} chars", result.elapsed_s,
                    engine_s, result.text.size()));
    return result;
}

void TranscriptionRunner::log(const std::string& msg) {
    if (config_.verbose) {
        std::println(stderr, "[whisper-kit] {}", msg);
    }
}
