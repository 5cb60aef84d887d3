#include "model/model_resolver.hpp"

#include "platform/process_runner.hpp"
#include "util/digest.hpp"

#include <atomic>
#include <format>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::atomic<uint64_t> temp_counter{0};

int64_t mtime_of(const fs::path& p, std::error_code& ec) {
    return static_cast<int64_t>(fs::last_write_time(p, ec).time_since_epoch().count());
}

} // namespace

const char* to_string(ModelProvenance p) {
    switch (p) {
        case ModelProvenance::Explicit: return "explicit";
        case ModelProvenance::Cached: return "cached";
        case ModelProvenance::Downloaded: return "downloaded";
    }
    return "unknown";
}

ModelResolver::ModelResolver(ModelResolverOptions options, ModelCatalog catalog,
                             ModelFetcher& fetcher, CacheDb& db)
    : options_(std::move(options)), catalog_(std::move(catalog)), fetcher_(fetcher), db_(db) {}

fs::path ModelResolver::local_path(const std::string& name) const {
    return options_.root / ModelCatalog::file_name(name);
}

Result<ModelArtifact> ModelResolver::resolve(const ModelSpec& spec, std::stop_token stop) {
    if (auto known = check(spec); !known) return std::unexpected(known.error());
    if (spec.kind == ModelSpec::Kind::Path) return resolve_path(spec.value);
    return resolve_name(spec.value, stop);
}

Result<void> ModelResolver::check(const ModelSpec& spec) const {
    if (spec.value.empty()) {
        return fail(ErrorKind::InvalidArgument, "empty model specification");
    }

    if (spec.kind == ModelSpec::Kind::Path) {
        std::error_code ec;
        if (!fs::is_regular_file(spec.value, ec)) {
            return fail(ErrorKind::ModelNotFound, "model file " + spec.value + " does not exist");
        }
        auto size = fs::file_size(spec.value, ec);
        if (ec || size == 0) {
            return fail(ErrorKind::ModelNotFound, "model file " + spec.value + " is empty");
        }
        return {};
    }

    if (!catalog_.find(spec.value)) {
        return std::unexpected(Error{
            .kind = ErrorKind::UnknownModel,
            .message = "unknown model '" + spec.value + "'",
            .output = {},
            .names = catalog_.names(),
        });
    }
    return {};
}

Result<ModelArtifact> ModelResolver::resolve_path(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return fail(ErrorKind::ModelNotFound, "model file " + path + ": " + ec.message());

    // Explicit paths are trusted as-is, custom and fine-tuned models included.
    return ModelArtifact{
        .path = fs::absolute(path, ec).string(),
        .model_id = {},
        .size = size,
        .sha1 = {},
        .source_url = {},
        .provenance = ModelProvenance::Explicit,
    };
}

Result<ModelArtifact> ModelResolver::resolve_name(const std::string& name, std::stop_token stop) {
    const auto* entry = catalog_.find(name);
    if (!entry) return fail(ErrorKind::UnknownModel, "unknown model '" + name + "'");

    auto target = local_path(name);
    std::error_code ec;
    if (fs::exists(target, ec)) {
        auto verified = verify(*entry, target, entry->url);
        if (verified) {
            log("using cached model " + target.string());
            return ModelArtifact{
                .path = target.string(),
                .model_id = name,
                .size = fs::file_size(target, ec),
                .sha1 = *verified,
                .source_url = entry->url,
                .provenance = ModelProvenance::Cached,
            };
        }
        // Left in place: the rename of a good download replaces it atomically.
        log("cached model " + target.string() + " is unusable: " + verified.error());
    }

    return download(*entry, stop);
}

Result<ModelArtifact> ModelResolver::download(const CatalogEntry& entry, std::stop_token stop) {
    std::error_code ec;
    fs::create_directories(options_.root, ec);
    if (ec) {
        return fail(ErrorKind::Storage,
                    "could not create " + options_.root.string() + ": " + ec.message());
    }

    auto target = local_path(entry.name);
    auto tmp = temp_path(entry.name);
    auto discard = [&tmp] {
        std::error_code ignored;
        fs::remove(tmp, ignored);
    };

    log(std::format("downloading {} from {}", entry.name, entry.url));

    FetchOptions opts{.deadline = deadline_after(options_.timeout), .stop = stop};
    auto fetched = fetcher_.fetch(entry.url, tmp, opts);
    if (!fetched) {
        discard();
        return fail(fetched.error().cancelled ? ErrorKind::Cancelled
                                              : ErrorKind::ModelDownloadFailed,
                    fetched.error().message);
    }

    uint64_t got = fetched->bytes_written;
    if (got == 0) {
        discard();
        return fail(ErrorKind::ModelDownloadFailed, "download of " + entry.name + " was empty");
    }
    if (fetched->reported_size && *fetched->reported_size != got) {
        discard();
        return fail(ErrorKind::ModelDownloadFailed,
                    std::format("download of {} truncated: {} of {} bytes", entry.name, got,
                                *fetched->reported_size));
    }

    auto verified = verify(entry, tmp, entry.url);
    if (!verified) {
        discard();
        return fail(ErrorKind::ModelDownloadFailed,
                    "download of " + entry.name + " failed validation: " + verified.error());
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        discard();
        return fail(ErrorKind::Storage, "could not move model into place: " + ec.message());
    }

    // Re-key the verification record on the final path.
    if (!verified->empty()) {
        ModelRecord rec{.model_id = entry.name, .path = target.string(), .size = got,
                        .mtime = mtime_of(target, ec), .sha1 = *verified,
                        .source_url = entry.url, .verified_at = {}};
        if (!ec) db_.put_model(rec);
    }

    log(std::format("downloaded {} ({} bytes)", target.string(), got));
    return ModelArtifact{
        .path = target.string(),
        .model_id = entry.name,
        .size = got,
        .sha1 = *verified,
        .source_url = entry.url,
        .provenance = ModelProvenance::Downloaded,
    };
}

std::expected<std::string, std::string> ModelResolver::verify(const CatalogEntry& entry,
                                                              const fs::path& path,
                                                              const std::string& source_url) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::unexpected("cannot stat: " + ec.message());
    if (size == 0) return std::unexpected(std::string("file is empty"));
    if (entry.size != 0 && size != entry.size) {
        return std::unexpected(std::format("size {} does not match expected {}", size, entry.size));
    }
    if (entry.sha1.empty()) return std::string{};

    auto mtime = mtime_of(path, ec);
    if (!ec) {
        if (auto rec = db_.find_model(entry.name);
            rec && rec->path == path.string() && rec->size == size && rec->mtime == mtime &&
            rec->sha1 == entry.sha1) {
            return rec->sha1;
        }
    }

    auto sha1 = digest::sha1_file(path);
    if (!sha1) return std::unexpected(sha1.error());
    if (*sha1 != entry.sha1) {
        return std::unexpected(std::format("sha1 {} does not match expected {}", *sha1, entry.sha1));
    }

    if (!ec) {
        db_.put_model({.model_id = entry.name, .path = path.string(), .size = size,
                       .mtime = mtime, .sha1 = *sha1, .source_url = source_url,
                       .verified_at = {}});
    }
    return *sha1;
}

fs::path ModelResolver::temp_path(const std::string& name) const {
    return options_.root / std::format(".{}.part-{}-{}", ModelCatalog::file_name(name), ::getpid(),
                                       temp_counter.fetch_add(1));
}

void ModelResolver::log(const std::string& msg) {
    if (options_.verbose) {
        std::println(stderr, "[whisper-kit] model: {}", msg);
    }
}
