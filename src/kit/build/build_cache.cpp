#include "build/build_cache.hpp"

#include "build/cache_key.hpp"
#include "platform/platform_paths.hpp"

#include <array>
#include <cstring>
#include <format>
#include <fstream>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

constexpr const char* kFetchedMarker = ".whisper-kit-fetched";

bool has_executable_magic(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::array<unsigned char, 4> m{};
    if (!f.read(reinterpret_cast<char*>(m.data()), m.size())) return false;

    if (m[0] == 0x7f && m[1] == 'E' && m[2] == 'L' && m[3] == 'F') return true;
    if (m[0] == '#' && m[1] == '!') return true;

    uint32_t word;
    std::memcpy(&word, m.data(), sizeof(word));
    switch (word) {
        case 0xfeedface: case 0xcefaedfe:  // Mach-O 32
        case 0xfeedfacf: case 0xcffaedfe:  // Mach-O 64
        case 0xcafebabe: case 0xbebafeca:  // universal
            return true;
        default:
            return false;
    }
}

int64_t mtime_of(const fs::path& p, std::error_code& ec) {
    return static_cast<int64_t>(fs::last_write_time(p, ec).time_since_epoch().count());
}

Error step_error(const StepFailure& f) {
    return Error{f.cancelled ? ErrorKind::Cancelled : ErrorKind::BuildFailed, f.message,
                 f.output, {}};
}

} // namespace

BuildCache::BuildCache(BuildCacheOptions options, CacheDb& db, SourceFetcher& source,
                       BuildToolchain& toolchain, DependencyProber& prober, ProcessRunner& runner)
    : options_(std::move(options)), db_(db), source_(source), toolchain_(toolchain),
      prober_(prober), runner_(runner), platform_(platform::target_triple()) {}

std::string BuildCache::cache_key(const std::string& revision,
                                  const std::vector<std::string>& flags) const {
    return make_cache_key(revision, flags, platform_);
}

fs::path BuildCache::tree_path(const std::string& cache_key) const {
    return options_.root / cache_key;
}

Result<EngineInstallation> BuildCache::ensure_binary(const std::string& revision,
                                                     const std::vector<std::string>& flags,
                                                     std::stop_token stop) {
    auto key = cache_key(revision, flags);

    if (auto hit = valid_entry(key)) {
        log("cache hit for " + key);
        return *hit;
    }

    auto lock = lock_key(key, stop);
    if (!lock) return std::unexpected(lock.error());

    auto file_lock = lock_tree(key, stop);
    if (!file_lock) return std::unexpected(file_lock.error());

    // Whoever held the lock before us may have finished this very build.
    if (auto hit = valid_entry(key)) {
        log("cache hit for " + key + " after waiting");
        return *hit;
    }

    log("cache miss for " + key);
    return build_locked(key, revision, flags, stop);
}

Result<EngineInstallation> BuildCache::force_rebuild(const std::string& revision,
                                                     const std::vector<std::string>& flags,
                                                     std::stop_token stop) {
    auto key = cache_key(revision, flags);

    auto lock = lock_key(key, stop);
    if (!lock) return std::unexpected(lock.error());

    auto file_lock = lock_tree(key, stop);
    if (!file_lock) return std::unexpected(file_lock.error());

    // Nothing is removed unless the rebuild can start.
    if (stop.stop_requested()) return fail(ErrorKind::Cancelled, "build of " + key + " cancelled");
    if (auto deps = check_dependencies(); !deps) return std::unexpected(deps.error());

    if (auto removed = remove_entry(key); !removed) return std::unexpected(removed.error());

    log("forced rebuild of " + key);
    return build_locked(key, revision, flags, stop);
}

Result<void> BuildCache::invalidate(const std::string& revision,
                                    const std::vector<std::string>& flags) {
    auto key = cache_key(revision, flags);

    auto lock = lock_key(key, {});
    if (!lock) return std::unexpected(lock.error());

    auto file_lock = lock_tree(key, {});
    if (!file_lock) return std::unexpected(file_lock.error());

    return remove_entry(key);
}

std::optional<EngineInstallation> BuildCache::installation(const std::string& revision,
                                                           const std::vector<std::string>& flags) {
    return valid_entry(cache_key(revision, flags));
}

Result<BuildCache::KeyLock> BuildCache::lock_key(const std::string& key, std::stop_token stop) {
    std::shared_ptr<std::timed_mutex> m;
    {
        std::lock_guard guard(locks_mutex_);
        auto& slot = key_locks_[key];
        if (!slot) slot = std::make_shared<std::timed_mutex>();
        m = slot;
    }

    KeyLock lock(*this, key, std::move(m));
    while (!lock.try_lock_for(100ms)) {
        if (stop.stop_requested()) {
            return fail(ErrorKind::Cancelled, "cancelled while waiting for build of " + key);
        }
    }
    return lock;
}

BuildCache::KeyLock::~KeyLock() {
    if (!mutex_) return;  // moved from
    if (lock_.owns_lock()) lock_.unlock();
    cache_->release_key(key_, mutex_);
}

void BuildCache::release_key(const std::string& key,
                             const std::shared_ptr<std::timed_mutex>& mutex) {
    std::lock_guard guard(locks_mutex_);
    auto it = key_locks_.find(key);
    // Copies are only taken under locks_mutex_: the map's and ours mean
    // nobody else holds or waits on this key.
    if (it != key_locks_.end() && it->second == mutex && mutex.use_count() == 2) {
        key_locks_.erase(it);
    }
}

size_t BuildCache::active_keys() {
    std::lock_guard guard(locks_mutex_);
    return key_locks_.size();
}

Result<FileLock> BuildCache::lock_tree(const std::string& key, std::stop_token stop) {
    std::error_code ec;
    fs::create_directories(options_.root, ec);
    if (ec) {
        return fail(ErrorKind::Storage,
                    "could not create " + options_.root.string() + ": " + ec.message());
    }

    auto file_lock = FileLock::acquire(options_.root / (key + ".lock"), stop);
    if (!file_lock) {
        return fail(stop.stop_requested() ? ErrorKind::Cancelled : ErrorKind::Storage,
                    file_lock.error());
    }
    return std::move(*file_lock);
}

std::optional<EngineInstallation> BuildCache::valid_entry(const std::string& key) {
    auto inst = db_.find_build(key);
    if (!inst || !is_valid(*inst)) return std::nullopt;
    return inst;
}

bool BuildCache::is_valid(const EngineInstallation& inst) {
    if (inst.platform != platform_) return false;

    fs::path bin(inst.binary_path);
    std::error_code ec;
    if (!fs::is_regular_file(bin, ec)) {
        log("recorded binary " + inst.binary_path + " is missing");
        return false;
    }
    if (::access(bin.c_str(), X_OK) != 0) {
        log("recorded binary " + inst.binary_path + " is not executable");
        return false;
    }

    auto size = fs::file_size(bin, ec);
    if (ec || size != inst.binary_size || mtime_of(bin, ec) != inst.binary_mtime || ec) {
        log("recorded binary " + inst.binary_path + " changed since it was built");
        return false;
    }
    if (!has_executable_magic(bin)) {
        log("recorded binary " + inst.binary_path + " is not an executable image");
        return false;
    }

    if (!options_.self_check_args.empty()) {
        std::vector<std::string> argv = {inst.binary_path};
        argv.insert(argv.end(), options_.self_check_args.begin(), options_.self_check_args.end());

        ProcessOptions opts;
        opts.deadline = std::chrono::steady_clock::now() + 10s;
        auto res = runner_.run(argv, opts);
        if (!res || !res->ok()) {
            log("recorded binary " + inst.binary_path + " failed its self-check");
            return false;
        }
        if (!options_.self_check_expect.empty() &&
            (res->out + res->err).find(options_.self_check_expect) == std::string::npos) {
            log("recorded binary " + inst.binary_path + " reported an unexpected version");
            return false;
        }
    }
    return true;
}

Result<void> BuildCache::check_dependencies() {
    if (dependencies_ok_.load()) return {};

    auto report = prober_.probe();
    if (!report.ok()) {
        auto problems = report.problems();
        std::string list;
        for (const auto& p : problems) {
            if (!list.empty()) list += ", ";
            list += p;
        }
        return std::unexpected(Error{
            .kind = ErrorKind::MissingDependency,
            .message = "Missing required commands: " + list,
            .output = report.install_hint(),
            .names = std::move(problems),
        });
    }

    dependencies_ok_.store(true);
    return {};
}

Result<void> BuildCache::remove_entry(const std::string& key) {
    if (!db_.erase_build(key)) {
        return fail(ErrorKind::Storage, "could not erase cache entry " + key);
    }

    std::error_code ec;
    fs::remove_all(tree_path(key), ec);
    if (ec) {
        return fail(ErrorKind::Storage,
                    "could not remove " + tree_path(key).string() + ": " + ec.message());
    }
    return {};
}

Result<EngineInstallation> BuildCache::build_locked(const std::string& key,
                                                    const std::string& revision,
                                                    const std::vector<std::string>& flags,
                                                    std::stop_token stop) {
    if (stop.stop_requested()) return fail(ErrorKind::Cancelled, "build of " + key + " cancelled");

    if (auto deps = check_dependencies(); !deps) return std::unexpected(deps.error());

    std::error_code ec;
    ProcessOptions opts;
    opts.deadline = deadline_after(options_.timeout);
    opts.stop = stop;

    auto start = std::chrono::steady_clock::now();
    auto dir = tree_path(key);
    auto marker = dir / kFetchedMarker;

    // A complete checkout of this revision survives a failed or cancelled
    // compile; anything else is refetched from scratch.
    std::string fetched_revision;
    if (std::ifstream m(marker); m.is_open()) std::getline(m, fetched_revision);

    if (fetched_revision != revision) {
        fs::remove_all(dir, ec);
        log(std::format("fetching {} into {}", revision, dir.string()));

        auto fetched = source_.fetch(revision, dir, opts);
        if (!fetched) {
            fs::remove_all(dir, ec);
            return std::unexpected(step_error(fetched.error()));
        }

        std::ofstream m(marker, std::ios::trunc);
        m << revision << "\n";
        if (!m) {
            return fail(ErrorKind::Storage, "could not write " + marker.string());
        }
    } else {
        log("reusing source tree " + dir.string());
    }

    log(std::format("building {} ({} flags)", key, flags.size()));
    auto binary = toolchain_.build(dir, flags, opts);
    if (!binary) return std::unexpected(step_error(binary.error()));

    auto path = fs::absolute(*binary, ec);
    if (ec || ::access(path.c_str(), X_OK) != 0) {
        return fail(ErrorKind::BuildFailed, path.string() + " is not executable");
    }

    EngineInstallation inst;
    inst.cache_key = key;
    inst.revision = revision;
    inst.build_flags = flags;
    inst.platform = platform_;
    inst.source_dir = dir.string();
    inst.binary_path = path.string();
    inst.binary_size = fs::file_size(path, ec);
    inst.binary_mtime = mtime_of(path, ec);
    if (ec) return fail(ErrorKind::Storage, "could not stat " + path.string() + ": " + ec.message());

    if (!db_.put_build(inst)) {
        return fail(ErrorKind::Storage, "could not record build " + key);
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    log(std::format("built {} in {:.1f}s", inst.binary_path, elapsed));

    if (auto stored = db_.find_build(key)) return *stored;
    return inst;
}

void BuildCache::log(const std::string& msg) {
    if (options_.verbose) {
        std::println(stderr, "[whisper-kit] build: {}", msg);
    }
}
