#pragma once

#include "build/build_toolchain.hpp"
#include "build/engine_installation.hpp"
#include "build/source_fetcher.hpp"
#include "error.hpp"
#include "platform/file_lock.hpp"
#include "platform/process_runner.hpp"
#include "probe/dependency_prober.hpp"
#include "storage/cache_db.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

struct BuildCacheOptions {
    // Holds one source/build tree per cache key.
    std::filesystem::path root;
    std::chrono::seconds timeout{0};
    // Version query run against a cached binary before it is reused, e.g.
    // {"-h"}. Empty keeps cache hits free of subprocesses.
    std::vector<std::string> self_check_args;
    std::string self_check_expect;
    bool verbose = false;
};

// Owns builds/ and the engine_builds table. Hands out an EngineInstallation
// for (revision, flags) on this platform, building it on a cache miss.
class BuildCache {
public:
    BuildCache(BuildCacheOptions options, CacheDb& db, SourceFetcher& source,
               BuildToolchain& toolchain, DependencyProber& prober, ProcessRunner& runner);

    BuildCache(const BuildCache&) = delete;
    BuildCache& operator=(const BuildCache&) = delete;

    Result<EngineInstallation> ensure_binary(const std::string& revision,
                                             const std::vector<std::string>& flags,
                                             std::stop_token stop = {});

    // Drops the entry and tree for the key (if any) and builds unconditionally.
    Result<EngineInstallation> force_rebuild(const std::string& revision,
                                             const std::vector<std::string>& flags,
                                             std::stop_token stop = {});

    // Drops the entry and tree without rebuilding. Idempotent.
    Result<void> invalidate(const std::string& revision, const std::vector<std::string>& flags);

    // The current valid installation, never builds.
    std::optional<EngineInstallation> installation(const std::string& revision,
                                                   const std::vector<std::string>& flags);

    std::string cache_key(const std::string& revision, const std::vector<std::string>& flags) const;
    std::filesystem::path tree_path(const std::string& cache_key) const;

    // Keys with a build, rebuild or wait in progress in this process.
    size_t active_keys();

private:
    // Holds the in-process mutex of one key. The map entry is dropped when
    // the last holder or waiter lets go.
    class KeyLock {
    public:
        KeyLock(BuildCache& cache, std::string key, std::shared_ptr<std::timed_mutex> mutex)
            : cache_(&cache), key_(std::move(key)), mutex_(std::move(mutex)),
              lock_(*mutex_, std::defer_lock) {}
        ~KeyLock();

        KeyLock(KeyLock&&) noexcept = default;
        KeyLock& operator=(KeyLock&&) = delete;

        bool try_lock_for(std::chrono::milliseconds timeout) { return lock_.try_lock_for(timeout); }

    private:
        BuildCache* cache_;
        std::string key_;
        std::shared_ptr<std::timed_mutex> mutex_;
        std::unique_lock<std::timed_mutex> lock_;
    };

    void release_key(const std::string& key, const std::shared_ptr<std::timed_mutex>& mutex);

    // In-process mutex first, then the cross-process lock file.
    Result<KeyLock> lock_key(const std::string& key, std::stop_token stop);
    Result<FileLock> lock_tree(const std::string& key, std::stop_token stop);
    std::optional<EngineInstallation> valid_entry(const std::string& key);
    bool is_valid(const EngineInstallation& inst);
    Result<void> check_dependencies();
    Result<void> remove_entry(const std::string& key);
    Result<EngineInstallation> build_locked(const std::string& key, const std::string& revision,
                                            const std::vector<std::string>& flags,
                                            std::stop_token stop);

    void log(const std::string& msg);

    BuildCacheOptions options_;
    CacheDb& db_;
    SourceFetcher& source_;
    BuildToolchain& toolchain_;
    DependencyProber& prober_;
    ProcessRunner& runner_;
    std::string platform_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> key_locks_;

    // Only a passing probe is remembered; a failing one runs again next time.
    std::atomic<bool> dependencies_ok_{false};
};
