#pragma once

#include "build/engine_installation.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>

// A model file whose checksum was verified at the given size and mtime.
struct ModelRecord {
    std::string model_id;
    std::string path;
    uint64_t size = 0;
    int64_t mtime = 0;
    std::string sha1;
    std::string source_url;
    std::string verified_at;
};

// Index of the cache root: one row per built engine and per verified model.
// Safe to share between threads.
class CacheDb {
public:
    CacheDb();
    ~CacheDb();

    CacheDb(const CacheDb&) = delete;
    CacheDb& operator=(const CacheDb&) = delete;

    bool open(const std::string& path);
    void close();

    std::optional<EngineInstallation> find_build(const std::string& cache_key);
    bool put_build(const EngineInstallation& inst);
    bool erase_build(const std::string& cache_key);

    std::optional<ModelRecord> find_model(const std::string& model_id);
    bool put_model(const ModelRecord& rec);

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt);

    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* find_build_stmt_ = nullptr;
    sqlite3_stmt* put_build_stmt_ = nullptr;
    sqlite3_stmt* erase_build_stmt_ = nullptr;
    sqlite3_stmt* find_model_stmt_ = nullptr;
    sqlite3_stmt* put_model_stmt_ = nullptr;
};
