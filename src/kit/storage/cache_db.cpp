#include "storage/cache_db.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

std::string flags_to_json(const std::vector<std::string>& flags) {
    return json(flags).dump();
}

std::vector<std::string> flags_from_json(const std::string& s) {
    try {
        return json::parse(s).get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        std::println(stderr, "db: bad build_flags column: {}", e.what());
        return {};
    }
}

} // namespace

CacheDb::CacheDb() = default;

CacheDb::~CacheDb() {
    close();
}

bool CacheDb::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Several processes may share one cache root.
    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    return prepare("SELECT cache_key, revision, build_flags, platform, source_dir, "
                   "binary_path, binary_size, binary_mtime, built_at "
                   "FROM engine_builds WHERE cache_key = ?",
                   &find_build_stmt_) &&
           prepare("INSERT OR REPLACE INTO engine_builds (cache_key, revision, build_flags, "
                   "platform, source_dir, binary_path, binary_size, binary_mtime) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                   &put_build_stmt_) &&
           prepare("DELETE FROM engine_builds WHERE cache_key = ?", &erase_build_stmt_) &&
           prepare("SELECT model_id, path, size, mtime, sha1, source_url, verified_at "
                   "FROM model_files WHERE model_id = ?",
                   &find_model_stmt_) &&
           prepare("INSERT OR REPLACE INTO model_files (model_id, path, size, mtime, sha1, "
                   "source_url) VALUES (?, ?, ?, ?, ?, ?)",
                   &put_model_stmt_);
}

void CacheDb::close() {
    std::lock_guard lock(mutex_);
    for (auto** stmt : {&find_build_stmt_, &put_build_stmt_, &erase_build_stmt_,
                        &find_model_stmt_, &put_model_stmt_}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::optional<EngineInstallation> CacheDb::find_build(const std::string& cache_key) {
    std::lock_guard lock(mutex_);
    if (!find_build_stmt_) return std::nullopt;

    sqlite3_reset(find_build_stmt_);
    sqlite3_bind_text(find_build_stmt_, 1, cache_key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(find_build_stmt_) != SQLITE_ROW) return std::nullopt;

    EngineInstallation inst;
    inst.cache_key = column_text(find_build_stmt_, 0);
    inst.revision = column_text(find_build_stmt_, 1);
    inst.build_flags = flags_from_json(column_text(find_build_stmt_, 2));
    inst.platform = column_text(find_build_stmt_, 3);
    inst.source_dir = column_text(find_build_stmt_, 4);
    inst.binary_path = column_text(find_build_stmt_, 5);
    inst.binary_size = static_cast<uint64_t>(sqlite3_column_int64(find_build_stmt_, 6));
    inst.binary_mtime = sqlite3_column_int64(find_build_stmt_, 7);
    inst.built_at = column_text(find_build_stmt_, 8);
    sqlite3_reset(find_build_stmt_);
    return inst;
}

bool CacheDb::put_build(const EngineInstallation& inst) {
    std::lock_guard lock(mutex_);
    if (!put_build_stmt_) return false;

    auto flags = flags_to_json(inst.build_flags);

    sqlite3_reset(put_build_stmt_);
    sqlite3_bind_text(put_build_stmt_, 1, inst.cache_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(put_build_stmt_, 2, inst.revision.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(put_build_stmt_, 3, flags.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(put_build_stmt_, 4, inst.platform.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(put_build_stmt_, 5, inst.source_dir.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(put_build_stmt_, 6, inst.binary_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(put_build_stmt_, 7, static_cast<sqlite3_int64>(inst.binary_size));
    sqlite3_bind_int64(put_build_stmt_, 8, inst.binary_mtime);

    int rc = sqlite3_step(put_build_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: put build failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool CacheDb::erase_build(const std::string& cache_key) {
    std::lock_guard lock(mutex_);
    if (!erase_build_stmt_) return false;

    sqlite3_reset(erase_build_stmt_);
    sqlite3_bind_text(erase_build_stmt_, 1, cache_key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(erase_build_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: erase build failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<ModelRecord> CacheDb::find_model(const std::string& model_id) {
    std::lock_guard lock(mutex_);
    if (!find_model_stmt_) return std::nullopt;

    sqlite3_reset(find_model_stmt_);
    sqlite3_bind_text(find_model_stmt_, 1, model_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(find_model_stmt_) != SQLITE_ROW) return std::nullopt;

    ModelRecord rec;
    rec.model_id = column_text(find_model_stmt_, 0);
    rec.path = column_text(find_model_stmt_, 1);
    rec.size = static_cast<uint64_t>(sqlite3_column_int64(find_model_stmt_, 2));
    rec.mtime = sqlite3_column_int64(find_model_stmt_, 3);
    rec.sha1 = column_text(find_model_stmt_, 4);
    rec.source_url = column_text(find_model_stmt_, 5);
    rec.verified_at = column_text(find_model_stmt_, 6);
    sqlite3_reset(find_model_stmt_);
    return rec;
}

bool CacheDb::put_model(const ModelRecord& rec) {
    std::lock_guard lock(mutex_);
    if (!put_model_stmt_) return false;

    sqlite3_reset(put_model_stmt_);
    sqlite3_bind_text(put_model_stmt_, 1, rec.model_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(put_model_stmt_, 2, rec.path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(put_model_stmt_, 3, static_cast<sqlite3_int64>(rec.size));
    sqlite3_bind_int64(put_model_stmt_, 4, rec.mtime);
    sqlite3_bind_text(put_model_stmt_, 5, rec.sha1.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(put_model_stmt_, 6, rec.source_url.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(put_model_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: put model failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool CacheDb::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool CacheDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS engine_builds (
            cache_key TEXT PRIMARY KEY,
            revision TEXT NOT NULL,
            build_flags TEXT NOT NULL,
            platform TEXT NOT NULL,
            source_dir TEXT NOT NULL,
            binary_path TEXT NOT NULL,
            binary_size INTEGER NOT NULL,
            binary_mtime INTEGER NOT NULL,
            built_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now'))
        );
        CREATE TABLE IF NOT EXISTS model_files (
            model_id TEXT PRIMARY KEY,
            path TEXT NOT NULL,
            size INTEGER NOT NULL,
            mtime INTEGER NOT NULL,
            sha1 TEXT,
            source_url TEXT,
            verified_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now'))
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
