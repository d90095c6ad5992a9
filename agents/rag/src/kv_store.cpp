#include "../include/kv_store.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>

MemoryKeyValueStore::MemoryKeyValueStore() : clock_(unix_now), last_sweep_(clock_()) {}

MemoryKeyValueStore::MemoryKeyValueStore(Clock clock) : clock_(std::move(clock)), last_sweep_(clock_()) {}

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (it->second.expires_at != 0 && clock_() >= it->second.expires_at) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void MemoryKeyValueStore::set(const std::string& key, const std::string& value, std::int64_t ttl_secs) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::int64_t now = clock_();
    if (now - last_sweep_ >= kSweepIntervalSecs) sweep_expired(now);
    entries_[key] = Entry{value, ttl_secs > 0 ? now + ttl_secs : 0};
}

void MemoryKeyValueStore::sweep_expired(std::int64_t now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at != 0 && now >= it->second.expires_at) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    last_sweep_ = now;
}

std::size_t MemoryKeyValueStore::size() {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

void MemoryKeyValueStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.erase(key);
}

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void prepare(sqlite3* db, const char* sql, sqlite3_stmt** st) {
    if (sqlite3_prepare_v2(db, sql, -1, st, nullptr) != SQLITE_OK) {
        throw CacheError(BackendErrorKind::Unavailable, std::string("prepare failed: ") + sqlite3_errmsg(db));
    }
}

SqliteKeyValueStore::SqliteKeyValueStore(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw CacheError(BackendErrorKind::Unavailable, "Failed to open SQLite DB " + db_path + ": " + msg);
    }
    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("CREATE TABLE IF NOT EXISTS kv (\n"
             "  key TEXT PRIMARY KEY,\n"
             "  value TEXT NOT NULL,\n"
             "  expires_at INTEGER NOT NULL DEFAULT 0\n"
             ");");
        prepare(db_, "SELECT value, expires_at FROM kv WHERE key = ?;", &get_stmt_);
        prepare(db_, "INSERT OR REPLACE INTO kv (key, value, expires_at) VALUES (?, ?, ?);", &set_stmt_);
        prepare(db_, "DELETE FROM kv WHERE key = ?;", &del_stmt_);
        prepare(db_, "DELETE FROM kv WHERE expires_at != 0 AND expires_at <= ?;", &sweep_stmt_);
    } catch (...) {
        sqlite3_finalize(get_stmt_);
        sqlite3_finalize(set_stmt_);
        sqlite3_finalize(del_stmt_);
        sqlite3_finalize(sweep_stmt_);
        sqlite3_close(db_);
        throw;
    }
}

SqliteKeyValueStore::~SqliteKeyValueStore() {
    sqlite3_finalize(get_stmt_);
    sqlite3_finalize(set_stmt_);
    sqlite3_finalize(del_stmt_);
    sqlite3_finalize(sweep_stmt_);
    if (db_) sqlite3_close(db_);
}

void SqliteKeyValueStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw CacheError(BackendErrorKind::Unavailable, "SQLite error: " + msg);
    }
}

std::optional<std::string> SqliteKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(get_stmt_);
    sqlite3_clear_bindings(get_stmt_);
    bind_text(get_stmt_, 1, key);
    int rc = sqlite3_step(get_stmt_);
    if (rc == SQLITE_DONE) {
        sqlite3_reset(get_stmt_);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        sqlite3_reset(get_stmt_);
        throw CacheError(BackendErrorKind::Unavailable, std::string("kv get failed: ") + sqlite3_errmsg(db_));
    }
    const unsigned char* text = sqlite3_column_text(get_stmt_, 0);
    std::string value = text ? reinterpret_cast<const char*>(text) : "";
    std::int64_t expires_at = sqlite3_column_int64(get_stmt_, 1);
    sqlite3_reset(get_stmt_);
    if (expires_at != 0 && unix_now() >= expires_at) {
        sqlite3_reset(del_stmt_);
        sqlite3_clear_bindings(del_stmt_);
        bind_text(del_stmt_, 1, key);
        sqlite3_step(del_stmt_);
        sqlite3_reset(del_stmt_);
        return std::nullopt;
    }
    return value;
}

void SqliteKeyValueStore::set(const std::string& key, const std::string& value, std::int64_t ttl_secs) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::int64_t now = unix_now();
    if (now - last_sweep_ >= MemoryKeyValueStore::kSweepIntervalSecs) sweep_expired(now);
    sqlite3_reset(set_stmt_);
    sqlite3_clear_bindings(set_stmt_);
    bind_text(set_stmt_, 1, key);
    bind_text(set_stmt_, 2, value);
    sqlite3_bind_int64(set_stmt_, 3, ttl_secs > 0 ? now + ttl_secs : 0);
    int rc = sqlite3_step(set_stmt_);
    sqlite3_reset(set_stmt_);
    if (rc != SQLITE_DONE) {
        throw CacheError(BackendErrorKind::Unavailable, std::string("kv set failed: ") + sqlite3_errmsg(db_));
    }
}

void SqliteKeyValueStore::sweep_expired(std::int64_t now) {
    sqlite3_reset(sweep_stmt_);
    sqlite3_bind_int64(sweep_stmt_, 1, now);
    int rc = sqlite3_step(sweep_stmt_);
    sqlite3_reset(sweep_stmt_);
    if (rc != SQLITE_DONE) {
        throw CacheError(BackendErrorKind::Unavailable, std::string("kv sweep failed: ") + sqlite3_errmsg(db_));
    }
    last_sweep_ = now;
}

void SqliteKeyValueStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(del_stmt_);
    sqlite3_clear_bindings(del_stmt_);
    bind_text(del_stmt_, 1, key);
    int rc = sqlite3_step(del_stmt_);
    sqlite3_reset(del_stmt_);
    if (rc != SQLITE_DONE) {
        throw CacheError(BackendErrorKind::Unavailable, std::string("kv delete failed: ") + sqlite3_errmsg(db_));
    }
}

std::optional<KvKind> parse_kv_kind(const std::string& s) {
    auto v = to_lower(trim(s));
    if (v.empty() || v == "memory") return KvKind::Memory;
    if (v == "sqlite") return KvKind::Sqlite;
    return std::nullopt;
}

std::unique_ptr<KeyValueStore> make_kv_store(KvKind kind, const std::string& db_path) {
    switch (kind) {
        case KvKind::Memory: return std::make_unique<MemoryKeyValueStore>();
        case KvKind::Sqlite: return std::make_unique<SqliteKeyValueStore>(db_path);
    }
    return nullptr;
}
