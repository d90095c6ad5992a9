#include "../include/history.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <algorithm>

MemoryHistoryStore::MemoryHistoryStore(std::size_t max_conversations, std::size_t max_turns)
    : max_conversations_(std::max<std::size_t>(1, max_conversations)),
      max_turns_(std::max<std::size_t>(1, max_turns)) {}

void MemoryHistoryStore::append(const Turn& turn) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = conversations_.find(turn.conversation_id);
    if (it == conversations_.end()) {
        if (conversations_.size() >= max_conversations_) {
            conversations_.erase(lru_.back());
            lru_.pop_back();
        }
        lru_.push_front(turn.conversation_id);
        it = conversations_.emplace(turn.conversation_id, Conversation{{}, lru_.begin()}).first;
    } else {
        lru_.splice(lru_.begin(), lru_, it->second.lru);
    }
    auto& turns = it->second.turns;
    turns.push_back(turn);
    while (turns.size() > max_turns_) turns.pop_front();
}

std::vector<Turn> MemoryHistoryStore::recent(const std::string& conversation_id, std::size_t limit) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end() || limit == 0) return {};
    const auto& all = it->second.turns;
    auto first = all.size() > limit ? all.end() - (std::ptrdiff_t)limit : all.begin();
    return std::vector<Turn>(first, all.end());
}

std::size_t MemoryHistoryStore::conversation_count() {
    std::lock_guard<std::mutex> lock(mtx_);
    return conversations_.size();
}

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteHistoryStore::SqliteHistoryStore(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw HistoryError(BackendErrorKind::Unavailable, "Failed to open SQLite DB " + db_path + ": " + msg);
    }
    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("CREATE TABLE IF NOT EXISTS turns (\n"
             "  seq INTEGER PRIMARY KEY AUTOINCREMENT,\n"
             "  conversation_id TEXT NOT NULL,\n"
             "  role TEXT NOT NULL,\n"
             "  content TEXT NOT NULL,\n"
             "  ts INTEGER NOT NULL\n"
             ");");
        exec("CREATE INDEX IF NOT EXISTS idx_turns_conversation ON turns(conversation_id, seq);");
        const char* ins = "INSERT INTO turns (conversation_id, role, content, ts) VALUES (?, ?, ?, ?);";
        if (sqlite3_prepare_v2(db_, ins, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
            throw HistoryError(BackendErrorKind::Unavailable, "prepare insert failed");
        }
        const char* sel = "SELECT role, content, ts FROM turns WHERE conversation_id = ? "
                          "ORDER BY seq DESC LIMIT ?;";
        if (sqlite3_prepare_v2(db_, sel, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
            throw HistoryError(BackendErrorKind::Unavailable, "prepare select failed");
        }
    } catch (const HistoryError&) {
        sqlite3_finalize(insert_stmt_);
        sqlite3_finalize(recent_stmt_);
        sqlite3_close(db_);
        throw;
    }
}

SqliteHistoryStore::~SqliteHistoryStore() {
    sqlite3_finalize(insert_stmt_);
    sqlite3_finalize(recent_stmt_);
    if (db_) sqlite3_close(db_);
}

void SqliteHistoryStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw HistoryError(BackendErrorKind::Unavailable, "SQLite error: " + msg);
    }
}

void SqliteHistoryStore::append(const Turn& turn) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    bind_text(insert_stmt_, 1, turn.conversation_id);
    bind_text(insert_stmt_, 2, turn.role);
    bind_text(insert_stmt_, 3, turn.content);
    sqlite3_bind_int64(insert_stmt_, 4, turn.timestamp);
    int rc = sqlite3_step(insert_stmt_);
    sqlite3_reset(insert_stmt_);
    if (rc != SQLITE_DONE) {
        throw HistoryError(BackendErrorKind::Unavailable, std::string("insert turn failed: ") + sqlite3_errmsg(db_));
    }
}

std::vector<Turn> SqliteHistoryStore::recent(const std::string& conversation_id, std::size_t limit) {
    std::vector<Turn> out;
    if (limit == 0) return out;
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(recent_stmt_);
    sqlite3_clear_bindings(recent_stmt_);
    bind_text(recent_stmt_, 1, conversation_id);
    sqlite3_bind_int64(recent_stmt_, 2, (sqlite3_int64)limit);
    int rc;
    while ((rc = sqlite3_step(recent_stmt_)) == SQLITE_ROW) {
        Turn t;
        t.conversation_id = conversation_id;
        t.role = column_text(recent_stmt_, 0);
        t.content = column_text(recent_stmt_, 1);
        t.timestamp = sqlite3_column_int64(recent_stmt_, 2);
        out.push_back(std::move(t));
    }
    sqlite3_reset(recent_stmt_);
    if (rc != SQLITE_DONE) {
        throw HistoryError(BackendErrorKind::Unavailable, std::string("select turns failed: ") + sqlite3_errmsg(db_));
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<HistoryKind> parse_history_kind(const std::string& s) {
    auto v = to_lower(trim(s));
    if (v.empty() || v == "memory") return HistoryKind::Memory;
    if (v == "sqlite") return HistoryKind::Sqlite;
    return std::nullopt;
}

std::unique_ptr<HistoryStore> make_history_store(HistoryKind kind, const std::string& db_path) {
    switch (kind) {
        case HistoryKind::Memory: return std::make_unique<MemoryHistoryStore>();
        case HistoryKind::Sqlite: return std::make_unique<SqliteHistoryStore>(db_path);
    }
    return nullptr;
}

std::string format_history_for_prompt(const std::vector<Turn>& turns) {
    std::string out;
    for (const auto& t : turns) {
        if (!out.empty()) out += "\n";
        out += (t.role == "assistant" ? "Assistant: " : "User: ") + t.content;
    }
    return out;
}
