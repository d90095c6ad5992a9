#include "../include/store.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cstring>

using json = nlohmann::json;

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteVectorStore::SqliteVectorStore(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw BackendError(BackendErrorKind::Unavailable, "Failed to open SQLite DB " + db_path + ": " + msg);
    }
    try {
        init();
        prepare_statements();
    } catch (const BackendError&) {
        close_statements();
        sqlite3_close(db_);
        throw;
    }
}

SqliteVectorStore::~SqliteVectorStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteVectorStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS points (\n"
         "  collection TEXT NOT NULL,\n"
         "  id TEXT NOT NULL,\n"
         "  payload TEXT,\n"
         "  vector BLOB,\n"
         "  PRIMARY KEY (collection, id)\n"
         ");");
}

void SqliteVectorStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw BackendError(BackendErrorKind::Unavailable, "SQLite error: " + msg);
    }
}

void SqliteVectorStore::prepare_statements() {
    const char* ins = "INSERT OR REPLACE INTO points (collection, id, payload, vector) VALUES (?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, ins, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        throw BackendError(BackendErrorKind::Unavailable, "prepare insert failed");
    }
    const char* sel = "SELECT id, payload, vector FROM points WHERE collection = ?;";
    if (sqlite3_prepare_v2(db_, sel, -1, &by_collection_stmt_, nullptr) != SQLITE_OK) {
        throw BackendError(BackendErrorKind::Unavailable, "prepare select failed");
    }
    const char* del = "DELETE FROM points WHERE collection = ?;";
    if (sqlite3_prepare_v2(db_, del, -1, &delete_collection_stmt_, nullptr) != SQLITE_OK) {
        throw BackendError(BackendErrorKind::Unavailable, "prepare delete failed");
    }
}

void SqliteVectorStore::close_statements() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (by_collection_stmt_) { sqlite3_finalize(by_collection_stmt_); by_collection_stmt_ = nullptr; }
    if (delete_collection_stmt_) { sqlite3_finalize(delete_collection_stmt_); delete_collection_stmt_ = nullptr; }
}

// Collections are implicit in the points table.
void SqliteVectorStore::ensure_collection(const std::string&, int) {}

void SqliteVectorStore::reset(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(delete_collection_stmt_);
    bind_text(delete_collection_stmt_, 1, collection);
    int rc = sqlite3_step(delete_collection_stmt_);
    sqlite3_reset(delete_collection_stmt_);
    if (rc != SQLITE_DONE) throw BackendError(BackendErrorKind::Unavailable, "delete collection failed");
}

void SqliteVectorStore::upsert(const std::string& collection, const std::string& id,
                               const std::vector<float>& vector, const json& payload) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    bind_text(insert_stmt_, 1, collection);
    bind_text(insert_stmt_, 2, id);
    bind_text(insert_stmt_, 3, payload.dump());
    bind_blob(insert_stmt_, 4, vector);
    int rc = sqlite3_step(insert_stmt_);
    sqlite3_reset(insert_stmt_);
    if (rc != SQLITE_DONE) {
        throw BackendError(BackendErrorKind::Unavailable, std::string("insert point failed: ") + sqlite3_errmsg(db_));
    }
}

std::vector<ScoredPoint> SqliteVectorStore::query(const std::string& collection,
                                                  const std::vector<float>& vector, int limit) {
    std::vector<ScoredPoint> out;
    if (limit <= 0) return out;
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(by_collection_stmt_);
    sqlite3_clear_bindings(by_collection_stmt_);
    bind_text(by_collection_stmt_, 1, collection);
    int rc;
    while ((rc = sqlite3_step(by_collection_stmt_)) == SQLITE_ROW) {
        ScoredPoint p;
        p.id = column_text(by_collection_stmt_, 0);
        p.payload = json::parse(column_text(by_collection_stmt_, 1), nullptr, false);
        if (p.payload.is_discarded()) p.payload = json::object();
        const void* blob = sqlite3_column_blob(by_collection_stmt_, 2);
        int bytes = sqlite3_column_bytes(by_collection_stmt_, 2);
        std::vector<float> vec(bytes / (int)sizeof(float));
        if (!vec.empty()) std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
        p.score = cosine_similarity(vec, vector);
        out.push_back(std::move(p));
    }
    sqlite3_reset(by_collection_stmt_);
    if (rc != SQLITE_DONE) {
        throw BackendError(BackendErrorKind::Unavailable, std::string("select points failed: ") + sqlite3_errmsg(db_));
    }
    std::partial_sort(out.begin(), out.begin() + std::min<int>(limit, (int)out.size()), out.end(),
                      [](const ScoredPoint& a, const ScoredPoint& b){ return a.score > b.score; });
    if ((int)out.size() > limit) out.resize(limit);
    return out;
}

QdrantVectorStore::QdrantVectorStore(std::string base_url, std::string api_key, long timeout_ms)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json QdrantVectorStore::call(const std::string& method, const std::string& path, const json* body,
                             long* status_out) {
    HttpRequest req;
    req.method = method;
    req.url = base_url_ + path;
    req.timeout_ms = timeout_ms_;
    if (!api_key_.empty()) req.headers["api-key"] = api_key_;
    if (body) {
        req.headers["Content-Type"] = "application/json";
        req.body = body->dump();
    }
    auto r = http_send(req);
    if (status_out) {
        *status_out = r.status;
        if (r.status == 404) return json();
    }
    if (r.status < 200 || r.status >= 300) {
        throw BackendError(BackendErrorKind::Unavailable,
                           "qdrant " + method + " " + path + " failed: status " + std::to_string(r.status));
    }
    auto data = json::parse(r.body, nullptr, false);
    if (data.is_discarded()) {
        throw BackendError(BackendErrorKind::InvalidResponse, "qdrant returned invalid JSON for " + path);
    }
    return data;
}

void QdrantVectorStore::ensure_collection(const std::string& collection, int dimension) {
    long status = 0;
    call("GET", "/collections/" + collection, nullptr, &status);
    if (status != 404) return;
    json body = {{"vectors", {{"size", dimension}, {"distance", "Cosine"}}}};
    call("PUT", "/collections/" + collection, &body);
}

void QdrantVectorStore::reset(const std::string& collection) {
    long status = 0;
    call("DELETE", "/collections/" + collection, nullptr, &status);
}

void QdrantVectorStore::upsert(const std::string& collection, const std::string& id,
                               const std::vector<float>& vector, const json& payload) {
    json body = {{"points", json::array({json{{"id", id}, {"vector", vector}, {"payload", payload}}})}};
    call("PUT", "/collections/" + collection + "/points?wait=true", &body);
}

std::vector<ScoredPoint> QdrantVectorStore::query(const std::string& collection,
                                                  const std::vector<float>& vector, int limit) {
    std::vector<ScoredPoint> out;
    if (limit <= 0) return out;
    json body = {{"vector", vector}, {"limit", limit}, {"with_payload", true}};
    auto data = call("POST", "/collections/" + collection + "/points/search", &body);
    if (!data.contains("result") || !data["result"].is_array()) {
        throw BackendError(BackendErrorKind::InvalidResponse, "qdrant search response has no result array");
    }
    for (const auto& hit : data["result"]) {
        ScoredPoint p;
        const auto& id = hit.value("id", json());
        p.id = id.is_string() ? id.get<std::string>() : id.dump();
        p.score = hit.value("score", 0.0f);
        p.payload = hit.value("payload", json::object());
        out.push_back(std::move(p));
    }
    return out;
}

std::optional<VectorKind> parse_vector_kind(const std::string& s) {
    auto v = to_lower(trim(s));
    if (v.empty() || v == "sqlite") return VectorKind::Sqlite;
    if (v == "qdrant") return VectorKind::Qdrant;
    return std::nullopt;
}

std::unique_ptr<VectorStore> make_vector_store(const VectorStoreOptions& opts) {
    switch (opts.kind) {
        case VectorKind::Sqlite: return std::make_unique<SqliteVectorStore>(opts.db_path);
        case VectorKind::Qdrant: return std::make_unique<QdrantVectorStore>(opts.host, opts.api_key, opts.timeout_ms);
    }
    return nullptr;
}
