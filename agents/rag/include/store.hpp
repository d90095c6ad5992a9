#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ScoredPoint {
    std::string id;
    float score{0.0f};
    nlohmann::json payload;
};

// Similarity search over named collections. Used for document retrieval
// and for the semantic tier of the response cache.
// Implementations throw BackendError on failure.
class VectorStore {
public:
    virtual ~VectorStore() = default;
    virtual void ensure_collection(const std::string& collection, int dimension) = 0;
    // Replaces any point with the same id.
    virtual void upsert(const std::string& collection, const std::string& id,
                        const std::vector<float>& vector, const nlohmann::json& payload) = 0;
    // Best first, at most `limit` points.
    virtual std::vector<ScoredPoint> query(const std::string& collection,
                                           const std::vector<float>& vector, int limit) = 0;
    // Drops every point in the collection. A missing collection is not an error.
    virtual void reset(const std::string& collection) = 0;
};

// Brute-force cosine search over vectors kept as blobs in one SQLite table.
class SqliteVectorStore : public VectorStore {
public:
    explicit SqliteVectorStore(const std::string& db_path);
    ~SqliteVectorStore();

    void ensure_collection(const std::string& collection, int dimension) override;
    void upsert(const std::string& collection, const std::string& id,
                const std::vector<float>& vector, const nlohmann::json& payload) override;
    std::vector<ScoredPoint> query(const std::string& collection,
                                   const std::vector<float>& vector, int limit) override;

    void reset(const std::string& collection) override;

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* by_collection_stmt_ {nullptr};
    struct sqlite3_stmt* delete_collection_stmt_ {nullptr};
};

// Qdrant REST API (collections, points upsert and search).
class QdrantVectorStore : public VectorStore {
public:
    QdrantVectorStore(std::string base_url, std::string api_key, long timeout_ms = 10000);

    void ensure_collection(const std::string& collection, int dimension) override;
    void upsert(const std::string& collection, const std::string& id,
                const std::vector<float>& vector, const nlohmann::json& payload) override;
    std::vector<ScoredPoint> query(const std::string& collection,
                                   const std::vector<float>& vector, int limit) override;
    void reset(const std::string& collection) override;

private:
    nlohmann::json call(const std::string& method, const std::string& path, const nlohmann::json* body,
                        long* status_out = nullptr);

    std::string base_url_;
    std::string api_key_;
    long timeout_ms_;
};

enum class VectorKind { Sqlite, Qdrant };

struct VectorStoreOptions {
    VectorKind kind{VectorKind::Sqlite};
    std::string host;     // qdrant base URL
    std::string api_key;
    std::string db_path;  // sqlite file
    long timeout_ms{10000};
};

std::optional<VectorKind> parse_vector_kind(const std::string& s);
std::unique_ptr<VectorStore> make_vector_store(const VectorStoreOptions& opts);
