#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Exact-match key/value tier of the response cache.
// Implementations throw CacheError on backend failure.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    // ttl_secs <= 0 stores without expiry.
    virtual void set(const std::string& key, const std::string& value, std::int64_t ttl_secs) = 0;
    virtual void del(const std::string& key) = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
public:
    using Clock = std::function<std::int64_t()>;

    // Expired entries are swept from set() at most once per sweep interval.
    static constexpr std::int64_t kSweepIntervalSecs = 60;

    MemoryKeyValueStore();
    explicit MemoryKeyValueStore(Clock clock);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::int64_t ttl_secs) override;
    void del(const std::string& key) override;

    std::size_t size();

private:
    struct Entry {
        std::string value;
        std::int64_t expires_at{0}; // 0 = never
    };

    void sweep_expired(std::int64_t now);

    Clock clock_;
    std::mutex mtx_;
    std::unordered_map<std::string, Entry> entries_;
    std::int64_t last_sweep_{0};
};

class SqliteKeyValueStore : public KeyValueStore {
public:
    explicit SqliteKeyValueStore(const std::string& db_path);
    ~SqliteKeyValueStore();

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::int64_t ttl_secs) override;
    void del(const std::string& key) override;

private:
    void exec(const std::string& sql);
    void sweep_expired(std::int64_t now);

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* get_stmt_ {nullptr};
    struct sqlite3_stmt* set_stmt_ {nullptr};
    struct sqlite3_stmt* del_stmt_ {nullptr};
    struct sqlite3_stmt* sweep_stmt_ {nullptr};
    std::int64_t last_sweep_{0};
};

enum class KvKind { Memory, Sqlite };

std::optional<KvKind> parse_kv_kind(const std::string& s);
std::unique_ptr<KeyValueStore> make_kv_store(KvKind kind, const std::string& db_path);
