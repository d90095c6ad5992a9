#pragma once
#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct Turn {
    std::string conversation_id;
    std::string role; // "user" | "assistant"
    std::string content;
    std::int64_t timestamp{0};
};

// Per-conversation transcript. Implementations throw HistoryError.
class HistoryStore {
public:
    virtual ~HistoryStore() = default;
    virtual void append(const Turn& turn) = 0;
    // Last `limit` turns of the conversation, oldest first.
    virtual std::vector<Turn> recent(const std::string& conversation_id, std::size_t limit) = 0;
};

// Bounded in-process transcript. Keeps at most `max_turns` per conversation
// and drops the least recently appended conversation past `max_conversations`.
class MemoryHistoryStore : public HistoryStore {
public:
    explicit MemoryHistoryStore(std::size_t max_conversations = 10000, std::size_t max_turns = 200);

    void append(const Turn& turn) override;
    std::vector<Turn> recent(const std::string& conversation_id, std::size_t limit) override;

    std::size_t conversation_count();

private:
    struct Conversation {
        std::deque<Turn> turns;
        std::list<std::string>::iterator lru;
    };

    std::size_t max_conversations_;
    std::size_t max_turns_;
    std::mutex mtx_;
    std::list<std::string> lru_; // most recent first
    std::map<std::string, Conversation> conversations_;
};

class SqliteHistoryStore : public HistoryStore {
public:
    explicit SqliteHistoryStore(const std::string& db_path);
    ~SqliteHistoryStore();

    void append(const Turn& turn) override;
    std::vector<Turn> recent(const std::string& conversation_id, std::size_t limit) override;

private:
    void exec(const std::string& sql);

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* recent_stmt_ {nullptr};
};

enum class HistoryKind { Memory, Sqlite };

std::optional<HistoryKind> parse_history_kind(const std::string& s);
std::unique_ptr<HistoryStore> make_history_store(HistoryKind kind, const std::string& db_path);

// "User: ...\nAssistant: ..." lines for the {history} placeholder.
std::string format_history_for_prompt(const std::vector<Turn>& turns);
