#pragma once
#include "prompt_config.hpp"
#include "errors.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Prompts and schema that were active together. Never mutated once published.
struct ConfigSnapshot {
    std::shared_ptr<const PromptConfig> prompts;
    std::shared_ptr<const IndexSchema> schema;
    std::uint64_t version{0};
    std::string prompts_origin; // "local" or "remote"
    std::int64_t loaded_at{0};
};

using SnapshotPtr = std::shared_ptr<const ConfigSnapshot>;

SnapshotPtr make_snapshot(PromptConfig prompts, IndexSchema schema, std::uint64_t version = 1,
                          const std::string& origin = "local");

enum class ReloadSource { Local, Remote, Both };

std::optional<ReloadSource> parse_reload_source(const std::string& s);

enum class SourceStatus { Reloaded, Unchanged, Disabled, Failed };

const char* to_string(SourceStatus status);

struct SourceOutcome {
    std::string source; // "local" | "remote"
    SourceStatus status{SourceStatus::Unchanged};
    std::string detail;
    std::optional<ConfigErrorKind> error;
};

struct ReloadReport {
    bool success{true};
    std::vector<SourceOutcome> outcomes;
    std::uint64_t version{0};
};

struct RemoteDocument {
    std::string prompts_json;
    std::string etag; // empty when the source sends none
};

class RemoteConfigSource {
public:
    virtual ~RemoteConfigSource() = default;
    // Returns the prompt config document, or nullopt when it has not changed
    // since the last committed fetch. Throws ConfigError.
    virtual std::optional<RemoteDocument> fetch() = 0;
    // Called once a fetched document has parsed and been published.
    virtual void commit(const RemoteDocument& doc) { (void)doc; }
};

// Firebase Remote Config style endpoint, or any URL that returns the prompt
// JSON directly. Sends If-None-Match with the last committed ETag.
class HttpRemoteConfigSource : public RemoteConfigSource {
public:
    HttpRemoteConfigSource(std::string url, std::string bearer_token, long timeout_ms = 10000);
    std::optional<RemoteDocument> fetch() override;
    void commit(const RemoteDocument& doc) override;

private:
    std::string url_;
    std::string token_;
    long timeout_ms_;
    std::mutex etag_mtx_;
    std::string etag_;
};

// Pulls the prompt JSON string out of a remote document.
std::string extract_remote_prompts(const std::string& body);

struct ConfigPaths {
    std::filesystem::path prompts;
    std::filesystem::path schema;
};

class ConfigStore {
public:
    // Loads the initial snapshot. Remote prompts take precedence when the
    // remote source is configured and reachable; the schema is always local.
    ConfigStore(ConfigPaths paths, std::unique_ptr<RemoteConfigSource> remote = nullptr);
    explicit ConfigStore(SnapshotPtr initial);

    SnapshotPtr current() const { return current_.load(std::memory_order_acquire); }
    ReloadReport reload(ReloadSource source);
    bool remote_enabled() const { return remote_ != nullptr; }

private:
    struct LocalFiles {
        PromptConfig prompts;
        IndexSchema schema;
        std::filesystem::file_time_type prompts_mtime;
        std::filesystem::file_time_type schema_mtime;
    };

    LocalFiles read_local() const;
    bool local_unchanged();

    ConfigPaths paths_;
    std::unique_ptr<RemoteConfigSource> remote_;
    std::atomic<SnapshotPtr> current_;
    // Guards publication and the fields below. Never held across file or
    // network reads; sources are staged first and merged under the lock.
    std::mutex reload_mtx_;
    std::optional<std::filesystem::file_time_type> prompts_mtime_;
    std::optional<std::filesystem::file_time_type> schema_mtime_;
    std::atomic<std::uint64_t> local_tickets_{0};
    std::atomic<std::uint64_t> remote_tickets_{0};
    std::uint64_t applied_local_ticket_{0};
    std::uint64_t applied_remote_ticket_{0};
};
