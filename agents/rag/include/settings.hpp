#pragma once
#include "cache_engine.hpp"
#include "config_store.hpp"
#include "executor.hpp"
#include "history.hpp"
#include "llm.hpp"
#include "orchestrator.hpp"
#include "store.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Process settings read from the environment. Throws ConfigError(Invalid)
// for unknown backend kinds and malformed numbers.
struct Settings {
    std::string server_addr{"127.0.0.1:4000"};
    unsigned short http_port{4001};
    std::string api_key;
    std::int64_t auth_tolerance_secs{300};
    std::size_t max_message_bytes{1024 * 1024};
    double connections_per_sec{10};
    std::size_t worker_threads{4};

    std::string prompts_path{"config/prompts.json"};
    std::string schema_path{"config/index_schema.json"};
    bool remote_prompts{false};
    std::string remote_prompts_url;
    std::string remote_prompts_token;

    LlmConfig chat;
    LlmConfig embedding;

    VectorStoreOptions vectors;
    int rag_default_limit{20};
    bool llm_query{false};

    bool cache_enabled{false};
    KvKind cache_kv{KvKind::Memory};
    std::string cache_db_path{"data/cache.db"};
    VectorStoreOptions cache_vectors;
    CacheSettings cache;

    HistoryKind history{HistoryKind::Memory};
    std::string history_db_path{"data/history.db"};

    std::string log_level{"info"};

    static Settings from_env();
};

// Applies LOG_LEVEL to the default spdlog logger.
void configure_logging(const std::string& level);

// Backends, executor and pipeline built once from settings.
class RagRuntime {
public:
    explicit RagRuntime(const Settings& settings);
    ~RagRuntime();

    ConfigStore& config() { return *config_; }
    Orchestrator& orchestrator() { return *orchestrator_; }
    VectorStore& documents() { return *documents_; }
    LanguageModel& embedder() { return *embedder_; }
    BlockingExecutor& executor() { return executor_; }

private:
    BlockingExecutor executor_;
    std::unique_ptr<ConfigStore> config_;
    std::unique_ptr<LanguageModel> chat_;
    std::unique_ptr<LanguageModel> embedder_;
    std::unique_ptr<VectorStore> documents_;
    std::unique_ptr<HistoryStore> history_;
    std::unique_ptr<CacheEngine> cache_;
    std::unique_ptr<Orchestrator> orchestrator_;
};
