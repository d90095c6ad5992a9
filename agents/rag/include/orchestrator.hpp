#pragma once
#include "cache_engine.hpp"
#include "config_store.hpp"
#include "executor.hpp"
#include "history.hpp"
#include "llm.hpp"
#include "rag_context.hpp"
#include "topic_resolver.hpp"
#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>
#include <vector>

struct Query {
    std::string text;
    std::string conversation_id;
};

enum class ReplyKind {
    CacheHit,
    Direct,        // response_templates entry
    Generated,
    Clarification, // topic could not be resolved
};

const char* to_string(ReplyKind kind);

struct Reply {
    ReplyKind kind{ReplyKind::Generated};
    std::string text;
    CacheHitKind cache{CacheHitKind::Miss};
    std::optional<std::string> intent;
    std::optional<std::string> topic;
};

struct OrchestratorOptions {
    bool select_fields{false};     // render only the field the question asks for
    std::size_t history_window{6}; // turns fed to general_chat
};

struct Backends {
    LanguageModel& chat;
    LanguageModel& embedder;
    VectorStore& documents;
    HistoryStore& history;
    CacheEngine* cache{nullptr}; // null when caching is disabled
};

// Runs one query through the pipeline. Every backend call is made on the
// blocking executor while the coroutine is suspended.
// Throws GenerationError when no answer can be produced.
class Orchestrator {
public:
    Orchestrator(Backends backends, BlockingExecutor& executor, int default_limit,
                 OrchestratorOptions options = {});

    boost::asio::awaitable<Reply> handle(Query query, SnapshotPtr snapshot);

private:
    enum class Stage {
        Normalize,
        ClassifyIntent,
        CacheCheck,
        ResolvePrimary,
        ResolveFallback,
        Retrieve,
        Generate,
        Clarify,
        PopulateCache,
        PersistHistory,
        Respond,
    };

    struct Request {
        const Query& query;
        const ConfigSnapshot& config;
        std::string normalized;
        std::optional<IntentMatch> intent;
        std::vector<float> embedding;
        bool embedding_tried{false};
        std::optional<std::string> topic;
        std::vector<ScoredPoint> hits;
        Reply reply;
    };

    static const char* stage_name(Stage stage);

    boost::asio::awaitable<void> ensure_embedding(Request& req);
    boost::asio::awaitable<std::optional<IntentMatch>> classify_with_model(Request& req);
    boost::asio::awaitable<std::string> generate(Request& req);
    boost::asio::awaitable<void> persist_history(const Request& req);

    Backends backends_;
    BlockingExecutor& executor_;
    TopicResolver resolver_;
    Retriever retriever_;
    OrchestratorOptions options_;
};

// Text sent to the user when generation fails.
std::string generation_failure_text(const PromptConfig& prompts);
std::string clarification_text(const PromptConfig& prompts);
