#include "../include/orchestrator.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

static const char* kDefaultGeneralChat = "{history}\n\nUser: {user_question}";

const char* to_string(ReplyKind kind) {
    switch (kind) {
        case ReplyKind::CacheHit: return "cache_hit";
        case ReplyKind::Direct: return "direct";
        case ReplyKind::Generated: return "generated";
        case ReplyKind::Clarification: return "clarification";
    }
    return "unknown";
}

std::string generation_failure_text(const PromptConfig& prompts) {
    return core_prompt_or(prompts, "generation_failure",
                          "Sorry, I couldn't generate an answer right now. Please try again.");
}

std::string clarification_text(const PromptConfig& prompts) {
    return core_prompt_or(prompts, "clarification",
                          "I couldn't tell which data your question is about. Could you rephrase it?");
}

Orchestrator::Orchestrator(Backends backends, BlockingExecutor& executor, int default_limit,
                           OrchestratorOptions options)
    : backends_(backends),
      executor_(executor),
      resolver_(backends.chat),
      retriever_(backends.documents, default_limit),
      options_(options) {}

const char* Orchestrator::stage_name(Stage stage) {
    switch (stage) {
        case Stage::Normalize: return "normalize";
        case Stage::ClassifyIntent: return "classify_intent";
        case Stage::CacheCheck: return "cache_check";
        case Stage::ResolvePrimary: return "resolve_primary";
        case Stage::ResolveFallback: return "resolve_fallback";
        case Stage::Retrieve: return "retrieve";
        case Stage::Generate: return "generate";
        case Stage::Clarify: return "clarify";
        case Stage::PopulateCache: return "populate_cache";
        case Stage::PersistHistory: return "persist_history";
        case Stage::Respond: return "respond";
    }
    return "unknown";
}

static std::string direct_response(const PromptConfig& prompts, const IntentDefinition& intent,
                                   const std::string& question) {
    auto it = prompts.response_templates.find(intent.template_name);
    if (it == prompts.response_templates.end()) {
        throw ConfigError(ConfigErrorKind::Invalid, "missing response_templates." + intent.template_name);
    }
    return render_template(it->second, {{"user_question", question}});
}

boost::asio::awaitable<Reply> Orchestrator::handle(Query query, SnapshotPtr snapshot) {
    if (!snapshot || !snapshot->prompts || !snapshot->schema) {
        throw ConfigError(ConfigErrorKind::Invalid, "no configuration snapshot");
    }
    const PromptConfig& prompts = *snapshot->prompts;
    const IndexSchema& schema = *snapshot->schema;
    Request req{query, *snapshot};
    CacheEngine* cache = backends_.cache;

    Stage stage = Stage::Normalize;
    while (stage != Stage::Respond) {
        spdlog::trace("[{}] stage {}", query.conversation_id, stage_name(stage));
        switch (stage) {
            case Stage::Normalize: {
                req.normalized = normalize_query(query.text);
                if (req.normalized.empty()) {
                    req.reply.kind = ReplyKind::Clarification;
                    req.reply.text = clarification_text(prompts);
                    stage = Stage::Respond;
                    break;
                }
                // Templated intents never reach the cache.
                req.intent = match_intent(prompts, req.normalized);
                if (req.intent && req.intent->intent->action == IntentAction::DirectResponse) {
                    req.reply.intent = req.intent->name;
                    req.reply.kind = ReplyKind::Direct;
                    req.reply.text = direct_response(prompts, *req.intent->intent, query.text);
                    stage = Stage::PersistHistory;
                } else {
                    stage = cache ? Stage::CacheCheck : Stage::ClassifyIntent;
                }
                break;
            }
            case Stage::CacheCheck: {
                auto outcome = co_await executor_.run([&] { return cache->lookup_exact(req.normalized); });
                if (outcome.kind == CacheHitKind::Miss) {
                    co_await ensure_embedding(req);
                    outcome = co_await executor_.run([&] { return cache->lookup_semantic(req.embedding); });
                    if (outcome.kind == CacheHitKind::Semantic) {
                        co_await executor_.run([&] { return cache->prime_exact(req.normalized, outcome.response); });
                    }
                }
                spdlog::info("[{}] cache {}{}", query.conversation_id, to_string(outcome.kind),
                             outcome.kind == CacheHitKind::Semantic ? fmt::format(" (score {:.4f})", outcome.score)
                                                                    : std::string());
                if (outcome.kind != CacheHitKind::Miss) {
                    req.reply.kind = ReplyKind::CacheHit;
                    req.reply.cache = outcome.kind;
                    req.reply.text = std::move(outcome.response);
                    stage = Stage::PersistHistory;
                } else {
                    stage = Stage::ClassifyIntent;
                }
                break;
            }
            case Stage::ClassifyIntent: {
                if (!req.intent) req.intent = co_await classify_with_model(req);
                IntentAction action = req.intent ? req.intent->intent->action : IntentAction::RetrievalAugmented;
                if (req.intent) req.reply.intent = req.intent->name;
                if (action == IntentAction::DirectResponse) {
                    req.reply.kind = ReplyKind::Direct;
                    req.reply.text = direct_response(prompts, *req.intent->intent, query.text);
                    stage = Stage::PersistHistory;
                } else if (action == IntentAction::GeneralChat) {
                    stage = Stage::Generate;
                } else {
                    stage = Stage::ResolvePrimary;
                }
                break;
            }
            case Stage::ResolvePrimary:
            case Stage::ResolveFallback: {
                ResolveStage rs = stage == Stage::ResolvePrimary ? ResolveStage::Primary : ResolveStage::Fallback;
                req.topic = co_await executor_.run(
                    [&] { return resolver_.infer(rs, query.text, prompts, schema); });
                if (req.topic) {
                    req.reply.topic = req.topic;
                    stage = Stage::Retrieve;
                } else {
                    stage = rs == ResolveStage::Primary ? Stage::ResolveFallback : Stage::Clarify;
                }
                break;
            }
            case Stage::Clarify:
                spdlog::info("[{}] topic unresolved, asking for clarification", query.conversation_id);
                req.reply.kind = ReplyKind::Clarification;
                req.reply.text = clarification_text(prompts);
                stage = Stage::PersistHistory;
                break;
            case Stage::Retrieve: {
                co_await ensure_embedding(req);
                if (req.embedding.empty()) {
                    spdlog::warn("[{}] no query embedding, answering without documents", query.conversation_id);
                } else {
                    try {
                        req.hits = co_await executor_.run(
                            [&] { return retriever_.search(*req.topic, req.embedding); });
                    } catch (const RetrievalError& e) {
                        spdlog::warn("[{}] retrieval failed ({}), answering without documents: {}",
                                     query.conversation_id, to_string(e.kind()), e.what());
                        req.hits.clear();
                    }
                }
                spdlog::info("[{}] retrieved {} documents from {}", query.conversation_id, req.hits.size(), *req.topic);
                stage = Stage::Generate;
                break;
            }
            case Stage::Generate:
                req.reply.kind = ReplyKind::Generated;
                req.reply.text = co_await generate(req);
                stage = cache ? Stage::PopulateCache : Stage::PersistHistory;
                break;
            case Stage::PopulateCache: {
                co_await ensure_embedding(req);
                bool stored = co_await executor_.run(
                    [&] { return cache->store(req.normalized, req.embedding, req.reply.text); });
                if (!stored) spdlog::warn("[{}] answer only partially cached", query.conversation_id);
                stage = Stage::PersistHistory;
                break;
            }
            case Stage::PersistHistory:
                co_await persist_history(req);
                stage = Stage::Respond;
                break;
            case Stage::Respond:
                break;
        }
    }
    spdlog::info("[{}] reply {} (intent {}, topic {})", query.conversation_id, to_string(req.reply.kind),
                 req.reply.intent.value_or("-"), req.reply.topic.value_or("-"));
    co_return std::move(req.reply);
}

boost::asio::awaitable<void> Orchestrator::ensure_embedding(Request& req) {
    if (req.embedding_tried) co_return;
    req.embedding_tried = true;
    try {
        req.embedding = co_await executor_.run([&] { return backends_.embedder.embed(req.normalized); });
    } catch (const GenerationError& e) {
        spdlog::warn("[{}] embedding failed ({}): {}", req.query.conversation_id, to_string(e.kind()), e.what());
        req.embedding.clear();
    }
}

boost::asio::awaitable<std::optional<IntentMatch>> Orchestrator::classify_with_model(Request& req) {
    const PromptConfig& prompts = *req.config.prompts;
    auto tmpl = prompts.query_templates.find("intent_classification");
    if (tmpl == prompts.query_templates.end() || prompts.intents.empty()) co_return std::nullopt;

    auto prompt = render_template(tmpl->second, {
        {"intent_descriptions", intent_descriptions(prompts)},
        {"message", req.query.text},
        {"user_question", req.query.text},
    });
    std::string answer;
    try {
        answer = co_await executor_.run(
            [&] { return backends_.chat.complete(core_prompt_or(prompts, "system", ""), prompt); });
    } catch (const GenerationError& e) {
        spdlog::warn("[{}] intent classification failed ({}): {}", req.query.conversation_id,
                     to_string(e.kind()), e.what());
        co_return std::nullopt;
    }
    std::string name = trim(answer);
    const std::string quotes = "\"'`";
    while (!name.empty() && quotes.find(name.front()) != std::string::npos) name.erase(0, 1);
    while (!name.empty() && quotes.find(name.back()) != std::string::npos) name.pop_back();
    name = trim(name);
    auto it = prompts.intents.find(name);
    if (it == prompts.intents.end()) {
        const std::string wanted = to_lower(name);
        it = std::find_if(prompts.intents.begin(), prompts.intents.end(),
                          [&](const auto& kv) { return to_lower(kv.first) == wanted; });
    }
    if (it == prompts.intents.end()) {
        spdlog::debug("[{}] model intent '{}' is not configured", req.query.conversation_id, name);
        co_return std::nullopt;
    }
    co_return IntentMatch{it->first, &it->second};
}

boost::asio::awaitable<std::string> Orchestrator::generate(Request& req) {
    const PromptConfig& prompts = *req.config.prompts;
    const IndexSchema& schema = *req.config.schema;
    const bool general = req.intent && req.intent->intent->action == IntentAction::GeneralChat;

    std::string prompt;
    if (general) {
        std::vector<Turn> turns;
        try {
            turns = co_await executor_.run(
                [&] { return backends_.history.recent(req.query.conversation_id, options_.history_window); });
        } catch (const HistoryError& e) {
            spdlog::warn("[{}] history unavailable ({}): {}", req.query.conversation_id, to_string(e.kind()), e.what());
        }
        auto it = prompts.query_templates.find(req.intent->intent->template_name);
        prompt = render_template(it != prompts.query_templates.end() ? it->second : kDefaultGeneralChat, {
            {"history", format_history_for_prompt(turns)},
            {"user_question", req.query.text},
            {"message", req.query.text},
        });
    } else {
        std::vector<std::string> fields;
        if (options_.select_fields && req.topic) {
            if (const auto* idx = schema.find(*req.topic)) {
                if (auto f = select_field(req.query.text, idx->fields)) fields.push_back(*f);
            }
        }
        std::string name = req.intent ? req.intent->intent->template_name : "rag_final_answer";
        auto it = prompts.query_templates.find(name);
        if (it == prompts.query_templates.end()) it = prompts.query_templates.find("rag_final_answer");
        if (it == prompts.query_templates.end()) {
            throw ConfigError(ConfigErrorKind::Invalid, "missing query_templates.rag_final_answer");
        }
        const std::string schema_json = schema.to_json();
        prompt = render_template(it->second, {
            {"schema", schema_json},
            {"schema_json", schema_json},
            {"schema_summary", schema.summary()},
            {"topic", req.hits.empty() ? std::string("none") : req.topic.value_or("none")},
            {"documents", format_documents(req.hits, fields)},
            {"user_question", req.query.text},
        });
    }
    spdlog::debug("[{}] generation prompt:\n{}", req.query.conversation_id, prompt);

    const std::string system = core_prompt_or(prompts, "system", "");
    try {
        co_return co_await executor_.run([&] { return backends_.chat.complete(system, prompt); });
    } catch (const GenerationError& e) {
        spdlog::error("[{}] generation failed ({}): {}", req.query.conversation_id, to_string(e.kind()), e.what());
        throw;
    }
}

boost::asio::awaitable<void> Orchestrator::persist_history(const Request& req) {
    const std::int64_t now = unix_now();
    Turn user{req.query.conversation_id, "user", req.query.text, now};
    Turn assistant{req.query.conversation_id, "assistant", req.reply.text, now};
    try {
        co_await executor_.run([&] {
            backends_.history.append(user);
            backends_.history.append(assistant);
        });
    } catch (const HistoryError& e) {
        spdlog::warn("[{}] history not saved ({}): {}", req.query.conversation_id, to_string(e.kind()), e.what());
    }
}
