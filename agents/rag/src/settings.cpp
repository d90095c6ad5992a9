#include "../include/settings.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

static bool env_flag(const char* key, bool def) {
    auto v = to_lower(trim(getenv_or(key, def ? "true" : "false")));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

static long long env_int(const char* key, long long def) {
    auto v = trim(getenv_or(key, ""));
    if (v.empty()) return def;
    try {
        size_t pos = 0;
        long long n = std::stoll(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::logic_error&) {
        throw ConfigError(ConfigErrorKind::Invalid, std::string(key) + " must be an integer, got '" + v + "'");
    }
}

static double env_double(const char* key, double def) {
    auto v = trim(getenv_or(key, ""));
    if (v.empty()) return def;
    try {
        size_t pos = 0;
        double d = std::stod(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return d;
    } catch (const std::logic_error&) {
        throw ConfigError(ConfigErrorKind::Invalid, std::string(key) + " must be a number, got '" + v + "'");
    }
}

template <typename Kind>
static Kind env_kind(const char* key, std::optional<Kind> (*parse)(const std::string&)) {
    auto raw = getenv_or(key, "");
    auto kind = parse(raw);
    if (!kind) throw ConfigError(ConfigErrorKind::Invalid, std::string("unsupported ") + key + " '" + raw + "'");
    return *kind;
}

Settings Settings::from_env() {
    Settings s;
    s.server_addr = getenv_or("SERVER_ADDR", s.server_addr);
    s.http_port = (unsigned short)env_int("HTTP_PORT", s.http_port);
    s.api_key = getenv_or("SERVER_API_KEY", "");
    s.auth_tolerance_secs = env_int("AUTH_TOLERANCE_SECS", s.auth_tolerance_secs);
    s.max_message_bytes = (std::size_t)env_int("MAX_MESSAGE_BYTES", (long long)s.max_message_bytes);
    s.connections_per_sec = env_double("CONNECTIONS_PER_SEC", s.connections_per_sec);
    s.worker_threads = (std::size_t)std::max(1LL, env_int("WORKER_THREADS", (long long)s.worker_threads));

    s.prompts_path = getenv_or("PROMPTS_PATH", s.prompts_path);
    s.schema_path = getenv_or("SCHEMA_PATH", s.schema_path);
    s.remote_prompts = env_flag("ENABLE_REMOTE_PROMPTS", false);
    s.remote_prompts_url = getenv_or("REMOTE_PROMPTS_URL", "");
    s.remote_prompts_token = getenv_or("REMOTE_PROMPTS_TOKEN", "");

    const long timeout = (long)env_int("LLM_TIMEOUT_MS", 60000);
    s.chat.kind = env_kind<LlmKind>("CHAT_LLM_TYPE", parse_llm_kind);
    s.chat.base_url = getenv_or("CHAT_BASE_URL", "");
    s.chat.model = getenv_or("CHAT_MODEL", "mistral");
    s.chat.api_key = getenv_or("CHAT_API_KEY", "");
    s.chat.timeout_ms = timeout;
    s.embedding.kind = env_kind<LlmKind>("EMBEDDING_LLM_TYPE", parse_llm_kind);
    s.embedding.base_url = getenv_or("EMBEDDING_BASE_URL", "");
    s.embedding.model = getenv_or("EMBEDDING_MODEL", "nomic-embed-text");
    s.embedding.api_key = getenv_or("EMBEDDING_API_KEY", "");
    s.embedding.timeout_ms = timeout;

    s.vectors.kind = env_kind<VectorKind>("VECTOR_TYPE", parse_vector_kind);
    s.vectors.host = getenv_or("VECTOR_HOST", "http://localhost:6333");
    s.vectors.api_key = getenv_or("VECTOR_API_KEY", "");
    s.vectors.db_path = getenv_or("VECTOR_DB_PATH", "data/vectors.db");
    s.vectors.timeout_ms = (long)env_int("VECTOR_TIMEOUT_MS", 10000);
    s.rag_default_limit = (int)env_int("RAG_DEFAULT_LIMIT", s.rag_default_limit);
    s.llm_query = env_flag("LLM_QUERY", false);

    s.cache_enabled = env_flag("ENABLE_CACHE", false);
    s.cache_kv = env_kind<KvKind>("CACHE_KV_TYPE", parse_kv_kind);
    s.cache_db_path = getenv_or("CACHE_DB_PATH", s.cache_db_path);
    s.cache_vectors.kind = env_kind<VectorKind>("CACHE_VECTOR_TYPE", parse_vector_kind);
    s.cache_vectors.host = getenv_or("CACHE_QDRANT_URL", s.vectors.host);
    s.cache_vectors.api_key = getenv_or("CACHE_QDRANT_API_KEY", s.vectors.api_key);
    s.cache_vectors.db_path = s.cache_db_path;
    s.cache_vectors.timeout_ms = s.vectors.timeout_ms;
    s.cache.key_prefix = getenv_or("CACHE_KEY_PREFIX", s.cache.key_prefix);
    s.cache.collection = getenv_or("CACHE_COLLECTION", s.cache.collection);
    s.cache.similarity_threshold = (float)env_double("CACHE_SIMILARITY_THRESHOLD", s.cache.similarity_threshold);
    s.cache.ttl_secs = env_int("CACHE_TTL_SECS", s.cache.ttl_secs);
    s.cache.dimension = (int)env_int("VECTOR_DIMENSION", s.cache.dimension);

    s.history = env_kind<HistoryKind>("HISTORY_TYPE", parse_history_kind);
    s.history_db_path = getenv_or("HISTORY_DB_PATH", s.history_db_path);

    s.log_level = getenv_or("LOG_LEVEL", s.log_level);
    return s;
}

void configure_logging(const std::string& level) {
    auto lvl = spdlog::level::from_str(to_lower(trim(level)));
    // from_str maps unknown names to off.
    if (lvl == spdlog::level::off && to_lower(trim(level)) != "off") lvl = spdlog::level::info;
    spdlog::set_level(lvl);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
}

static std::unique_ptr<ConfigStore> make_config_store(const Settings& s) {
    std::unique_ptr<RemoteConfigSource> remote;
    if (s.remote_prompts) {
        if (s.remote_prompts_url.empty()) {
            throw ConfigError(ConfigErrorKind::Invalid, "ENABLE_REMOTE_PROMPTS is set but REMOTE_PROMPTS_URL is empty");
        }
        remote = std::make_unique<HttpRemoteConfigSource>(s.remote_prompts_url, s.remote_prompts_token);
    }
    return std::make_unique<ConfigStore>(ConfigPaths{s.prompts_path, s.schema_path}, std::move(remote));
}

RagRuntime::RagRuntime(const Settings& settings) : executor_(settings.worker_threads) {
    config_ = make_config_store(settings);
    chat_ = make_language_model(settings.chat);
    embedder_ = make_language_model(settings.embedding);
    documents_ = make_vector_store(settings.vectors);
    history_ = make_history_store(settings.history, settings.history_db_path);
    if (settings.cache_enabled) {
        cache_ = std::make_unique<CacheEngine>(make_kv_store(settings.cache_kv, settings.cache_db_path),
                                               make_vector_store(settings.cache_vectors), settings.cache);
        cache_->prepare();
        spdlog::info("Response cache enabled (collection {}, threshold {:.2f}, ttl {}s)",
                     settings.cache.collection, settings.cache.similarity_threshold, settings.cache.ttl_secs);
    } else {
        spdlog::info("Response cache disabled");
    }
    Backends backends{*chat_, *embedder_, *documents_, *history_, cache_.get()};
    OrchestratorOptions options;
    options.select_fields = settings.llm_query;
    orchestrator_ = std::make_unique<Orchestrator>(backends, executor_, settings.rag_default_limit, options);
}

// Calls already running on the pool finish before the backends are destroyed.
RagRuntime::~RagRuntime() {
    executor_.stop();
    executor_.join();
}
