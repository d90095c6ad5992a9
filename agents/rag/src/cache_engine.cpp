#include "../include/cache_engine.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

const char* to_string(CacheHitKind kind) {
    switch (kind) {
        case CacheHitKind::Exact: return "exact";
        case CacheHitKind::Semantic: return "semantic";
        case CacheHitKind::Miss: return "miss";
    }
    return "unknown";
}

CacheEngine::CacheEngine(std::unique_ptr<KeyValueStore> kv, std::unique_ptr<VectorStore> vectors,
                         CacheSettings settings)
    : kv_(std::move(kv)), vectors_(std::move(vectors)), settings_(std::move(settings)) {
    if (!kv_ || !vectors_) {
        throw ConfigError(ConfigErrorKind::Invalid, "cache needs both a key/value and a vector backend");
    }
    if (settings_.similarity_threshold < 0.0f || settings_.similarity_threshold > 1.0f) {
        throw ConfigError(ConfigErrorKind::Invalid, "CACHE_SIMILARITY_THRESHOLD must be within [0, 1]");
    }
}

void CacheEngine::prepare() {
    try {
        vectors_->ensure_collection(settings_.collection, settings_.dimension);
    } catch (const BackendError& e) {
        spdlog::warn("Cache collection {} not ready: {}", settings_.collection, e.what());
    }
}

std::string CacheEngine::exact_key(const std::string& normalized_query) const {
    return settings_.key_prefix + sha256_hex(normalized_query);
}

std::string CacheEngine::semantic_id(const std::string& normalized_query) const {
    return uuid_from_seed(normalized_query);
}

CacheOutcome CacheEngine::lookup_exact(const std::string& normalized_query) {
    CacheOutcome out;
    try {
        if (auto hit = kv_->get(exact_key(normalized_query))) {
            out.kind = CacheHitKind::Exact;
            out.response = std::move(*hit);
        }
    } catch (const BackendError& e) {
        spdlog::warn("Exact cache lookup failed ({}): {}", to_string(e.kind()), e.what());
    }
    return out;
}

CacheOutcome CacheEngine::lookup_semantic(const std::vector<float>& embedding) {
    CacheOutcome out;
    if (embedding.empty()) return out;
    try {
        auto hits = vectors_->query(settings_.collection, embedding, 1);
        if (hits.empty()) return out;
        const auto& best = hits.front();
        if (best.score < settings_.similarity_threshold) {
            spdlog::debug("Nearest cached answer scored {:.4f}, below threshold {:.2f}",
                          best.score, settings_.similarity_threshold);
            return out;
        }
        auto it = best.payload.find("response");
        if (it == best.payload.end() || !it->is_string()) {
            spdlog::warn("Semantic cache point {} has no response payload", best.id);
            return out;
        }
        out.kind = CacheHitKind::Semantic;
        out.response = it->get<std::string>();
        out.score = best.score;
    } catch (const BackendError& e) {
        spdlog::warn("Semantic cache lookup failed ({}): {}", to_string(e.kind()), e.what());
    }
    return out;
}

CacheOutcome CacheEngine::lookup(const std::string& normalized_query, const std::vector<float>& embedding) {
    auto exact = lookup_exact(normalized_query);
    if (exact.kind == CacheHitKind::Exact) return exact;
    return lookup_semantic(embedding);
}

bool CacheEngine::store(const std::string& normalized_query, const std::vector<float>& embedding,
                        const std::string& response) {
    bool ok = prime_exact(normalized_query, response);
    if (embedding.empty()) return false;
    try {
        json payload = {
            {"query", normalized_query},
            {"response", response},
            {"created_at", unix_now()}
        };
        vectors_->upsert(settings_.collection, semantic_id(normalized_query), embedding, payload);
    } catch (const BackendError& e) {
        spdlog::warn("Semantic cache write failed ({}): {}", to_string(e.kind()), e.what());
        ok = false;
    }
    return ok;
}

bool CacheEngine::prime_exact(const std::string& normalized_query, const std::string& response) {
    try {
        kv_->set(exact_key(normalized_query), response, settings_.ttl_secs);
        return true;
    } catch (const BackendError& e) {
        spdlog::warn("Exact cache write failed ({}): {}", to_string(e.kind()), e.what());
        return false;
    }
}
