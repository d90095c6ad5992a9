#pragma once
#include "kv_store.hpp"
#include "store.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct CacheSettings {
    std::string key_prefix{"cache:"};
    std::string collection{"prompt_response_cache"};
    float similarity_threshold{0.5f}; // [0, 1]
    std::int64_t ttl_secs{3600};      // exact tier only; <= 0 never expires
    int dimension{768};
};

enum class CacheHitKind { Exact, Semantic, Miss };

const char* to_string(CacheHitKind kind);

struct CacheOutcome {
    CacheHitKind kind{CacheHitKind::Miss};
    std::string response;
    float score{0.0f}; // semantic hits only
};

// Two-tier response cache. Exact tier: key/value store keyed by a hash of
// the normalized query. Semantic tier: vector store queried by nearest
// neighbour, accepted only at or above the similarity threshold.
// Backend failures are logged and degrade to a miss; nothing here throws
// after construction.
class CacheEngine {
public:
    CacheEngine(std::unique_ptr<KeyValueStore> kv, std::unique_ptr<VectorStore> vectors,
                CacheSettings settings = {});

    // Creates the semantic collection if the backend needs one.
    void prepare();

    std::string exact_key(const std::string& normalized_query) const;
    std::string semantic_id(const std::string& normalized_query) const;

    CacheOutcome lookup_exact(const std::string& normalized_query);
    CacheOutcome lookup_semantic(const std::vector<float>& embedding);
    CacheOutcome lookup(const std::string& normalized_query, const std::vector<float>& embedding);

    // Writes both tiers. Returns false when either write failed.
    bool store(const std::string& normalized_query, const std::vector<float>& embedding,
               const std::string& response);
    // Copies a semantic hit into the exact tier.
    bool prime_exact(const std::string& normalized_query, const std::string& response);

    const CacheSettings& settings() const { return settings_; }

private:
    std::unique_ptr<KeyValueStore> kv_;
    std::unique_ptr<VectorStore> vectors_;
    CacheSettings settings_;
};
