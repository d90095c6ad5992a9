#include <gtest/gtest.h>
#include "cache_engine.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <memory>

class CacheEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<CacheEngine> make_engine(float threshold, std::int64_t ttl = 3600) {
        auto kv = std::make_unique<MemoryKeyValueStore>([this] { return now; });
        auto vectors = std::make_unique<SqliteVectorStore>(":memory:");
        CacheSettings s;
        s.similarity_threshold = threshold;
        s.ttl_secs = ttl;
        s.dimension = 3;
        auto engine = std::make_unique<CacheEngine>(std::move(kv), std::move(vectors), s);
        engine->prepare();
        return engine;
    }

    std::int64_t now{1000};
};

TEST_F(CacheEngineTest, Lookup_EmptyCache_ShouldMiss) {
    auto cache = make_engine(0.5f);
    auto out = cache->lookup("what is my total", {1.0f, 0.0f, 0.0f});
    EXPECT_EQ(out.kind, CacheHitKind::Miss);
    EXPECT_TRUE(out.response.empty());
}

TEST_F(CacheEngineTest, Lookup_StoredQuery_ShouldHitExactTierFirst) {
    auto cache = make_engine(0.99f);
    ASSERT_TRUE(cache->store("what is my total", {1.0f, 0.0f, 0.0f}, "Your total is 42."));

    // The embedding is unrelated, so only the exact tier can answer.
    auto out = cache->lookup("what is my total", {0.0f, 1.0f, 0.0f});
    EXPECT_EQ(out.kind, CacheHitKind::Exact);
    EXPECT_EQ(out.response, "Your total is 42.");
}

TEST_F(CacheEngineTest, LookupSemantic_IdenticalVectorAtThresholdOne_ShouldHit) {
    auto cache = make_engine(1.0f);
    ASSERT_TRUE(cache->store("what is my total", {1.0f, 0.0f, 0.0f}, "42"));

    auto out = cache->lookup("how much did i spend", {1.0f, 0.0f, 0.0f});
    EXPECT_EQ(out.kind, CacheHitKind::Semantic);
    EXPECT_EQ(out.response, "42");
    EXPECT_FLOAT_EQ(out.score, 1.0f);
}

TEST_F(CacheEngineTest, LookupSemantic_ShouldCompareScoreAgainstThreshold) {
    // cos([1,0,0], [0.6,0.8,0]) = 0.6
    auto lenient = make_engine(0.5f);
    ASSERT_TRUE(lenient->store("q1", {1.0f, 0.0f, 0.0f}, "a1"));
    auto hit = lenient->lookup_semantic({0.6f, 0.8f, 0.0f});
    EXPECT_EQ(hit.kind, CacheHitKind::Semantic);
    EXPECT_NEAR(hit.score, 0.6f, 1e-4);

    auto strict = make_engine(0.7f);
    ASSERT_TRUE(strict->store("q1", {1.0f, 0.0f, 0.0f}, "a1"));
    EXPECT_EQ(strict->lookup_semantic({0.6f, 0.8f, 0.0f}).kind, CacheHitKind::Miss);
}

TEST_F(CacheEngineTest, LookupSemantic_EmptyEmbedding_ShouldMiss) {
    auto cache = make_engine(0.0f);
    ASSERT_TRUE(cache->store("q1", {1.0f, 0.0f, 0.0f}, "a1"));
    EXPECT_EQ(cache->lookup_semantic({}).kind, CacheHitKind::Miss);
}

TEST_F(CacheEngineTest, Store_SameQueryTwice_ShouldKeepOneSemanticPoint) {
    auto cache = make_engine(0.9f);
    ASSERT_TRUE(cache->store("q1", {1.0f, 0.0f, 0.0f}, "first"));
    ASSERT_TRUE(cache->store("q1", {1.0f, 0.0f, 0.0f}, "second"));

    EXPECT_EQ(cache->lookup_exact("q1").response, "second");
    EXPECT_EQ(cache->semantic_id("q1"), cache->semantic_id("q1"));
    EXPECT_EQ(cache->lookup_semantic({1.0f, 0.0f, 0.0f}).response, "second");
}

TEST_F(CacheEngineTest, Store_WithoutEmbedding_ShouldWriteExactTierOnly) {
    auto cache = make_engine(0.0f);
    EXPECT_FALSE(cache->store("q1", {}, "a1"));
    EXPECT_EQ(cache->lookup_exact("q1").kind, CacheHitKind::Exact);
    EXPECT_EQ(cache->lookup_semantic({1.0f, 0.0f, 0.0f}).kind, CacheHitKind::Miss);
}

TEST_F(CacheEngineTest, LookupExact_AfterTtl_ShouldMiss) {
    auto cache = make_engine(0.99f, 60);
    ASSERT_TRUE(cache->store("q1", {1.0f, 0.0f, 0.0f}, "a1"));

    now += 59;
    EXPECT_EQ(cache->lookup_exact("q1").kind, CacheHitKind::Exact);
    now += 1;
    EXPECT_EQ(cache->lookup_exact("q1").kind, CacheHitKind::Miss);
}

TEST_F(CacheEngineTest, PrimeExact_ShouldMakeLaterLookupsExact) {
    auto cache = make_engine(0.9f);
    ASSERT_TRUE(cache->store("q1", {1.0f, 0.0f, 0.0f}, "a1"));
    auto semantic = cache->lookup("q2", {1.0f, 0.0f, 0.0f});
    ASSERT_EQ(semantic.kind, CacheHitKind::Semantic);

    ASSERT_TRUE(cache->prime_exact("q2", semantic.response));
    EXPECT_EQ(cache->lookup_exact("q2").kind, CacheHitKind::Exact);
}

TEST_F(CacheEngineTest, ExactKey_ShouldUsePrefixAndStableHash) {
    auto cache = make_engine(0.5f);
    auto key = cache->exact_key("hello world");
    EXPECT_EQ(key.rfind("cache:", 0), 0u);
    EXPECT_EQ(key.size(), std::string("cache:").size() + 64);
    EXPECT_EQ(key, cache->exact_key("hello world"));
    EXPECT_NE(key, cache->exact_key("hello world!"));
}

TEST(CacheEngineBackends, FailingKeyValueStore_ShouldDegradeToSemanticTier) {
    auto vectors = std::make_unique<SqliteVectorStore>(":memory:");
    vectors->upsert("prompt_response_cache", "p1", {1.0f, 0.0f}, {{"query", "q"}, {"response", "cached"}});
    CacheEngine cache(std::make_unique<FailingKeyValueStore>(), std::move(vectors));

    auto out = cache.lookup("q", {1.0f, 0.0f});
    EXPECT_EQ(out.kind, CacheHitKind::Semantic);
    EXPECT_EQ(out.response, "cached");
    EXPECT_FALSE(cache.store("q2", {0.0f, 1.0f}, "x"));
}

TEST(CacheEngineBackends, FailingVectorStore_ShouldMissAndReportFailedStore) {
    CacheEngine cache(std::make_unique<MemoryKeyValueStore>(),
                      std::make_unique<FailingVectorStore>(BackendErrorKind::Timeout));
    cache.prepare();

    EXPECT_EQ(cache.lookup("q", {1.0f}).kind, CacheHitKind::Miss);
    EXPECT_FALSE(cache.store("q", {1.0f}, "a"));
    // The exact write still went through.
    EXPECT_EQ(cache.lookup_exact("q").kind, CacheHitKind::Exact);
}

TEST(CacheEngineBackends, PayloadWithoutResponse_ShouldMiss) {
    auto vectors = std::make_unique<SqliteVectorStore>(":memory:");
    vectors->upsert("prompt_response_cache", "p1", {1.0f, 0.0f}, {{"query", "q"}});
    CacheEngine cache(std::make_unique<MemoryKeyValueStore>(), std::move(vectors));
    EXPECT_EQ(cache.lookup_semantic({1.0f, 0.0f}).kind, CacheHitKind::Miss);
}

TEST(CacheEngineConstruction, ShouldRejectMissingBackendsAndBadThreshold) {
    EXPECT_THROW(CacheEngine(nullptr, std::make_unique<SqliteVectorStore>(":memory:")), ConfigError);
    CacheSettings s;
    s.similarity_threshold = 1.5f;
    EXPECT_THROW(CacheEngine(std::make_unique<MemoryKeyValueStore>(),
                             std::make_unique<SqliteVectorStore>(":memory:"), s),
                 ConfigError);
}
