#include <gtest/gtest.h>
#include "orchestrator.hpp"
#include "test_support.hpp"
#include "util.hpp"
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>
#include <future>

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot = make_snapshot(parse_prompt_config(sample_prompts_json()), parse_index_schema(sample_schema_json()));
        documents.upsert("profile", "u1", {1.0f, 0.0f, 0.0f}, {{"name", "Ada"}, {"birth_date", "1990-01-01"}});
        documents.upsert("orders", "o1", {0.0f, 1.0f, 0.0f}, {{"order_id", "A-1"}, {"total", 42}});

        CacheSettings s;
        s.similarity_threshold = 0.95f;
        s.dimension = 3;
        cache = std::make_unique<CacheEngine>(std::make_unique<MemoryKeyValueStore>(),
                                              std::make_unique<SqliteVectorStore>(":memory:"), s);
        cache->prepare();

        embedder.set_embedding("how old is ada?", {1.0f, 0.0f, 0.0f});
    }

    Orchestrator make(VectorStore& docs, HistoryStore& hist, CacheEngine* c) {
        return Orchestrator(Backends{chat, embedder, docs, hist, c}, executor, 5);
    }
    Orchestrator make() { return make(documents, history, cache.get()); }

    Reply ask(Orchestrator& o, const std::string& text, const std::string& conv = "c1") {
        return run_sync(o.handle(Query{text, conv}, snapshot));
    }

    // Adds a model classification step and a mixed-case direct intent that no
    // keyword will ever match.
    void enable_model_classification() {
        auto j = nlohmann::json::parse(sample_prompts_json());
        j["query_templates"]["intent_classification"] = "CLASSIFY intents:\n{intent_descriptions}\nq={message}";
        j["intents"]["Weather"] = {{"description", "Forecast questions"},
                                   {"keywords", {"weather report for tomorrow"}},
                                   {"action", "direct_response"},
                                   {"template", "weather_reply"}};
        j["response_templates"]["weather_reply"] = "Check the sky.";
        snapshot = make_snapshot(parse_prompt_config(j.dump()), parse_index_schema(sample_schema_json()));
    }

    void script_profile_answer(const std::string& answer) {
        chat.on_prompt("PRIMARY", "None");
        chat.on_prompt("FALLBACK", "profile");
        chat.on_prompt("ANSWER", answer);
    }

    SnapshotPtr snapshot;
    ScriptedModel chat;
    ScriptedModel embedder;
    SqliteVectorStore documents{":memory:"};
    MemoryHistoryStore history;
    std::unique_ptr<CacheEngine> cache;
    BlockingExecutor executor{2};
};

TEST_F(OrchestratorTest, Greeting_ShouldAnswerFromTemplateWithoutModelCalls) {
    auto orch = make();
    auto reply = ask(orch, "Hi there!");

    EXPECT_EQ(reply.kind, ReplyKind::Direct);
    EXPECT_EQ(reply.text, "Hello! How can I help you today?");
    EXPECT_EQ(reply.intent, std::optional<std::string>("greeting"));
    EXPECT_EQ(chat.completions.load(), 0);
    EXPECT_EQ(embedder.embeds.load(), 0);
    EXPECT_EQ(cache->lookup_exact("hi there!").kind, CacheHitKind::Miss);
    EXPECT_EQ(history.recent("c1", 10).size(), 2u);
}

TEST_F(OrchestratorTest, DataQuestion_ShouldCascadeToFallbackAndAnswerFromDocuments) {
    // Given: primary inference cannot map "old", the fallback maps it to profile
    script_profile_answer("Ada was born in 1990.");
    auto orch = make();

    // When
    auto reply = ask(orch, "How old is Ada?");

    // Then
    EXPECT_EQ(reply.kind, ReplyKind::Generated);
    EXPECT_EQ(reply.text, "Ada was born in 1990.");
    EXPECT_EQ(reply.topic, std::optional<std::string>("profile"));
    EXPECT_EQ(reply.intent, std::optional<std::string>("data_question"));
    ASSERT_EQ(chat.completions.load(), 3);
    const auto& answer_prompt = chat.prompts.back();
    EXPECT_NE(answer_prompt.find("topic=profile"), std::string::npos);
    EXPECT_NE(answer_prompt.find("Document ID: u1 (Score: 1.0000)"), std::string::npos);
    EXPECT_NE(answer_prompt.find("  - birth_date: 1990-01-01"), std::string::npos);
    EXPECT_NE(answer_prompt.find("q=How old is Ada?"), std::string::npos);

    auto turns = history.recent("c1", 10);
    ASSERT_EQ(turns.size(), 2u);
    EXPECT_EQ(turns[0].role, "user");
    EXPECT_EQ(turns[0].content, "How old is Ada?");
    EXPECT_EQ(turns[1].content, "Ada was born in 1990.");
}

TEST_F(OrchestratorTest, SameQueryTwice_SecondShouldBeExactCacheHit) {
    script_profile_answer("Ada was born in 1990.");
    auto orch = make();
    ask(orch, "How old is Ada?");
    const int completions = chat.completions.load();
    const int embeds = embedder.embeds.load();

    auto reply = ask(orch, "  how OLD is ada?");

    EXPECT_EQ(reply.kind, ReplyKind::CacheHit);
    EXPECT_EQ(reply.cache, CacheHitKind::Exact);
    EXPECT_EQ(reply.text, "Ada was born in 1990.");
    EXPECT_EQ(chat.completions.load(), completions);
    EXPECT_EQ(embedder.embeds.load(), embeds);
    // cache hits are still part of the conversation
    EXPECT_EQ(history.recent("c1", 10).size(), 4u);
}

TEST_F(OrchestratorTest, SimilarQuery_ShouldHitSemanticTierAndPrimeExactTier) {
    script_profile_answer("Ada was born in 1990.");
    embedder.set_embedding("what is ada's age", {0.99f, 0.01f, 0.0f});
    auto orch = make();
    ask(orch, "How old is Ada?");
    const int completions = chat.completions.load();

    auto reply = ask(orch, "What is Ada's age");

    EXPECT_EQ(reply.kind, ReplyKind::CacheHit);
    EXPECT_EQ(reply.cache, CacheHitKind::Semantic);
    EXPECT_EQ(reply.text, "Ada was born in 1990.");
    EXPECT_EQ(chat.completions.load(), completions);
    EXPECT_EQ(cache->lookup_exact("what is ada's age").kind, CacheHitKind::Exact);
}

TEST_F(OrchestratorTest, RetrievalTimeout_ShouldStillGenerateWithoutDocuments) {
    FailingVectorStore slow_docs(BackendErrorKind::Timeout);
    chat.on_prompt("PRIMARY", "profile");
    chat.on_prompt("ANSWER", "I could not find that record.");
    auto orch = make(slow_docs, history, nullptr);

    auto reply = ask(orch, "How old is Ada?");

    EXPECT_EQ(reply.kind, ReplyKind::Generated);
    EXPECT_EQ(reply.text, "I could not find that record.");
    EXPECT_EQ(slow_docs.queries.load(), 1);
    const auto& answer_prompt = chat.prompts.back();
    EXPECT_NE(answer_prompt.find("docs=No relevant documents found."), std::string::npos);
    EXPECT_NE(answer_prompt.find("topic=none"), std::string::npos);
}

TEST_F(OrchestratorTest, GenerationFailure_ShouldThrowAndLeaveNoTrace) {
    chat.on_prompt("PRIMARY", "profile");
    chat.fail_prompts_containing("ANSWER");
    auto orch = make();

    try {
        ask(orch, "How old is Ada?");
        FAIL() << "expected GenerationError";
    } catch (const GenerationError& e) {
        EXPECT_EQ(e.kind(), BackendErrorKind::Timeout);
    }
    EXPECT_EQ(cache->lookup_exact("how old is ada?").kind, CacheHitKind::Miss);
    EXPECT_TRUE(history.recent("c1", 10).empty());
    EXPECT_EQ(generation_failure_text(*snapshot->prompts), "Something went wrong, please retry.");
}

TEST_F(OrchestratorTest, UnresolvedTopic_ShouldAskForClarificationAndNotCache) {
    auto orch = make();

    auto reply = ask(orch, "What about the orders thing");

    EXPECT_EQ(reply.kind, ReplyKind::Clarification);
    EXPECT_EQ(reply.text, "Which records do you mean?");
    EXPECT_FALSE(reply.topic.has_value());
    EXPECT_EQ(chat.completions.load(), 2);
    EXPECT_EQ(cache->lookup_exact("what about the orders thing").kind, CacheHitKind::Miss);
    EXPECT_EQ(history.recent("c1", 10).size(), 2u);
}

TEST_F(OrchestratorTest, EmptyQuery_ShouldClarifyWithoutAnyBackendCall) {
    auto orch = make();
    auto reply = ask(orch, "   \t ");
    EXPECT_EQ(reply.kind, ReplyKind::Clarification);
    EXPECT_EQ(chat.completions.load(), 0);
    EXPECT_EQ(embedder.embeds.load(), 0);
    EXPECT_TRUE(history.recent("c1", 10).empty());
}

TEST_F(OrchestratorTest, GeneralChat_ShouldFeedConversationHistory) {
    chat.on_prompt("CHAT", "Why did the vector cross the road?");
    auto orch = make();
    ask(orch, "hi", "c7");

    auto reply = ask(orch, "Tell me a joke", "c7");

    EXPECT_EQ(reply.kind, ReplyKind::Generated);
    EXPECT_EQ(reply.intent, std::optional<std::string>("chitchat"));
    EXPECT_EQ(chat.completions.load(), 1);
    EXPECT_NE(chat.prompts.back().find("history=User: hi\nAssistant: Hello! How can I help you today? q=Tell me a joke"),
              std::string::npos);
}

TEST_F(OrchestratorTest, BackendsDown_ShouldStillAnswer) {
    FailingHistoryStore broken_history;
    CacheEngine broken_cache(std::make_unique<FailingKeyValueStore>(),
                             std::make_unique<FailingVectorStore>(BackendErrorKind::Unavailable));
    embedder.fail_embeddings();
    chat.on_prompt("PRIMARY", "orders");
    chat.on_prompt("ANSWER", "You have one order.");
    auto orch = make(documents, broken_history, &broken_cache);

    auto reply = ask(orch, "Show my orders");

    EXPECT_EQ(reply.kind, ReplyKind::Generated);
    EXPECT_EQ(reply.text, "You have one order.");
    EXPECT_EQ(reply.cache, CacheHitKind::Miss);
    // one failed attempt, reused by retrieval and cache population
    EXPECT_EQ(embedder.embeds.load(), 1);
    EXPECT_NE(chat.prompts.back().find("docs=No relevant documents found."), std::string::npos);
}

TEST_F(OrchestratorTest, ConcurrentConversations_ShouldAllComplete) {
    chat.on_prompt("PRIMARY", "orders");
    chat.on_prompt("ANSWER", "ok");
    auto orch = make(documents, history, nullptr);

    boost::asio::io_context ioc;
    std::vector<std::future<Reply>> replies;
    for (int i = 0; i < 8; ++i) {
        replies.push_back(boost::asio::co_spawn(
            ioc, orch.handle(Query{"show my orders " + std::to_string(i), "conv" + std::to_string(i)}, snapshot),
            boost::asio::use_future));
    }
    ioc.run();

    for (auto& f : replies) EXPECT_EQ(f.get().text, "ok");
    for (int i = 0; i < 8; ++i) EXPECT_EQ(history.recent("conv" + std::to_string(i), 10).size(), 2u);
}

TEST_F(OrchestratorTest, ModelClassification_ShouldPickDirectIntentByConfiguredName) {
    enable_model_classification();
    chat.on_prompt("CLASSIFY", "`Weather`\n");
    auto orch = make();

    auto reply = ask(orch, "Will it rain later?");

    EXPECT_EQ(reply.kind, ReplyKind::Direct);
    EXPECT_EQ(reply.text, "Check the sky.");
    EXPECT_EQ(reply.intent, std::optional<std::string>("Weather"));
    ASSERT_EQ(chat.completions.load(), 1);
    EXPECT_NE(chat.prompts[0].find("- Weather: Forecast questions"), std::string::npos);
    EXPECT_NE(chat.prompts[0].find("q=Will it rain later?"), std::string::npos);
}

TEST_F(OrchestratorTest, ModelClassification_ShouldMatchIntentNameIgnoringCase) {
    enable_model_classification();
    chat.on_prompt("CLASSIFY", "weather");
    auto orch = make();

    auto reply = ask(orch, "Will it rain later?");

    EXPECT_EQ(reply.kind, ReplyKind::Direct);
    EXPECT_EQ(reply.intent, std::optional<std::string>("Weather"));
}

TEST_F(OrchestratorTest, ModelClassification_UnknownIntent_ShouldDefaultToRetrieval) {
    enable_model_classification();
    chat.on_prompt("CLASSIFY", "shopping");
    chat.on_prompt("PRIMARY", "profile");
    chat.on_prompt("ANSWER", "Ada is on file.");
    auto orch = make();

    auto reply = ask(orch, "Tell me about Ada");

    EXPECT_EQ(reply.kind, ReplyKind::Generated);
    EXPECT_EQ(reply.text, "Ada is on file.");
    EXPECT_FALSE(reply.intent.has_value());
    EXPECT_EQ(reply.topic, std::optional<std::string>("profile"));
    ASSERT_EQ(chat.completions.load(), 3);
    EXPECT_NE(chat.prompts[1].find("PRIMARY"), std::string::npos);
}

TEST_F(OrchestratorTest, ModelClassification_ShouldNotRunWhenKeywordMatches) {
    enable_model_classification();
    chat.on_prompt("CLASSIFY", "Weather");
    chat.on_prompt("PRIMARY", "orders");
    chat.on_prompt("ANSWER", "You have one order.");
    auto orch = make();

    auto reply = ask(orch, "Show my orders");

    EXPECT_EQ(reply.intent, std::optional<std::string>("data_question"));
    EXPECT_EQ(reply.text, "You have one order.");
    for (const auto& p : chat.prompts) EXPECT_EQ(p.find("CLASSIFY"), std::string::npos);
}

TEST_F(OrchestratorTest, WithoutClassificationTemplate_ShouldNotAskModelForIntent) {
    chat.on_prompt("PRIMARY", "profile");
    chat.on_prompt("ANSWER", "Ada is on file.");
    auto orch = make();

    auto reply = ask(orch, "Tell me about Ada");

    EXPECT_EQ(reply.kind, ReplyKind::Generated);
    EXPECT_FALSE(reply.intent.has_value());
    EXPECT_EQ(chat.completions.load(), 2);
}
