#include <gtest/gtest.h>
#include "errors.hpp"
#include "rag_context.hpp"
#include "test_support.hpp"

TEST(FormatDocuments, NoHits_ShouldSayNoDocuments) {
    EXPECT_EQ(format_documents({}), "No relevant documents found.");
}

TEST(FormatDocuments, ShouldRenderScoreAndSkipBlobFields) {
    ScoredPoint p;
    p.id = "doc-1";
    p.score = 0.87654f;
    p.payload = {{"age", 34}, {"name", "Ada"}, {"vector", {0.1, 0.2}}, {"pdf", "JVBERi0x"}};

    auto text = format_documents({p});
    EXPECT_EQ(text, "Document ID: doc-1 (Score: 0.8765)\n"
                    "  - age: 34\n"
                    "  - name: Ada\n"
                    "\n");
}

TEST(FormatDocuments, FieldFilterAndNonObjectPayload) {
    ScoredPoint a{"a", 1.0f, {{"name", "Ada"}, {"email", "ada@example.com"}}};
    ScoredPoint b{"b", 0.5f, "just a string"};

    auto text = format_documents({a, b}, {"email"});
    EXPECT_EQ(text, "Document ID: a (Score: 1.0000)\n"
                    "  - email: ada@example.com\n"
                    "\n"
                    "Document ID: b (Score: 0.5000)\n"
                    "  - Document content is not a valid JSON object.\n"
                    "\n");
}

TEST(SelectField, ExactMatchIgnoresUnderscoresAndLeadingVerb) {
    std::vector<std::string> fields = {"name", "birth_date", "email"};
    EXPECT_EQ(select_field("Show me the birth_date?", fields), std::optional<std::string>("birth_date"));
    EXPECT_EQ(select_field("list name from profile", fields), std::optional<std::string>("name"));
}

TEST(SelectField, FuzzyMatchNeedsHighSimilarity) {
    std::vector<std::string> fields = {"name", "birth_date", "email"};
    EXPECT_EQ(select_field("what are the emails", fields), std::optional<std::string>("email"));
    EXPECT_FALSE(select_field("what is the weather", fields).has_value());
    EXPECT_FALSE(select_field("show", fields).has_value());
}

TEST(Retriever, BackendFailure_ShouldSurfaceAsRetrievalError) {
    FailingVectorStore store(BackendErrorKind::Timeout);
    Retriever retriever(store, 5);
    try {
        retriever.search("profile", {1.0f});
        FAIL() << "expected RetrievalError";
    } catch (const RetrievalError& e) {
        EXPECT_EQ(e.kind(), BackendErrorKind::Timeout);
    }
    EXPECT_EQ(store.queries.load(), 1);
}

TEST(Retriever, ShouldApplyDefaultAndExplicitLimits) {
    SqliteVectorStore store(":memory:");
    for (int i = 0; i < 5; ++i) {
        store.upsert("profile", "p" + std::to_string(i), {1.0f, float(i)}, {{"n", i}});
    }
    Retriever retriever(store, 3);
    EXPECT_EQ(retriever.search("profile", {1.0f, 0.0f}).size(), 3u);
    EXPECT_EQ(retriever.search("profile", {1.0f, 0.0f}, 1).size(), 1u);
    EXPECT_EQ(retriever.search("profile", {1.0f, 0.0f}).front().id, "p0");
    EXPECT_TRUE(retriever.search("orders", {1.0f, 0.0f}).empty());
}
