#include <gtest/gtest.h>
#include "topic_resolver.hpp"
#include "test_support.hpp"

class TopicResolverTest : public ::testing::Test {
protected:
    PromptConfig prompts = parse_prompt_config(sample_prompts_json());
    IndexSchema schema = parse_index_schema(sample_schema_json());
    ScriptedModel model;
    TopicResolver resolver{model};
};

TEST_F(TopicResolverTest, BuildPrompt_ShouldUseStageTemplate) {
    auto primary = resolver.build_prompt(ResolveStage::Primary, "How old is Ada?", prompts, schema);
    EXPECT_EQ(primary.rfind("PRIMARY schema=[", 0), 0u);
    EXPECT_NE(primary.find("\"birth_date\""), std::string::npos);
    EXPECT_NE(primary.find("q=How old is Ada?"), std::string::npos);

    auto fallback = resolver.build_prompt(ResolveStage::Fallback, "How old is Ada?", prompts, schema);
    EXPECT_EQ(fallback, "FALLBACK schema=- profile: fields=name, birth_date, email\n"
                        "- orders: fields=order_id, total, status\n q=How old is Ada?");
}

TEST_F(TopicResolverTest, Resolve_PrimaryAnswers_ShouldSkipFallback) {
    model.on_prompt("PRIMARY", "orders");
    auto topic = resolver.resolve("what did I buy", prompts, schema);
    ASSERT_TRUE(topic.has_value());
    EXPECT_EQ(*topic, "orders");
    EXPECT_EQ(model.completions.load(), 1);
}

TEST_F(TopicResolverTest, Resolve_PrimaryNone_ShouldUseFallbackAnswer) {
    // Given: the primary stage cannot map an implied attribute ("old")
    model.on_prompt("PRIMARY", "None");
    model.on_prompt("FALLBACK", "profile");

    // When
    auto topic = resolver.resolve("How old is the user?", prompts, schema);

    // Then
    ASSERT_TRUE(topic.has_value());
    EXPECT_EQ(*topic, "profile");
    EXPECT_EQ(model.completions.load(), 2);
}

TEST_F(TopicResolverTest, Resolve_BothStagesFail_ShouldBeUnresolved) {
    model.fail_prompts_containing("PRIMARY");
    model.on_prompt("FALLBACK", "weather");
    EXPECT_FALSE(resolver.resolve("is it raining", prompts, schema).has_value());
    EXPECT_EQ(model.completions.load(), 2);
}

TEST_F(TopicResolverTest, MatchIndex_ShouldStripQuotesAndExplanations) {
    EXPECT_EQ(match_index("  \"Profile\"  ", schema), std::optional<std::string>("profile"));
    EXPECT_EQ(match_index("`orders`\nBecause the question mentions purchases.", schema),
              std::optional<std::string>("orders"));
    EXPECT_FALSE(match_index("None", schema).has_value());
    EXPECT_FALSE(match_index("'none'", schema).has_value());
    EXPECT_FALSE(match_index("", schema).has_value());
    EXPECT_FALSE(match_index("invoices", schema).has_value());
}
