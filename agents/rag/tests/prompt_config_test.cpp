#include <gtest/gtest.h>
#include "errors.hpp"
#include "prompt_config.hpp"
#include "util.hpp"
#include "test_support.hpp"

class PromptConfigTest : public ::testing::Test {
protected:
    PromptConfig cfg = parse_prompt_config(sample_prompts_json());
};

TEST_F(PromptConfigTest, Parse_SampleDocument_ShouldLoadAllSections) {
    EXPECT_EQ(cfg.intents.size(), 3u);
    EXPECT_EQ(cfg.intents.at("greeting").action, IntentAction::DirectResponse);
    EXPECT_EQ(cfg.intents.at("greeting").template_name, "greeting");
    EXPECT_EQ(cfg.intents.at("data_question").template_name, "rag_final_answer");
    EXPECT_EQ(cfg.core_prompts.at("clarification"), "Which records do you mean?");
    EXPECT_TRUE(cfg.query_templates.count("fallback_topic_resolver"));
}

TEST(PromptConfigParse, MissingRequiredQueryTemplate_ShouldBeInvalid) {
    const char* doc = R"({"query_templates": {"rag_topic_inference": "x", "rag_final_answer": "y"}})";
    try {
        parse_prompt_config(doc);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.kind(), ConfigErrorKind::Invalid);
        EXPECT_NE(std::string(e.what()).find("fallback_topic_resolver"), std::string::npos);
    }
}

TEST(PromptConfigParse, MalformedJson_ShouldBeInvalid) {
    EXPECT_THROW(parse_prompt_config("{\"intents\": "), ConfigError);
}

TEST(PromptConfigParse, UnknownAction_ShouldBeInvalid) {
    const char* doc = R"({
      "intents": {"x": {"keywords": ["x"], "action": "launch_rockets"}},
      "query_templates": {"rag_topic_inference": "a", "fallback_topic_resolver": "b", "rag_final_answer": "c"}
    })";
    EXPECT_THROW(parse_prompt_config(doc), ConfigError);
}

TEST(PromptConfigParse, DirectIntentWithoutResponseTemplate_ShouldBeInvalid) {
    const char* doc = R"({
      "intents": {"greeting": {"keywords": ["hi"], "action": "direct_response"}},
      "query_templates": {"rag_topic_inference": "a", "fallback_topic_resolver": "b", "rag_final_answer": "c"},
      "response_templates": {}
    })";
    EXPECT_THROW(parse_prompt_config(doc), ConfigError);
}

TEST_F(PromptConfigTest, MatchIntent_SingleWordKeyword_ShouldMatchWholeTokenOnly) {
    auto m = match_intent(cfg, normalize_query("Hi there"));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->name, "greeting");

    // "hi" inside "this" is not a token match
    EXPECT_FALSE(match_intent(cfg, normalize_query("is this thing on")).has_value());
}

TEST_F(PromptConfigTest, MatchIntent_MultiWordKeyword_ShouldMatchContiguousSequence) {
    auto m = match_intent(cfg, normalize_query("  How   OLD is the user?"));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->name, "data_question");
    EXPECT_FALSE(match_intent(cfg, normalize_query("old how is it")).has_value());
}

TEST_F(PromptConfigTest, MatchIntent_LongestKeywordWins) {
    // "good morning" (greeting) is longer than any other match in the text
    auto m = match_intent(cfg, normalize_query("good morning, show my orders"));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->name, "greeting");
}

TEST(RenderTemplate, ShouldSubstituteKnownAndKeepUnknownPlaceholders) {
    auto out = render_template("Q: {user_question} / {unknown} / {topic}",
                               {{"user_question", "why {topic}?"}, {"topic", "orders"}});
    // Substituted text is not scanned again.
    EXPECT_EQ(out, "Q: why {topic}? / {unknown} / orders");
}

TEST(IndexSchemaParse, ShouldAcceptObjectOrArrayAndFindCaseInsensitively) {
    auto schema = parse_index_schema(sample_schema_json());
    ASSERT_EQ(schema.indexes.size(), 2u);
    ASSERT_NE(schema.find(" PROFILE "), nullptr);
    EXPECT_EQ(schema.find("Profile")->fields.size(), 3u);
    EXPECT_EQ(schema.find("missing"), nullptr);
    EXPECT_EQ(schema.summary(), "- profile: fields=name, birth_date, email\n- orders: fields=order_id, total, status\n");

    auto bare = parse_index_schema(R"([{"name": "Orders", "fields": ["total"]}])");
    ASSERT_EQ(bare.indexes.size(), 1u);
    EXPECT_EQ(bare.indexes[0].name, "orders");
}

TEST(IndexSchemaParse, MissingName_ShouldBeInvalid) {
    EXPECT_THROW(parse_index_schema(R"({"indexes": [{"fields": ["a"]}]})"), ConfigError);
}

TEST(NormalizeQuery, ShouldTrimFoldCaseAndCollapseWhitespace) {
    EXPECT_EQ(normalize_query("  What IS\t the   Total?\n"), "what is the total?");
    EXPECT_EQ(normalize_query("   "), "");
}
