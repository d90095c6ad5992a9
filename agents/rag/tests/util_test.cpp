#include <gtest/gtest.h>
#include "util.hpp"
#include <cstdlib>
#include <regex>

TEST(Util, Sha256HexKnownVector) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Util, UuidFromSeedIsStableAndVersioned) {
    auto id = uuid_from_seed("how old is ada?");
    EXPECT_EQ(id, uuid_from_seed("how old is ada?"));
    EXPECT_NE(id, uuid_from_seed("how old is bob?"));
    EXPECT_TRUE(std::regex_match(id, std::regex("[0-9a-f]{8}-[0-9a-f]{4}-5[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}")))
        << id;
}

TEST(Util, RandomIdIsHex) {
    auto a = random_id();
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, random_id());
}

TEST(Util, CosineSimilarity) {
    EXPECT_FLOAT_EQ(cosine_similarity({1, 0}, {2, 0}), 1.0f);
    EXPECT_FLOAT_EQ(cosine_similarity({1, 0}, {0, 3}), 0.0f);
    EXPECT_NEAR(cosine_similarity({1, 0}, {0.6f, 0.8f}), 0.6f, 1e-6);
    // mismatched or empty vectors never match
    EXPECT_EQ(cosine_similarity({1, 0}, {1, 0, 0}), 0.0f);
    EXPECT_EQ(cosine_similarity({}, {}), 0.0f);
    EXPECT_EQ(cosine_similarity({0, 0}, {1, 0}), 0.0f);
}

TEST(Util, JaroWinklerReferenceValues) {
    EXPECT_NEAR(jaro_winkler("martha", "marhta"), 0.9611, 1e-4);
    EXPECT_NEAR(jaro_winkler("dixon", "dicksonx"), 0.8133, 1e-4);
    EXPECT_DOUBLE_EQ(jaro_winkler("email", "email"), 1.0);
    EXPECT_DOUBLE_EQ(jaro_winkler("abc", ""), 0.0);
}

TEST(Util, SplitWordsDropsPunctuation) {
    EXPECT_EQ(split_words("Hello, World! it's 2024"),
              (std::vector<std::string>{"hello", "world", "it's", "2024"}));
    EXPECT_TRUE(split_words(" ?! ").empty());
}

TEST(Util, TrimAndLower) {
    EXPECT_EQ(trim("\t a b \n"), "a b");
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
}

TEST(Util, GetenvOr) {
    ::setenv("RAG_UTIL_TEST_VAR", "value", 1);
    EXPECT_EQ(getenv_or("RAG_UTIL_TEST_VAR", "fallback"), "value");
    ::unsetenv("RAG_UTIL_TEST_VAR");
    EXPECT_EQ(getenv_or("RAG_UTIL_TEST_VAR", "fallback"), "fallback");
}
