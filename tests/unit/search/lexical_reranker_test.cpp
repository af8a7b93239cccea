#include <gtest/gtest.h>
#include <kgrag/search/reranker.h>

using namespace kgrag::search;

TEST(LexicalRerankerTest, ScoresShareOfQueryTerms) {
    LexicalReranker reranker;
    ASSERT_TRUE(reranker.isReady());
    auto scores = reranker.scoreDocuments(
        "graph traversal", {"A graph traversal visits nodes", "Graph theory", "Cooking pasta"});
    ASSERT_TRUE(scores);
    ASSERT_EQ(scores.value().size(), 3u);
    EXPECT_FLOAT_EQ(scores.value()[0], 1.0f);
    EXPECT_FLOAT_EQ(scores.value()[1], 0.5f);
    EXPECT_FLOAT_EQ(scores.value()[2], 0.0f);
}

TEST(LexicalRerankerTest, CjkTermsIncludeBigrams) {
    LexicalReranker reranker;
    // Query terms: 图, 图论, 论
    auto scores = reranker.scoreDocuments("图论", {"图论基础", "论文"});
    ASSERT_TRUE(scores);
    EXPECT_FLOAT_EQ(scores.value()[0], 1.0f);
    EXPECT_NEAR(scores.value()[1], 1.0f / 3.0f, 1e-6);
}

TEST(LexicalRerankerTest, EmptyQueryScoresZero) {
    LexicalReranker reranker;
    auto scores = reranker.scoreDocuments("  ", {"anything"});
    ASSERT_TRUE(scores);
    EXPECT_FLOAT_EQ(scores.value()[0], 0.0f);
    auto none = reranker.scoreDocuments("graph", {});
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}
