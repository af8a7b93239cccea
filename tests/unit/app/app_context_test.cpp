#include <gtest/gtest.h>
#include <kgrag/app/context.h>

#include "test_helpers.h"

using namespace kgrag;
using namespace kgrag::app;

class AppContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        graphDb_ = tests::tempDbPath("kgrag_ctx_graph_");
        vectorDb_ = tests::tempDbPath("kgrag_ctx_vectors_");
    }

    void TearDown() override {
        tests::removeDb(graphDb_);
        tests::removeDb(vectorDb_);
    }

    config::KgragConfig config() const {
        config::KgragConfig cfg;
        cfg.storage.graph_db_path = graphDb_.string();
        cfg.storage.vector_db_path = vectorDb_.string();
        cfg.orchestrator.max_workers = 2;
        cfg.log_level = "warn";
        return cfg;
    }

    std::filesystem::path graphDb_;
    std::filesystem::path vectorDb_;
};

TEST_F(AppContextTest, WiresStoresAndWorkers) {
    auto ctx = AppContext::create(config(), std::make_shared<tests::ScriptedLlmClient>());
    ASSERT_TRUE(ctx) << ctx.error().message;
    const auto& c = *ctx.value();
    ASSERT_NE(c.graphStore, nullptr);
    ASSERT_NE(c.vectorStore, nullptr);
    ASSERT_NE(c.embedder, nullptr);
    EXPECT_NE(c.workerPool, nullptr);
    EXPECT_NE(c.taskRunner, nullptr);
    EXPECT_EQ(c.embedder->dimension(), 384u);
    EXPECT_EQ(c.reranker, nullptr);
    EXPECT_TRUE(c.graphStore->healthCheck());
    EXPECT_TRUE(std::filesystem::exists(graphDb_));
}

TEST_F(AppContextTest, RerankerOnlyWhenEnabled) {
    auto cfg = config();
    cfg.retrieval.use_reranker = true;
    auto ctx = AppContext::create(cfg, nullptr);
    ASSERT_TRUE(ctx) << ctx.error().message;
    EXPECT_NE(ctx.value()->reranker, nullptr);
}

TEST_F(AppContextTest, InvalidConfigurationIsRejected) {
    auto cfg = config();
    cfg.retrieval.final_top_k = 0;
    auto ctx = AppContext::create(cfg, nullptr);
    ASSERT_FALSE(ctx);
    EXPECT_EQ(ctx.error().code, ErrorCode::ValidationError);

    cfg = config();
    cfg.embedding.metric = "manhattan";
    ctx = AppContext::create(cfg, nullptr);
    ASSERT_FALSE(ctx);
    EXPECT_EQ(ctx.error().code, ErrorCode::ValidationError);
}

TEST_F(AppContextTest, EmbedderDimensionMustMatchConfiguration) {
    AppCollaborators collaborators;
    collaborators.embedder = vector::makeHashingEmbeddingProvider(64);
    auto ctx = AppContext::create(config(), nullptr, collaborators);
    ASSERT_FALSE(ctx);
    EXPECT_EQ(ctx.error().code, ErrorCode::InvalidArgument);
}

TEST_F(AppContextTest, PersistedCollectionDimensionWins) {
    {
        auto ctx = AppContext::create(config(), nullptr);
        ASSERT_TRUE(ctx) << ctx.error().message;
    }

    auto cfg = config();
    cfg.embedding.dimension = 128;
    auto reopened = AppContext::create(cfg, nullptr);
    ASSERT_FALSE(reopened);
    EXPECT_EQ(reopened.error().code, ErrorCode::InvalidArgument);
}

TEST_F(AppContextTest, MissingParentDirectoriesAreCreated) {
    auto dir = graphDb_.parent_path() / ("kgrag_ctx_nested_" + graphDb_.stem().string());
    auto cfg = config();
    cfg.storage.graph_db_path = (dir / "deep" / "graph.db").string();
    cfg.storage.vector_db_path = (dir / "deep" / "vectors.db").string();

    {
        auto ctx = AppContext::create(cfg, nullptr);
        ASSERT_TRUE(ctx) << ctx.error().message;
    }
    EXPECT_TRUE(std::filesystem::exists(dir / "deep" / "graph.db"));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
