#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <kgrag/app/kg_service.h>
#include <kgrag/kg/identity.h>

#include "test_helpers.h"

#include <algorithm>
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace kgrag;
using namespace kgrag::app;
using ::testing::HasSubstr;

namespace {

const char* kTraversal = "### Nodes\n"
                         "- BFS: breadth-first search over a graph\n"
                         "- Queue: first-in first-out container\n"
                         "- Graph: vertices joined by edges\n"
                         "### Relations\n"
                         "- BFS -> Queue: USES | 0.9\n"
                         "- BFS -> Graph: RELATED | 0.5\n";

const char* kShortestPaths = "### Nodes\n"
                             "- Dijkstra: single-source shortest paths\n"
                             "- Priority Queue: queue ordered by key\n"
                             "- Graph: weighted vertices and edges\n"
                             "### Relations\n"
                             "- Dijkstra -> Priority Queue: USES | 0.85\n"
                             "- Dijkstra -> Graph: RELATED | 0.7\n";

const char* kSpanningTrees = "### Nodes\n"
                             "- Prim: minimum spanning tree by growing a tree\n"
                             "- Priority Queue: queue ordered by key\n"
                             "- Graph: connected undirected graph\n"
                             "### Relations\n"
                             "- Prim -> Priority Queue: USES | 0.8\n"
                             "- Prim -> Graph: RELATED | 0.75\n";

SectionInput section(const std::string& subchapter) {
    return SectionInput{"Algorithms", "Graphs", subchapter,
                        subchapter + " is covered in this section.", {"graph"}, "English"};
}

// Store decorator whose entity searches can be switched to fail
class FlakyGraphStore : public kg::GraphStore {
public:
    explicit FlakyGraphStore(std::shared_ptr<kg::GraphStore> inner) : inner_(std::move(inner)) {}

    std::atomic<bool> failSearches{false};
    std::atomic<int> searchCalls{0};

    Result<bool> upsertNode(const kg::KgNode& node) override { return inner_->upsertNode(node); }
    Result<bool> upsertEdge(const kg::KgEdge& edge) override { return inner_->upsertEdge(edge); }
    Result<std::int64_t> deleteByScope(std::string_view scope) override {
        return inner_->deleteByScope(scope);
    }
    kg::StoreStats writeGraph(const kg::KgGraph& graph, const std::string& scope) override {
        return inner_->writeGraph(graph, scope);
    }
    Result<std::int64_t> pruneOrphans() override { return inner_->pruneOrphans(); }
    Result<std::optional<kg::KgNode>> getNode(std::string_view id) override {
        return inner_->getNode(id);
    }
    Result<std::vector<kg::KgNode>> getNodes(const std::vector<std::string>& ids) override {
        return inner_->getNodes(ids);
    }
    Result<std::vector<kg::KgNode>> findNodesByName(std::string_view name,
                                                    std::optional<std::string> scope) override {
        return inner_->findNodesByName(name, std::move(scope));
    }
    Result<std::vector<kg::KgNode>> listNodes(std::optional<std::string> scope,
                                              std::size_t limit) override {
        return inner_->listNodes(std::move(scope), limit);
    }
    Result<kg::KgGraph> loadScope(std::string_view scope) override {
        return inner_->loadScope(scope);
    }
    Result<std::vector<kg::EntityMatch>> searchEntities(std::string_view query,
                                                        const std::vector<std::string>& types,
                                                        std::optional<std::string> scope,
                                                        std::size_t limit) override {
        ++searchCalls;
        if (failSearches)
            return Error{ErrorCode::DatabaseError, "graph database unavailable"};
        return inner_->searchEntities(query, types, std::move(scope), limit);
    }
    Result<std::vector<kg::KgEdge>>
    edgesAround(std::string_view nodeId, std::optional<std::string> scope,
                const std::vector<kg::RelationType>& relTypes) override {
        return inner_->edgesAround(nodeId, std::move(scope), relTypes);
    }
    Result<kg::GraphStats> getStats(std::optional<std::string> scope) override {
        return inner_->getStats(std::move(scope));
    }
    Result<void> upsertChunkMentions(const std::vector<kg::ChunkMention>& mentions) override {
        return inner_->upsertChunkMentions(mentions);
    }
    Result<std::vector<kg::ChunkMention>>
    mentionsForChunks(const std::vector<std::string>& chunkIds) override {
        return inner_->mentionsForChunks(chunkIds);
    }
    Result<std::int64_t> deleteMentionsForDocument(std::string_view docId) override {
        return inner_->deleteMentionsForDocument(docId);
    }
    Result<void> recordBookSections(std::string_view bookId,
                                    const std::vector<std::string>& sectionIds) override {
        return inner_->recordBookSections(bookId, sectionIds);
    }
    Result<std::vector<std::string>> bookSections(std::string_view bookId) override {
        return inner_->bookSections(bookId);
    }
    Result<void> clearBookSections(std::string_view bookId) override {
        return inner_->clearBookSections(bookId);
    }
    Result<void> healthCheck() override { return inner_->healthCheck(); }

private:
    std::shared_ptr<kg::GraphStore> inner_;
};

// Order-independent rendering of a stored graph by names
std::set<std::string> describe(const kg::KgGraph& graph) {
    std::map<std::string, std::string> names;
    std::set<std::string> out;
    for (const auto& n : graph.nodes) {
        names[n.id] = n.name;
        out.insert("node " + n.name + "|" + n.type + "|" + n.description);
    }
    for (const auto& e : graph.edges) {
        out.insert("edge " + names[e.sourceId] + "->" + names[e.targetId] + ":" +
                   kg::relationTypeName(e.type) + "@" + std::to_string(e.confidence));
    }
    return out;
}

} // namespace

class KgServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        graphDb_ = tests::tempDbPath("kgrag_service_graph_");
        vectorDb_ = tests::tempDbPath("kgrag_service_vectors_");

        llm_ = std::make_shared<tests::ScriptedLlmClient>();
        llm_->respondTo("Section: Traversal", kTraversal);
        llm_->respondTo("Section: Shortest Paths", kShortestPaths);
        llm_->respondTo("Section: Spanning Trees", kSpanningTrees);
    }

    void TearDown() override {
        service_.reset();
        ctx_.reset();
        tests::removeDb(graphDb_);
        tests::removeDb(vectorDb_);
    }

    config::KgragConfig config() const {
        config::KgragConfig cfg;
        cfg.storage.graph_db_path = graphDb_.string();
        cfg.storage.vector_db_path = vectorDb_.string();
        cfg.orchestrator.max_workers = 4;
        cfg.orchestrator.retry_count = 1;
        cfg.orchestrator.retry_backoff = std::chrono::milliseconds(1);
        cfg.orchestrator.task_timeout = std::chrono::milliseconds(10000);
        cfg.log_level = "warn";
        return cfg;
    }

    void start(config::KgragConfig cfg, AppCollaborators collaborators = {}) {
        auto ctx = AppContext::create(std::move(cfg), llm_, std::move(collaborators));
        ASSERT_TRUE(ctx) << ctx.error().message;
        ctx_ = std::move(ctx).value();
        service_ = std::make_unique<KgService>(ctx_);
    }

    void start() { start(config()); }

    std::string build(const std::string& subchapter) {
        auto r = service_->buildSectionGraph(section(subchapter));
        EXPECT_TRUE(r) << r.error().message;
        return r ? r.value().sectionId : std::string{};
    }

    std::filesystem::path graphDb_;
    std::filesystem::path vectorDb_;
    std::shared_ptr<tests::ScriptedLlmClient> llm_;
    std::shared_ptr<AppContext> ctx_;
    std::unique_ptr<KgService> service_;
};

// ---------------------------------------------------------------------------------------
// Section graphs
// ---------------------------------------------------------------------------------------

TEST_F(KgServiceTest, BuildsAndStoresASectionGraph) {
    start();
    auto r = service_->buildSectionGraph(section("Traversal"));
    ASSERT_TRUE(r) << r.error().message;
    const auto& built = r.value();

    EXPECT_EQ(built.sectionId, kg::sectionId("Algorithms", "Graphs", "Traversal"));
    EXPECT_EQ(built.scope, kg::sectionScope(built.sectionId));
    EXPECT_EQ(built.processingStats.outputNodes, 3u);
    EXPECT_EQ(built.edgesBelowThreshold, 1u);
    EXPECT_TRUE(built.storeStats.success);
    EXPECT_EQ(built.storeStats.nodesCreated, 3u);
    EXPECT_EQ(built.storeStats.edgesWritten, 1u);
    EXPECT_EQ(built.quality.nodeCount, 3u);
    EXPECT_EQ(built.quality.edgeCount, 1u);

    auto graph = service_->sectionGraph(built.sectionId);
    ASSERT_TRUE(graph);
    EXPECT_EQ(graph.value().nodes.size(), 3u);
    ASSERT_EQ(graph.value().edges.size(), 1u);
    EXPECT_EQ(graph.value().edges[0].type, kg::RelationType::Uses);
}

TEST_F(KgServiceTest, RebuildingASectionIsIdempotent) {
    start();
    auto first = service_->buildSectionGraph(section("Traversal"));
    ASSERT_TRUE(first);
    auto statsBefore = service_->getStats(first.value().scope);
    ASSERT_TRUE(statsBefore);
    auto graphBefore = service_->sectionGraph(first.value().sectionId);
    ASSERT_TRUE(graphBefore);

    auto second = service_->buildSectionGraph(section("Traversal"));
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().sectionId, first.value().sectionId);
    EXPECT_EQ(second.value().storeStats.edgesDeleted, 1);
    EXPECT_EQ(second.value().storeStats.nodesCreated, 0u);

    auto statsAfter = service_->getStats(first.value().scope);
    ASSERT_TRUE(statsAfter);
    EXPECT_EQ(statsAfter.value().nodeCount, statsBefore.value().nodeCount);
    EXPECT_EQ(statsAfter.value().edgeCount, statsBefore.value().edgeCount);

    auto graphAfter = service_->sectionGraph(first.value().sectionId);
    ASSERT_TRUE(graphAfter);
    EXPECT_EQ(describe(graphAfter.value()), describe(graphBefore.value()));
    ASSERT_EQ(graphAfter.value().nodes.size(), graphBefore.value().nodes.size());
    for (std::size_t i = 0; i < graphAfter.value().nodes.size(); ++i) {
        EXPECT_EQ(graphAfter.value().nodes[i].id, graphBefore.value().nodes[i].id);
        EXPECT_EQ(graphAfter.value().nodes[i].createdAt, graphBefore.value().nodes[i].createdAt);
    }
}

TEST_F(KgServiceTest, RebuildingOneSectionLeavesOthersAlone) {
    start();
    const auto traversal = build("Traversal");
    const auto paths = build("Shortest Paths");
    auto pathsBefore = service_->sectionGraph(paths);
    ASSERT_TRUE(pathsBefore);

    llm_->respondTo("Section: Traversal", "### Nodes\n- BFS: breadth-first search\n");
    build("Traversal");

    auto traversalAfter = service_->sectionGraph(traversal);
    ASSERT_TRUE(traversalAfter);
    EXPECT_EQ(traversalAfter.value().nodes.size(), 1u);
    EXPECT_TRUE(traversalAfter.value().edges.empty());

    auto pathsAfter = service_->sectionGraph(paths);
    ASSERT_TRUE(pathsAfter);
    EXPECT_EQ(describe(pathsAfter.value()), describe(pathsBefore.value()));
}

TEST_F(KgServiceTest, ConcurrentBuildsOfOneSectionSerializeAndReleaseTheirLock) {
    start();
    const auto reference = build("Traversal");
    auto expected = service_->sectionGraph(reference);
    ASSERT_TRUE(expected);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            auto r = service_->buildSectionGraph(section(t % 2 ? "Traversal" : "Shortest Paths"));
            if (!r)
                ++failures;
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(service_->busyScopes(), 0u);
    auto after = service_->sectionGraph(reference);
    ASSERT_TRUE(after);
    EXPECT_EQ(describe(after.value()), describe(expected.value()));
}

TEST_F(KgServiceTest, DisplayGraphHidesWeaklyEvidencedEdges) {
    start();
    const auto id = build("Traversal");

    auto stored = service_->sectionGraph(id);
    auto shown = service_->sectionGraph(id, true);
    ASSERT_TRUE(stored);
    ASSERT_TRUE(shown);
    EXPECT_EQ(stored.value().edges.size(), 1u);
    EXPECT_TRUE(shown.value().edges.empty());
    EXPECT_EQ(shown.value().nodes.size(), stored.value().nodes.size());
}

TEST_F(KgServiceTest, SectionNeedsSomeTitle) {
    start();
    SectionInput input;
    input.content = "Some text";
    auto r = service_->buildSectionGraph(input);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(llm_->calls(), 0);
}

TEST_F(KgServiceTest, ModelErrorsArePropagated) {
    start();
    llm_->failNext(Error{ErrorCode::NetworkError, "model endpoint unreachable"});
    auto r = service_->buildSectionGraph(section("Traversal"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NetworkError);

    auto stats = service_->getStats(kg::sectionScope(kg::sectionId("Algorithms", "Graphs",
                                                                  "Traversal")));
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().nodeCount, 0);
}

TEST_F(KgServiceTest, BatchIsolatesFailingSections) {
    start();
    // No scripted answer: the model returns nothing for this section
    auto r = service_->buildSectionGraphs(
        {section("Traversal"), section("Unscripted"), section("Shortest Paths")});

    ASSERT_EQ(r.built.size(), 2u);
    EXPECT_EQ(r.built[0].sectionId, kg::sectionId("Algorithms", "Graphs", "Traversal"));
    EXPECT_EQ(r.built[1].sectionId, kg::sectionId("Algorithms", "Graphs", "Shortest Paths"));
    ASSERT_EQ(r.failures.size(), 1u);
    ASSERT_EQ(r.failures.count(1), 1u);
    EXPECT_EQ(r.failures.at(1).code, ErrorCode::InvalidData);
    EXPECT_EQ(r.retries, 0u);
    EXPECT_EQ(r.cancelled, 0u);
}

TEST_F(KgServiceTest, BatchRetriesTransientModelFailures) {
    start();
    llm_->failNext(Error{ErrorCode::Timeout, "model timed out"});
    auto r = service_->buildSectionGraphs({section("Traversal")});
    ASSERT_EQ(r.built.size(), 1u);
    EXPECT_TRUE(r.failures.empty());
    EXPECT_EQ(r.retries, 1u);
    EXPECT_EQ(llm_->calls(), 2);
}

TEST_F(KgServiceTest, CancelledBatchBuildsNothing) {
    start();
    std::stop_source stop;
    stop.request_stop();
    auto r = service_->buildSectionGraphs({section("Traversal"), section("Shortest Paths")},
                                          stop.get_token());
    EXPECT_TRUE(r.built.empty());
    EXPECT_EQ(r.cancelled, 2u);
    EXPECT_EQ(llm_->calls(), 0);
}

// ---------------------------------------------------------------------------------------
// Book graphs
// ---------------------------------------------------------------------------------------

TEST_F(KgServiceTest, BookMergeIsIndependentOfBatching) {
    start();
    auto batch = service_->buildSectionGraphs(
        {section("Traversal"), section("Shortest Paths"), section("Spanning Trees")});
    ASSERT_TRUE(batch.failures.empty());
    ASSERT_EQ(batch.built.size(), 3u);
    const auto a = batch.built[0].sectionId;
    const auto b = batch.built[1].sectionId;
    const auto c = batch.built[2].sectionId;

    auto firstPart = service_->mergeBookGraph({a, b}, BookContext{"Algorithms", "run-one"});
    ASSERT_TRUE(firstPart) << firstPart.error().message;
    auto incremental = service_->mergeBookGraph({c}, BookContext{"Algorithms", "run-one"});
    ASSERT_TRUE(incremental) << incremental.error().message;
    auto atOnce = service_->mergeBookGraph({c, a, b}, BookContext{"Algorithms", "run-two"});
    ASSERT_TRUE(atOnce) << atOnce.error().message;

    EXPECT_NE(incremental.value().scope, atOnce.value().scope);
    EXPECT_EQ(incremental.value().sections, atOnce.value().sections);
    EXPECT_EQ(incremental.value().sections.size(), 3u);

    const auto& stats = incremental.value().mergeStats;
    EXPECT_EQ(stats.sectionsMerged, 3u);
    EXPECT_EQ(stats.originalNodes, 9u);
    EXPECT_EQ(stats.mergedNodes, 6u);
    EXPECT_EQ(stats.mergedEdges, 5u);
    EXPECT_TRUE(incremental.value().storeStats.success);

    auto incrementalGraph = ctx_->graphStore->loadScope(incremental.value().scope);
    auto atOnceGraph = ctx_->graphStore->loadScope(atOnce.value().scope);
    ASSERT_TRUE(incrementalGraph);
    ASSERT_TRUE(atOnceGraph);
    EXPECT_EQ(incrementalGraph.value().nodes.size(), 6u);
    EXPECT_EQ(describe(incrementalGraph.value()), describe(atOnceGraph.value()));
}

TEST_F(KgServiceTest, BookRebuildForgetsEarlierSections) {
    start();
    const auto a = build("Traversal");
    const auto b = build("Shortest Paths");

    ASSERT_TRUE(service_->mergeBookGraph({a, b}, BookContext{"Algorithms", "run"}));
    auto rebuilt = service_->mergeBookGraph({b}, BookContext{"Algorithms", "run", true});
    ASSERT_TRUE(rebuilt);
    EXPECT_EQ(rebuilt.value().sections, std::vector<std::string>{b});
    EXPECT_EQ(rebuilt.value().mergeStats.mergedNodes, 3u);

    auto graph = ctx_->graphStore->loadScope(rebuilt.value().scope);
    ASSERT_TRUE(graph);
    EXPECT_EQ(graph.value().nodes.size(), 3u);
}

TEST_F(KgServiceTest, BookNeedsATopic) {
    start();
    auto r = service_->mergeBookGraph({"abc"}, BookContext{" ", ""});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

// ---------------------------------------------------------------------------------------
// Documents and retrieval
// ---------------------------------------------------------------------------------------

TEST_F(KgServiceTest, IndexingLinksChunksToSectionEntities) {
    start();
    const auto id = build("Traversal");
    const std::string text = "BFS explores a graph level by level and keeps the frontier in a "
                             "queue.";

    auto plain = service_->indexDocument("notes", text);
    ASSERT_TRUE(plain) << plain.error().message;
    EXPECT_EQ(plain.value().chunks, 1u);
    EXPECT_EQ(plain.value().indexed, 1u);
    EXPECT_EQ(plain.value().mentions, 0u);

    auto linked = service_->indexDocument("notes", text, {{"source", "lecture"}},
                                          kg::sectionScope(id));
    ASSERT_TRUE(linked) << linked.error().message;
    EXPECT_EQ(linked.value().mentions, 3u);

    // Re-indexing replaces the document's vectors and mentions
    ASSERT_TRUE(service_->indexDocument("notes", text, {}, kg::sectionScope(id)));
    auto stats = service_->getStats();
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().mentionCount, 3);
    EXPECT_EQ(ctx_->vectorStore->count().value(), 1u);
}

TEST_F(KgServiceTest, RetrievesFromBothChannels) {
    start();
    build("Traversal");
    ASSERT_TRUE(service_->indexDocument(
        "notes", "BFS explores a graph level by level and keeps the frontier in a queue."));

    auto response = service_->retrieve("how does bfs use a queue");
    const auto& md = response.metadata;
    EXPECT_TRUE(md.vector_ok) << md.vector_error;
    EXPECT_TRUE(md.graph_ok) << md.graph_error;
    EXPECT_EQ(md.vector_count, 1u);
    EXPECT_GT(md.graph_count, 0u);
    EXPECT_FALSE(md.reranker_used);
    EXPECT_DOUBLE_EQ(md.alpha, 0.7);
    EXPECT_DOUBLE_EQ(md.beta, 0.3);
    EXPECT_LE(md.final_count, 4u);
    EXPECT_EQ(md.final_count, response.evidence.size());
    ASSERT_FALSE(response.evidence.empty());

    const bool hasVector = std::any_of(response.evidence.begin(), response.evidence.end(),
                                       [](const auto& e) {
                                           return e.type != search::EvidenceType::Graph;
                                       });
    const bool hasGraph = std::any_of(response.evidence.begin(), response.evidence.end(),
                                      [](const auto& e) {
                                          return e.type != search::EvidenceType::Vector;
                                      });
    EXPECT_TRUE(hasVector);
    EXPECT_TRUE(hasGraph);
    for (std::size_t i = 1; i < response.evidence.size(); ++i)
        EXPECT_GE(response.evidence[i - 1].score, response.evidence[i].score);
}

TEST_F(KgServiceTest, RetrievalHonorsTopKAndGraphSwitch) {
    start();
    build("Traversal");
    build("Shortest Paths");
    ASSERT_TRUE(service_->indexDocument(
        "notes", "BFS explores a graph level by level and keeps the frontier in a queue."));

    auto one = service_->retrieve("graph queue", 1);
    EXPECT_EQ(one.evidence.size(), 1u);

    auto vectorOnly = service_->retrieve("graph queue", 4, false);
    EXPECT_EQ(vectorOnly.metadata.graph_count, 0u);
    EXPECT_TRUE(vectorOnly.metadata.graph_ok);
    for (const auto& e : vectorOnly.evidence)
        EXPECT_EQ(e.type, search::EvidenceType::Vector);
}

TEST_F(KgServiceTest, RerankerRunsWhenEnabled) {
    auto cfg = config();
    cfg.retrieval.use_reranker = true;
    start(cfg);
    build("Traversal");
    ASSERT_TRUE(service_->indexDocument(
        "notes", "BFS explores a graph level by level and keeps the frontier in a queue."));

    auto response = service_->retrieve("bfs queue");
    EXPECT_TRUE(response.metadata.reranker_used);
    EXPECT_FALSE(response.evidence.empty());
}

TEST_F(KgServiceTest, FailingGraphChannelStillReturnsVectorEvidence) {
    auto cfg = config();
    auto inner = kg::makeSqliteGraphStore(graphDb_.string());
    ASSERT_TRUE(inner) << inner.error().message;
    auto flaky = std::make_shared<FlakyGraphStore>(
        std::shared_ptr<kg::GraphStore>(std::move(inner).value()));
    AppCollaborators collaborators;
    collaborators.graphStore = flaky;
    start(cfg, collaborators);

    build("Traversal");
    ASSERT_TRUE(service_->indexDocument(
        "notes", "BFS explores a graph level by level and keeps the frontier in a queue."));

    flaky->failSearches = true;
    auto response = service_->retrieve("how does bfs use a queue");
    const auto& md = response.metadata;
    EXPECT_FALSE(md.graph_ok);
    EXPECT_THAT(md.graph_error, HasSubstr("unavailable"));
    EXPECT_TRUE(md.vector_ok);
    EXPECT_EQ(md.graph_count, 0u);
    EXPECT_EQ(md.vector_count, 1u);
    ASSERT_EQ(response.evidence.size(), 1u);
    EXPECT_EQ(response.evidence[0].type, search::EvidenceType::Vector);
    // One retry of the transient store failure
    EXPECT_EQ(flaky->searchCalls.load(), 2);
}

TEST_F(KgServiceTest, BlankQueryReturnsNothing) {
    start();
    auto response = service_->retrieve("  \n");
    EXPECT_TRUE(response.evidence.empty());
    EXPECT_EQ(response.metadata.vector_count, 0u);
    EXPECT_EQ(response.metadata.final_count, 0u);
    EXPECT_TRUE(response.metadata.vector_ok);
    EXPECT_TRUE(response.metadata.graph_ok);
}

TEST_F(KgServiceTest, PruneRemovesNodesNoScopeHolds) {
    start();
    const auto id = build("Traversal");
    ASSERT_TRUE(ctx_->graphStore->deleteByScope(kg::sectionScope(id)));

    auto pruned = service_->pruneOrphans();
    ASSERT_TRUE(pruned);
    EXPECT_EQ(pruned.value(), 3);
    EXPECT_EQ(service_->getStats().value().nodeCount, 0);
}
