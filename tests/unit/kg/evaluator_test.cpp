#include <gtest/gtest.h>
#include <kgrag/kg/evaluator.h>

using namespace kgrag::kg;

namespace {

KgNode node(const std::string& id, const std::string& name, const std::string& subchapter,
            std::string description = {}) {
    KgNode n;
    n.id = id;
    n.name = name;
    n.subchapter = subchapter;
    n.description = std::move(description);
    return n;
}

KgEdge edge(const std::string& src, const std::string& tgt, RelationType type) {
    KgEdge e;
    e.sourceId = src;
    e.targetId = tgt;
    e.type = type;
    return e;
}

} // namespace

TEST(GraphEvaluatorTest, ComputesStructureAndCoverage) {
    KgGraph g;
    g.nodes = {node("a", "BFS", "BFS", "uses a FIFO queue"), node("b", "Queue", "BFS"),
               node("c", "Graph", "BFS"), node("d", "Tree", "DFS")};
    g.edges = {edge("a", "b", RelationType::Uses), edge("a", "c", RelationType::Uses)};

    SectionContext ctx;
    ctx.sectionId = "abc";
    GraphEvaluator evaluator;
    auto report = evaluator.evaluate(g, ctx, {"bfs"}, {"queue", "heap", " Queue "});

    EXPECT_EQ(report.nodeCount, 4u);
    EXPECT_EQ(report.edgeCount, 2u);
    EXPECT_EQ(report.components, 2u);
    EXPECT_EQ(report.maxComponentSize, 3u);
    EXPECT_DOUBLE_EQ(report.connectivity, 0.75);
    EXPECT_DOUBLE_EQ(report.relationRichness, 0.5);
    EXPECT_EQ(report.relationshipTypes.at("USES"), 2u);
    EXPECT_DOUBLE_EQ(report.subchapterCoverage, 1.0);
    // "Queue" and "queue" are distinct keywords; both match case-insensitively
    EXPECT_EQ(report.coveredKeywords.size(), 2u);
    EXPECT_NEAR(report.keywordCoverage, 2.0 / 3.0, 1e-9);
    EXPECT_NEAR(report.coverageScore, 0.4 + 0.3 * (2.0 / 3.0) + 0.2 * 0.75 + 0.1 * 0.5, 1e-9);
    EXPECT_NE(report.summary.find("abc"), std::string::npos);
}

TEST(GraphEvaluatorTest, EmptyGraphScoresOnlyVacuousCoverage) {
    GraphEvaluator evaluator;
    auto report = evaluator.evaluate({}, SectionContext{}, {}, {});
    EXPECT_EQ(report.components, 0u);
    EXPECT_DOUBLE_EQ(report.connectivity, 0.0);
    EXPECT_DOUBLE_EQ(report.coverageScore, 0.7);
}

TEST(GraphEvaluatorTest, MissingSubchapterLowersCoverage) {
    KgGraph g;
    g.nodes = {node("a", "BFS", "BFS")};
    GraphEvaluator evaluator;
    auto report = evaluator.evaluate(g, SectionContext{}, {"BFS", "DFS"}, {});
    EXPECT_DOUBLE_EQ(report.subchapterCoverage, 0.5);
    EXPECT_DOUBLE_EQ(report.relationRichness, 0.0);
    EXPECT_DOUBLE_EQ(report.connectivity, 1.0);
}
