#include <gtest/gtest.h>
#include <kgrag/kg/book_merger.h>
#include <kgrag/kg/identity.h>

#include <algorithm>

using namespace kgrag::kg;

namespace {

KgNode node(const std::string& name, const std::string& scope, const std::string& chapter,
            std::string description = {}, std::vector<std::string> aliases = {}) {
    KgNode n;
    n.id = nodeId(name, "Concept", scope);
    n.name = name;
    n.scope = scope;
    n.chapter = chapter;
    n.description = std::move(description);
    n.aliases = std::move(aliases);
    return n;
}

KgEdge edge(const KgNode& a, const KgNode& b, RelationType type, double confidence, double weight,
            std::string evidence) {
    KgEdge e;
    e.type = type;
    e.sourceId = a.id;
    e.targetId = b.id;
    e.scope = a.scope;
    e.confidence = confidence;
    e.weight = weight;
    e.evidence = std::move(evidence);
    e.rid = relationId(relationTypeName(type), a.id, b.id, a.scope);
    return e;
}

SectionGraph section(const std::string& id, const std::string& chapter, const std::string& extra) {
    const auto scope = sectionScope(id);
    auto graph = node("Graph", scope, chapter, "vertices and edges");
    auto bfs = node("BFS", scope, chapter, "", {"breadth first search"});
    auto other = node(extra, scope, chapter);
    SectionGraph s;
    s.sectionId = id;
    s.graph.nodes = {graph, bfs, other};
    s.graph.edges = {edge(bfs, graph, RelationType::Uses, 0.7, 1.0, "BFS walks a graph"),
                     edge(other, graph, RelationType::PartOf, 0.9, 0.5, "")};
    return s;
}

} // namespace

TEST(BookMergerTest, DeduplicatesNodesByNameAndType) {
    BookMerger merger;
    auto result = merger.merge({section("s1", "Ch1", "Queue"), section("s2", "Ch2", "Stack")},
                               {"book:algo", "Algo"});

    EXPECT_EQ(result.stats.originalNodes, 6u);
    EXPECT_EQ(result.stats.mergedNodes, 4u);
    EXPECT_DOUBLE_EQ(result.stats.nodeDedupRatio, 0.333);
    EXPECT_EQ(result.stats.sectionsMerged, 2u);
    EXPECT_EQ(result.stats.chaptersCovered, (std::vector<std::string>{"Ch1", "Ch2"}));

    // First-seen id wins: s1 sorts before s2
    const auto& graphNode = result.graph.nodes.front();
    EXPECT_EQ(graphNode.id, nodeId("Graph", "Concept", sectionScope("s1")));
    EXPECT_EQ(graphNode.scope, "book:algo");
}

TEST(BookMergerTest, CombinesParallelEdges) {
    BookMerger merger;
    auto a = section("s1", "Ch1", "Queue");
    auto b = section("s2", "Ch1", "Stack");
    b.graph.edges[0].confidence = 0.95;
    b.graph.edges[0].weight = 0.0;
    b.graph.edges[0].evidence = "BFS walks a graph; level order";

    auto result = merger.merge({a, b}, {"book:algo", "Algo"});
    EXPECT_EQ(result.stats.originalEdges, 4u);
    EXPECT_EQ(result.stats.mergedEdges, 3u);

    const auto bfsId = nodeId("BFS", "Concept", sectionScope("s1"));
    auto it = std::find_if(result.graph.edges.begin(), result.graph.edges.end(),
                           [&](const KgEdge& e) { return e.sourceId == bfsId; });
    ASSERT_NE(it, result.graph.edges.end());
    EXPECT_DOUBLE_EQ(it->confidence, 0.95);
    EXPECT_DOUBLE_EQ(it->weight, 0.5);
    EXPECT_EQ(it->evidence, "BFS walks a graph; level order");
    EXPECT_EQ(it->srcSection, "s1,s2");
    EXPECT_EQ(it->scope, "book:algo");
    EXPECT_EQ(it->rid, relationId("USES", it->sourceId, it->targetId, "book:algo"));
}

TEST(BookMergerTest, ResultDoesNotDependOnSectionOrder) {
    BookMerger merger;
    BookMergeContext ctx{"book:algo", "Algo"};
    auto forward = merger.merge(
        {section("s1", "Ch1", "Queue"), section("s2", "Ch1", "Stack"), section("s3", "Ch2", "Heap")},
        ctx);
    auto backward = merger.merge(
        {section("s3", "Ch2", "Heap"), section("s1", "Ch1", "Queue"), section("s2", "Ch1", "Stack")},
        ctx);

    ASSERT_EQ(forward.graph.nodes.size(), backward.graph.nodes.size());
    for (std::size_t i = 0; i < forward.graph.nodes.size(); ++i) {
        EXPECT_EQ(forward.graph.nodes[i].id, backward.graph.nodes[i].id);
        EXPECT_EQ(forward.graph.nodes[i].aliases, backward.graph.nodes[i].aliases);
    }
    ASSERT_EQ(forward.graph.edges.size(), backward.graph.edges.size());
    for (std::size_t i = 0; i < forward.graph.edges.size(); ++i) {
        EXPECT_EQ(forward.graph.edges[i].rid, backward.graph.edges[i].rid);
        EXPECT_EQ(forward.graph.edges[i].srcSection, backward.graph.edges[i].srcSection);
    }
    EXPECT_EQ(forward.graph.hierarchy, backward.graph.hierarchy);
}

TEST(BookMergerTest, KeepsLongestDescriptionAndUnionsAliases) {
    BookMerger merger;
    auto a = section("s1", "Ch1", "Queue");
    auto b = section("s2", "Ch1", "Stack");
    b.graph.nodes[0].description = "a set of vertices connected by edges";
    b.graph.nodes[1].aliases = {"BFS traversal"};
    b.graph.nodes[1].name = "bfs";

    auto result = merger.merge({a, b}, {"book:algo", "Algo"});
    EXPECT_EQ(result.graph.nodes[0].description, "a set of vertices connected by edges");
    EXPECT_EQ(result.graph.nodes[1].name, "BFS");
    EXPECT_EQ(result.graph.nodes[1].aliases,
              (std::vector<std::string>{"BFS traversal", "breadth first search"}));
}

TEST(BookMergerTest, DropsEdgesWithUnknownEndpoints) {
    BookMerger merger;
    auto a = section("s1", "Ch1", "Queue");
    a.graph.edges[0].targetId = "missing";
    auto result = merger.merge({a}, {"book:algo", "Algo"});
    EXPECT_EQ(result.graph.edges.size(), 1u);
}

TEST(BookMergerTest, EmptyInput) {
    BookMerger merger;
    auto result = merger.merge({}, {"book:algo", "Algo"});
    EXPECT_TRUE(result.graph.empty());
    EXPECT_DOUBLE_EQ(result.stats.nodeDedupRatio, 0.0);
    EXPECT_TRUE(result.graph.hierarchy.empty());
}
