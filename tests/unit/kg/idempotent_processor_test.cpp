#include <gtest/gtest.h>
#include <kgrag/kg/identity.h>
#include <kgrag/kg/idempotent_processor.h>

using namespace kgrag::kg;

namespace {

SectionContext context() {
    return makeSectionContext("Algorithms", "Graphs", "Traversal");
}

DraftGraph sampleDraft() {
    DraftGraph draft;
    draft.nodes.push_back(DraftNode{"BFS", "Concept", "breadth-first search", {"Breadth-first"}, 0.9});
    draft.nodes.push_back(DraftNode{"Queue", "Concept", "FIFO", {}, 1.0});
    DraftEdge e;
    e.source = "BFS";
    e.target = "Queue";
    e.typeLabel = "USES";
    e.confidence = 0.9;
    draft.edges.push_back(e);
    return draft;
}

} // namespace

TEST(IdempotentProcessorTest, AssignsDeterministicIds) {
    const auto ctx = context();
    auto first = IdempotentProcessor{}.process(sampleDraft(), ctx);
    auto second = IdempotentProcessor{}.process(sampleDraft(), ctx);

    ASSERT_EQ(first.graph.nodes.size(), 2u);
    for (std::size_t i = 0; i < first.graph.nodes.size(); ++i)
        EXPECT_EQ(first.graph.nodes[i].id, second.graph.nodes[i].id);
    ASSERT_EQ(first.graph.edges.size(), 1u);
    EXPECT_EQ(first.graph.edges[0].rid, second.graph.edges[0].rid);

    EXPECT_EQ(first.graph.nodes[0].id, nodeId("BFS", "Concept", ctx.scope));
    EXPECT_EQ(first.graph.edges[0].rid,
              relationId("USES", first.graph.nodes[0].id, first.graph.nodes[1].id, ctx.scope));
    EXPECT_EQ(first.graph.edges[0].scope, ctx.scope);
    EXPECT_EQ(first.graph.edges[0].srcSection, ctx.sectionId);
    EXPECT_EQ(first.graph.nodes[0].subchapter, "Traversal");
}

TEST(IdempotentProcessorTest, DuplicateEdgesCollapseFirstWins) {
    auto draft = sampleDraft();
    DraftEdge dup = draft.edges[0];
    dup.confidence = 0.3;
    dup.description = "second";
    draft.edges.push_back(dup);

    auto out = IdempotentProcessor{}.process(draft, context());
    ASSERT_EQ(out.graph.edges.size(), 1u);
    EXPECT_DOUBLE_EQ(out.graph.edges[0].confidence, 0.9);
    EXPECT_EQ(out.stats.duplicateEdges, 1u);
}

TEST(IdempotentProcessorTest, EdgesWithUnknownEndpointsAreDropped) {
    auto draft = sampleDraft();
    DraftEdge e;
    e.source = "BFS";
    e.target = "Stack";
    e.typeLabel = "USES";
    draft.edges.push_back(e);

    auto out = IdempotentProcessor{}.process(draft, context());
    EXPECT_EQ(out.graph.edges.size(), 1u);
    EXPECT_EQ(out.stats.invalidEdges, 1u);
    EXPECT_EQ(out.stats.inputEdges, 2u);
    EXPECT_EQ(out.stats.outputEdges, 1u);
}

TEST(IdempotentProcessorTest, EndpointsResolveThroughAliases) {
    auto draft = sampleDraft();
    DraftEdge e;
    e.source = "breadth-first";
    e.target = "queue";
    e.typeLabel = "DEPENDS_ON";
    draft.edges.push_back(e);

    auto out = IdempotentProcessor{}.process(draft, context());
    ASSERT_EQ(out.graph.edges.size(), 2u);
    EXPECT_EQ(out.graph.edges[1].sourceId, out.graph.nodes[0].id);
    EXPECT_EQ(out.graph.edges[1].type, RelationType::DependsOn);
}

TEST(IdempotentProcessorTest, NodesWithTheSameIdMerge) {
    DraftGraph draft;
    draft.nodes.push_back(DraftNode{"Graph", "Concept", "", {}, 0.5});
    draft.nodes.push_back(DraftNode{"graph", "Concept", "vertices and edges", {"network"}, 0.8});

    auto out = IdempotentProcessor{}.process(draft, context());
    ASSERT_EQ(out.graph.nodes.size(), 1u);
    const auto& node = out.graph.nodes[0];
    EXPECT_EQ(node.name, "Graph");
    EXPECT_EQ(node.description, "vertices and edges");
    EXPECT_DOUBLE_EQ(node.score, 0.8);
    ASSERT_EQ(node.aliases.size(), 1u);
    EXPECT_EQ(node.aliases[0], "network");
}

TEST(IdempotentProcessorTest, UnknownRelationKeepsItsLabel) {
    auto draft = sampleDraft();
    draft.edges[0].typeLabel = "inspired by";
    auto out = IdempotentProcessor{}.process(draft, context());
    ASSERT_EQ(out.graph.edges.size(), 1u);
    EXPECT_EQ(out.graph.edges[0].type, RelationType::Related);
    EXPECT_EQ(out.graph.edges[0].typeLabel, "inspired by");
}
