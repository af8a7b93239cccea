#include <gtest/gtest.h>
#include <kgrag/kg/mention_linker.h>

using namespace kgrag;
using namespace kgrag::kg;

namespace {

KgNode node(const std::string& id, const std::string& name, std::vector<std::string> aliases = {}) {
    KgNode n;
    n.id = id;
    n.name = name;
    n.aliases = std::move(aliases);
    return n;
}

std::vector<std::string> linkedIds(const std::vector<LinkedMention>& mentions) {
    std::vector<std::string> ids;
    for (const auto& m : mentions)
        ids.push_back(m.nodeId);
    return ids;
}

} // namespace

class MentionLinkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(linker_.addNodes({node("bfs", "Breadth-first search", {"BFS"}),
                                      node("queue", "Queue"), node("graph", "Graph"),
                                      node("theory", "Graph Theory"),
                                      node("bfs_zh", "广度优先搜索")},
                                     0.9));
    }

    MentionLinker linker_;
};

TEST_F(MentionLinkerTest, LinksNamesAliasesAndPlurals) {
    auto r = linker_.link("BFS keeps frontier nodes in queues while walking a graph.");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(linkedIds(r.value()), (std::vector<std::string>{"bfs", "queue", "graph"}));
    EXPECT_EQ(r.value()[1].text, "queues");
    EXPECT_EQ(r.value()[1].matchedAlias, "queue");
    EXPECT_DOUBLE_EQ(r.value()[0].confidence, 0.9);
}

TEST_F(MentionLinkerTest, PrefersLongestPhrase) {
    auto r = linker_.link("An introduction to graph theory and breadth-first search");
    ASSERT_TRUE(r);
    EXPECT_EQ(linkedIds(r.value()), (std::vector<std::string>{"theory", "bfs"}));
    EXPECT_EQ(r.value()[0].text, "graph theory");
}

TEST_F(MentionLinkerTest, MatchesCjkAliasesAsSubstrings) {
    const std::string text = "本节介绍广度优先搜索算法";
    auto r = linker_.link(text);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].nodeId, "bfs_zh");
    EXPECT_EQ(text.substr(r.value()[0].start, r.value()[0].end - r.value()[0].start),
              "广度优先搜索");
}

TEST_F(MentionLinkerTest, RespectsMinimumConfidence) {
    MentionLinker strict(MentionLinkerConfig{0.95, 4, true});
    ASSERT_TRUE(strict.addNodes({node("queue", "Queue")}, 0.9));
    auto r = strict.link("a queue");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
}

TEST_F(MentionLinkerTest, RejectsInvalidAliases) {
    EXPECT_FALSE(linker_.addAlias({"", "x", 0.5}));
    EXPECT_FALSE(linker_.addAlias({"alias", "", 0.5}));
    EXPECT_FALSE(linker_.addAlias({"alias", "x", 1.5}));
    EXPECT_FALSE(linker_.addAlias({"!!!", "x", 0.5}));

    const auto before = linker_.size();
    linker_.clear();
    EXPECT_GT(before, 0u);
    EXPECT_EQ(linker_.size(), 0u);
}

TEST_F(MentionLinkerTest, InvalidConfigFailsLinking) {
    MentionLinker broken(MentionLinkerConfig{2.0, 4, true});
    auto r = broken.link("queue");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}
