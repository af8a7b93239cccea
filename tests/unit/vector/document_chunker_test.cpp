#include <gtest/gtest.h>
#include <kgrag/kg/identity.h>
#include <kgrag/vector/document_chunker.h>

using namespace kgrag;
using namespace kgrag::vector;

namespace {

std::string repeatSentence(const std::string& sentence, int times) {
    std::string out;
    for (int i = 0; i < times; ++i)
        out += sentence;
    return out;
}

} // namespace

TEST(DocumentChunkerTest, ShortTextIsOneChunk) {
    DocumentChunker chunker;
    auto r = chunker.chunkDocument("doc", "  A graph has vertices.  ", {{"source", "unit"}});
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().size(), 1u);
    const auto& c = r.value()[0];
    EXPECT_EQ(c.content, "A graph has vertices.");
    EXPECT_EQ(c.chunk_index, 0u);
    EXPECT_EQ(c.chunk_id.rfind("doc_chunk_0000_", 0), 0u);
    EXPECT_EQ(c.chunk_id.size(), std::string("doc_chunk_0000_").size() + 8);
    EXPECT_EQ(c.metadata.at("source"), "unit");
    EXPECT_EQ(c.metadata.at("chunk_index"), "0");
}

TEST(DocumentChunkerTest, WindowsOverlapAndCoverTheDocument) {
    DocumentChunker chunker({100, 20});
    const auto text = repeatSentence("word ", 200); // 1000 characters, no terminators
    auto r = chunker.chunkDocument("doc", text);
    ASSERT_TRUE(r);
    const auto& chunks = r.value();
    ASSERT_GT(chunks.size(), 5u);
    EXPECT_EQ(chunks.front().start_offset, 0u);
    EXPECT_EQ(chunks.back().end_offset, text.size());
    for (size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].chunk_index, i);
        EXPECT_TRUE(chunks[i].hasOverlapWith(chunks[i - 1])) << "chunk " << i;
        EXPECT_LE(chunks[i].end_offset - chunks[i].start_offset, 100u);
    }
}

TEST(DocumentChunkerTest, PrefersSentenceBoundaries) {
    DocumentChunker chunker({100, 10});
    const auto text = repeatSentence("Graphs model pairwise relations. ", 10);
    auto r = chunker.chunkDocument("doc", text);
    ASSERT_TRUE(r);
    ASSERT_GT(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].content.back(), '.');
}

TEST(DocumentChunkerTest, SizesCountCodePoints) {
    DocumentChunker chunker({100, 0});
    std::string text;
    for (int i = 0; i < 300; ++i)
        text += "图";
    auto r = chunker.chunkDocument("zh", text);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 3u);
    EXPECT_EQ(kg::utf8Length(r.value()[0].content), 100u);
    EXPECT_EQ(r.value()[1].start_offset, 100u);
    EXPECT_EQ(r.value()[2].end_offset, 300u);
}

TEST(DocumentChunkerTest, ChunkIdsDependOnContent) {
    auto a = DocumentChunker::makeChunkId("doc", 3, "alpha");
    auto b = DocumentChunker::makeChunkId("doc", 3, "beta");
    EXPECT_NE(a, b);
    EXPECT_EQ(a, DocumentChunker::makeChunkId("doc", 3, "alpha"));
}

TEST(DocumentChunkerTest, EstimatesTokens) {
    EXPECT_EQ(DocumentChunker::estimateTokens("hello world 你好"), 4u);
    EXPECT_EQ(DocumentChunker::estimateTokens(""), 0u);
    EXPECT_EQ(DocumentChunker::estimateTokens("42 17"), 0u);
}

TEST(DocumentChunkerTest, RejectsBadInput) {
    DocumentChunker chunker;
    auto noId = chunker.chunkDocument("", "text");
    ASSERT_FALSE(noId);
    EXPECT_EQ(noId.error().code, ErrorCode::InvalidArgument);

    DocumentChunker broken({10, 10});
    EXPECT_FALSE(broken.chunkDocument("doc", "text"));

    auto empty = chunker.chunkDocument("doc", "   ");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().empty());
}
