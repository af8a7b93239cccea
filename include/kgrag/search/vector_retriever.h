#pragma once

#include <kgrag/core/types.h>
#include <kgrag/search/evidence.h>
#include <kgrag/vector/document_chunker.h>
#include <kgrag/vector/embedding_provider.h>
#include <kgrag/vector/vector_store.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kgrag::search {

struct IndexStats {
    size_t chunks = 0;
    size_t indexed = 0;
    size_t failed = 0;
};

/**
 * Semantic channel: embeds chunks into the vector store and answers similarity queries.
 */
class VectorRetriever {
public:
    VectorRetriever(std::shared_ptr<vector::IEmbeddingProvider> embedder,
                    std::shared_ptr<vector::IVectorStore> store, size_t batchSize = 32);

    /// Embed and upsert chunks batch by batch. A failing batch is counted and skipped.
    Result<IndexStats> index(const std::vector<vector::DocumentChunk>& chunks);

    Result<size_t> removeDocument(const std::string& docId);

    /// Hits score-descending; hits below scoreThreshold are dropped
    Result<std::vector<VectorHit>> search(const std::string& query, size_t topK,
                                          const vector::VectorFilter& filter = {},
                                          std::optional<double> scoreThreshold = {});

    Result<std::vector<VectorHit>> searchByVector(const std::vector<float>& queryVector,
                                                  size_t topK,
                                                  const vector::VectorFilter& filter = {},
                                                  std::optional<double> scoreThreshold = {});

    /// Neighbours of a stored chunk
    Result<std::vector<VectorHit>> searchSimilarChunks(const std::string& chunkId, size_t topK,
                                                       bool excludeSelf = true);

    Result<std::vector<VectorHit>> searchByDocument(const std::string& docId,
                                                    const std::string& query, size_t topK);

private:
    std::shared_ptr<vector::IEmbeddingProvider> embedder_;
    std::shared_ptr<vector::IVectorStore> store_;
    size_t batchSize_;
};

} // namespace kgrag::search
