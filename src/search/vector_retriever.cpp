#include <kgrag/search/vector_retriever.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kgrag::search {

namespace {

VectorHit toHit(vector::VectorRecord record) {
    VectorHit hit;
    hit.chunkId = std::move(record.chunk_id);
    hit.docId = std::move(record.doc_id);
    hit.text = std::move(record.content);
    hit.score = record.score;
    hit.metadata = std::move(record.metadata);
    return hit;
}

} // namespace

VectorRetriever::VectorRetriever(std::shared_ptr<vector::IEmbeddingProvider> embedder,
                                 std::shared_ptr<vector::IVectorStore> store, size_t batchSize)
    : embedder_(std::move(embedder)), store_(std::move(store)),
      batchSize_(std::max<size_t>(1, batchSize)) {}

Result<IndexStats> VectorRetriever::index(const std::vector<vector::DocumentChunk>& chunks) {
    if (!embedder_ || !store_) {
        return Error{ErrorCode::NotInitialized, "Vector retriever is not configured"};
    }
    if (embedder_->dimension() != store_->dimension()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Embedding dimension {} does not match store dimension {}",
                                 embedder_->dimension(), store_->dimension())};
    }

    IndexStats stats;
    stats.chunks = chunks.size();
    for (size_t offset = 0; offset < chunks.size(); offset += batchSize_) {
        const size_t end = std::min(chunks.size(), offset + batchSize_);
        std::vector<std::string> texts;
        texts.reserve(end - offset);
        for (size_t i = offset; i < end; ++i)
            texts.push_back(chunks[i].content);

        auto embeddings = embedder_->embedBatch(texts);
        if (!embeddings) {
            spdlog::warn("[VectorRetriever] embedding batch {}..{} failed: {}", offset, end,
                         embeddings.error().message);
            stats.failed += end - offset;
            continue;
        }

        std::vector<vector::VectorRecord> records;
        records.reserve(end - offset);
        for (size_t i = offset; i < end; ++i) {
            vector::VectorRecord record;
            record.chunk_id = chunks[i].chunk_id;
            record.doc_id = chunks[i].doc_id;
            record.content = chunks[i].content;
            record.embedding = std::move(embeddings.value()[i - offset]);
            record.metadata = chunks[i].metadata;
            records.push_back(std::move(record));
        }

        auto stored = store_->upsertBatch(records);
        if (!stored) {
            spdlog::warn("[VectorRetriever] storing batch {}..{} failed: {}", offset, end,
                         stored.error().message);
            stats.failed += records.size();
            continue;
        }
        stats.indexed += records.size();
    }

    spdlog::debug("[VectorRetriever] indexed {}/{} chunks ({} failed)", stats.indexed,
                  stats.chunks, stats.failed);
    return stats;
}

Result<size_t> VectorRetriever::removeDocument(const std::string& docId) {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Vector retriever is not configured"};
    }
    return store_->deleteByDocument(docId);
}

Result<std::vector<VectorHit>> VectorRetriever::search(const std::string& query, size_t topK,
                                                       const vector::VectorFilter& filter,
                                                       std::optional<double> scoreThreshold) {
    if (!embedder_ || !store_) {
        return Error{ErrorCode::NotInitialized, "Vector retriever is not configured"};
    }
    auto embedding = embedder_->embed(query);
    if (!embedding)
        return embedding.error();
    return searchByVector(embedding.value(), topK, filter, scoreThreshold);
}

Result<std::vector<VectorHit>>
VectorRetriever::searchByVector(const std::vector<float>& queryVector, size_t topK,
                                const vector::VectorFilter& filter,
                                std::optional<double> scoreThreshold) {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Vector retriever is not configured"};
    }
    auto records = store_->search(queryVector, topK, filter);
    if (!records)
        return records.error();

    std::vector<VectorHit> hits;
    hits.reserve(records.value().size());
    for (auto& record : records.value()) {
        if (scoreThreshold && record.score < *scoreThreshold)
            continue;
        hits.push_back(toHit(std::move(record)));
    }
    return hits;
}

Result<std::vector<VectorHit>> VectorRetriever::searchSimilarChunks(const std::string& chunkId,
                                                                    size_t topK,
                                                                    bool excludeSelf) {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Vector retriever is not configured"};
    }
    auto source = store_->get(chunkId);
    if (!source)
        return source.error();
    if (!source.value()) {
        return Error{ErrorCode::NotFound, "Chunk not found: " + chunkId};
    }

    auto hits = searchByVector(source.value()->embedding, excludeSelf ? topK + 1 : topK);
    if (!hits)
        return hits;
    auto out = std::move(hits).value();
    if (excludeSelf) {
        out.erase(std::remove_if(out.begin(), out.end(),
                                 [&](const VectorHit& h) { return h.chunkId == chunkId; }),
                  out.end());
        if (out.size() > topK)
            out.resize(topK);
    }
    return out;
}

Result<std::vector<VectorHit>> VectorRetriever::searchByDocument(const std::string& docId,
                                                                 const std::string& query,
                                                                 size_t topK) {
    vector::VectorFilter filter;
    filter.docId = docId;
    return search(query, topK, filter);
}

} // namespace kgrag::search
