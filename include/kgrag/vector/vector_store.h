#pragma once

#include <kgrag/core/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::vector {

enum class DistanceMetric { Cosine, Dot, Euclidean };

const char* metricName(DistanceMetric metric);
std::optional<DistanceMetric> parseMetric(std::string_view name);

/**
 * Similarity score of two equally sized vectors, higher is closer.
 * Cosine: cosine similarity (0 when either vector is zero); Dot: dot product;
 * Euclidean: 1 / (1 + distance).
 */
float similarity(const std::vector<float>& a, const std::vector<float>& b, DistanceMetric metric);

/**
 * Represents a vector record in the store
 */
struct VectorRecord {
    std::string chunk_id;
    std::string doc_id;
    std::string content;
    std::vector<float> embedding;
    std::map<std::string, std::string> metadata;
    float score = 0.0f; // For search results
};

struct VectorFilter {
    std::optional<std::string> docId;
    std::map<std::string, std::string> metadata; // key/value equality, all must match

    bool empty() const { return !docId && metadata.empty(); }
    bool matches(const VectorRecord& record) const;
};

struct VectorStoreConfig {
    size_t dimension = 384;
    DistanceMetric metric = DistanceMetric::Cosine;
    bool enableWal = true;
    size_t maxConnections = 4;
    std::chrono::milliseconds busyTimeout{5000};

    bool isValid() const { return dimension > 0 && maxConnections > 0; }
};

/**
 * @brief A single collection of fixed dimension and metric
 *
 * initialize() creates the collection on first use and verifies the stored dimension and
 * metric afterwards; a mismatch is InvalidArgument. recreate() drops every vector and
 * rewrites the collection parameters from the configuration.
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    virtual Result<void> initialize() = 0;
    virtual Result<void> recreate() = 0;

    /// Insert or replace by chunk_id
    virtual Result<void> upsert(const VectorRecord& record) = 0;
    virtual Result<void> upsertBatch(const std::vector<VectorRecord>& records) = 0;

    virtual Result<size_t> deleteByDocument(const std::string& docId) = 0;

    /// Top-k records by similarity, score-descending (ties by chunk_id)
    virtual Result<std::vector<VectorRecord>> search(const std::vector<float>& query, size_t k,
                                                     const VectorFilter& filter = {}) = 0;

    virtual Result<std::optional<VectorRecord>> get(const std::string& chunkId) = 0;
    virtual Result<size_t> count() = 0;

    virtual size_t dimension() const = 0;
    virtual DistanceMetric metric() const = 0;
};

Result<std::unique_ptr<IVectorStore>> makeSqliteVectorStore(const std::string& dbPath,
                                                            const VectorStoreConfig& cfg = {});

} // namespace kgrag::vector
