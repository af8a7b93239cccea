#pragma once

#include <kgrag/search/evidence.h>
#include <kgrag/search/reranker.h>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::search {

/**
 * Configuration for evidence fusion
 */
struct EvidenceMergerConfig {
    // Channel weights (normalized to sum to 1.0)
    double alpha = 0.7; // vector channel
    double beta = 0.3;  // graph channel

    size_t maxResults = 10;

    double multiSourceBonus = 0.1;
    double maxLengthBonus = 0.1;  // min(chars / 1000, maxLengthBonus)
    double secondaryWeight = 0.5; // (primary + secondary * w) / (1 + w) on collision

    bool isValid() const { return alpha >= 0 && beta >= 0 && maxResults > 0; }

    // Normalize weights to sum to 1.0; both zero resets to 0.7 / 0.3
    void normalizeWeights() {
        if (alpha < 0)
            alpha = 0;
        if (beta < 0)
            beta = 0;
        const double sum = alpha + beta;
        if (sum <= 0) {
            alpha = 0.7;
            beta = 0.3;
            return;
        }
        alpha /= sum;
        beta /= sum;
    }
};

struct MergeStatistics {
    size_t totalEvidence = 0;
    std::map<std::string, size_t> typeDistribution;
    std::map<std::string, size_t> sourceDistribution;
    double minScore = 0.0;
    double maxScore = 0.0;
    double avgScore = 0.0;
    size_t hybridCount = 0;
    double alpha = 0.0;
    double beta = 0.0;
};

/**
 * @brief Fuses vector and graph hits into one ranked evidence list
 *
 * Graph hits are re-scored by kind, each channel is min-max normalized and weighted,
 * content-equivalent items collapse into hybrid evidence, and multi-source and length
 * bonuses are applied before the final sort.
 */
class EvidenceMerger {
public:
    explicit EvidenceMerger(EvidenceMergerConfig config = {},
                            std::shared_ptr<IReranker> reranker = nullptr);

    std::vector<Evidence> merge(const std::vector<VectorHit>& vectorHits,
                                const std::vector<GraphHit>& graphHits) const;
    std::vector<Evidence> merge(const std::vector<VectorHit>& vectorHits,
                                const std::vector<GraphHit>& graphHits, size_t maxResults) const;

    /**
     * Reorder the first topN items by reranker score. Without a ready reranker, or when it
     * fails or returns the wrong number of scores, the input order is returned unchanged.
     */
    std::vector<Evidence> rerank(const std::string& query, std::vector<Evidence> evidence,
                                 size_t topN) const;

    MergeStatistics mergeStatistics(const std::vector<Evidence>& evidence) const;

    /// Kind-specific graph score: entity as-is, path / (length + 1), subgraph size and
    /// confidence weighted
    static double rescoreGraphHit(const GraphHit& hit);

    /// md5 of the punctuation- and whitespace-free lower-cased content, 16 hex chars
    static std::string dedupKey(std::string_view content);

    double alpha() const { return config_.alpha; }
    double beta() const { return config_.beta; }
    bool hasReranker() const { return reranker_ && reranker_->isReady(); }

private:
    EvidenceMergerConfig config_;
    std::shared_ptr<IReranker> reranker_;
};

} // namespace kgrag::search
