#pragma once

#include <kgrag/core/types.h>

#include <memory>
#include <string>
#include <vector>

namespace kgrag::vector {

/**
 * @brief Interface for text embedding backends
 *
 * Every vector returned by one provider has dimension() elements.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single text
     * @param text Input text to embed
     * @return Vector of float embeddings or error
     */
    virtual Result<std::vector<float>> embed(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts, in input order
     */
    virtual Result<std::vector<std::vector<float>>>
    embedBatch(const std::vector<std::string>& texts) = 0;

    virtual size_t dimension() const = 0;

    virtual std::string name() const = 0;
};

/**
 * Deterministic local provider: token feature hashing (FNV-1a, signed buckets) followed by
 * L2 normalization. ASCII words, CJK characters and CJK bigrams are the features, so texts
 * sharing vocabulary land close under cosine similarity.
 */
class HashingEmbeddingProvider final : public IEmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension = 384);

    Result<std::vector<float>> embed(const std::string& text) override;
    Result<std::vector<std::vector<float>>>
    embedBatch(const std::vector<std::string>& texts) override;

    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "hashing"; }

    static std::vector<std::string> features(const std::string& text);

private:
    size_t dimension_;
};

std::shared_ptr<IEmbeddingProvider> makeHashingEmbeddingProvider(size_t dimension);

} // namespace kgrag::vector
