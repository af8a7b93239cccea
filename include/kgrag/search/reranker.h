#pragma once

#include <kgrag/core/types.h>

#include <string>
#include <vector>

namespace kgrag::search {

/**
 * @brief Second-stage scorer for query/document pairs
 */
class IReranker {
public:
    virtual ~IReranker() = default;

    /**
     * @brief Score documents against a query
     *
     * @return One relevance score in [0,1] per document, in input order, or error
     */
    virtual Result<std::vector<float>>
    scoreDocuments(const std::string& query, const std::vector<std::string>& documents) = 0;

    virtual bool isReady() const = 0;
};

/**
 * Local reranker: the share of distinct query terms (ASCII words, CJK characters and
 * bigrams) that occur in the document.
 */
class LexicalReranker final : public IReranker {
public:
    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents) override;

    bool isReady() const override { return true; }
};

} // namespace kgrag::search
