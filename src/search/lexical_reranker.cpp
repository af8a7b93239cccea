#include <kgrag/search/reranker.h>
#include <kgrag/vector/embedding_provider.h>

#include <set>

namespace kgrag::search {

Result<std::vector<float>>
LexicalReranker::scoreDocuments(const std::string& query,
                                const std::vector<std::string>& documents) {
    const auto queryFeatures = vector::HashingEmbeddingProvider::features(query);
    const std::set<std::string> terms(queryFeatures.begin(), queryFeatures.end());

    std::vector<float> scores;
    scores.reserve(documents.size());
    for (const auto& doc : documents) {
        if (terms.empty()) {
            scores.push_back(0.0f);
            continue;
        }
        const auto docFeatures = vector::HashingEmbeddingProvider::features(doc);
        const std::set<std::string> docTerms(docFeatures.begin(), docFeatures.end());
        size_t hits = 0;
        for (const auto& t : terms) {
            if (docTerms.count(t))
                ++hits;
        }
        scores.push_back(static_cast<float>(hits) / static_cast<float>(terms.size()));
    }
    return scores;
}

} // namespace kgrag::search
