#include <kgrag/crypto/hasher.h>
#include <kgrag/kg/identity.h>
#include <kgrag/search/evidence_merger.h>

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <unordered_map>

namespace kgrag::search {

const char* evidenceTypeName(EvidenceType type) {
    switch (type) {
        case EvidenceType::Vector:
            return "vector";
        case EvidenceType::Graph:
            return "graph";
        case EvidenceType::Hybrid:
            return "hybrid";
    }
    return "vector";
}

namespace {

constexpr const char* kVectorSource = "vector";
constexpr const char* kGraphSource = "graph";

// Min-max normalization; a zero range leaves the scores unchanged
std::vector<double> minMax(std::vector<double> scores) {
    if (scores.empty())
        return scores;
    const auto [lo, hi] = std::minmax_element(scores.begin(), scores.end());
    const double min = *lo;
    const double range = *hi - min;
    if (range <= 0.0)
        return scores;
    for (auto& s : scores)
        s = (s - min) / range;
    return scores;
}

std::string formatScore(double score) {
    return fmt::format("{:.6f}", score);
}

Evidence combine(Evidence a, Evidence b, double secondaryWeight) {
    Evidence& primary = a.score >= b.score ? a : b;
    Evidence& secondary = a.score >= b.score ? b : a;

    std::set<std::string> sources(primary.sources.begin(), primary.sources.end());
    sources.insert(secondary.sources.begin(), secondary.sources.end());

    Evidence merged;
    merged.id = primary.id;
    merged.content = primary.content;
    merged.sources.assign(sources.begin(), sources.end());
    merged.type = merged.sources.size() > 1 ? EvidenceType::Hybrid : primary.type;
    merged.score = (primary.score + secondary.score * secondaryWeight) / (1.0 + secondaryWeight);
    merged.metadata = primary.metadata;
    for (const auto& [key, value] : secondary.metadata) {
        if (!primary.metadata.count(key))
            merged.metadata.emplace("secondary_" + key, value);
    }
    return merged;
}

} // namespace

EvidenceMerger::EvidenceMerger(EvidenceMergerConfig config, std::shared_ptr<IReranker> reranker)
    : config_(config), reranker_(std::move(reranker)) {
    config_.normalizeWeights();
}

double EvidenceMerger::rescoreGraphHit(const GraphHit& hit) {
    switch (hit.kind) {
        case GraphHitKind::Entity:
            return hit.score;
        case GraphHitKind::Path:
            return hit.score / static_cast<double>(hit.pathLength + 1);
        case GraphHitKind::Subgraph: {
            const double nodeBonus = std::min(0.1 * static_cast<double>(hit.nodes.size()), 0.3);
            return hit.score * (1.0 + nodeBonus) * hit.meanEdgeConfidence(0.8);
        }
    }
    return hit.score;
}

std::string EvidenceMerger::dedupKey(std::string_view content) {
    return crypto::md5Hex(kg::foldAlnum(content)).substr(0, 16);
}

std::vector<Evidence> EvidenceMerger::merge(const std::vector<VectorHit>& vectorHits,
                                            const std::vector<GraphHit>& graphHits) const {
    return merge(vectorHits, graphHits, config_.maxResults);
}

std::vector<Evidence> EvidenceMerger::merge(const std::vector<VectorHit>& vectorHits,
                                            const std::vector<GraphHit>& graphHits,
                                            size_t maxResults) const {
    std::vector<double> vectorScores;
    vectorScores.reserve(vectorHits.size());
    for (const auto& h : vectorHits)
        vectorScores.push_back(h.score);
    vectorScores = minMax(std::move(vectorScores));

    std::vector<double> graphScores;
    graphScores.reserve(graphHits.size());
    for (const auto& h : graphHits)
        graphScores.push_back(rescoreGraphHit(h));
    graphScores = minMax(std::move(graphScores));

    std::vector<Evidence> candidates;
    candidates.reserve(vectorHits.size() + graphHits.size());

    for (size_t i = 0; i < vectorHits.size(); ++i) {
        const auto& hit = vectorHits[i];
        Evidence e;
        e.id = "vector_" + crypto::md5Hex(hit.chunkId).substr(0, 8);
        e.type = EvidenceType::Vector;
        e.content = hit.text;
        e.score = vectorScores[i] * config_.alpha;
        e.sources = {kVectorSource};
        e.metadata["chunk_id"] = hit.chunkId;
        e.metadata["doc_id"] = hit.docId;
        e.metadata["vector_score"] = formatScore(hit.score);
        for (const auto& [key, value] : hit.metadata)
            e.metadata.emplace(key, value);
        candidates.push_back(std::move(e));
    }

    for (size_t i = 0; i < graphHits.size(); ++i) {
        const auto& hit = graphHits[i];
        Evidence e;
        e.id = "graph_" + crypto::md5Hex(hit.content).substr(0, 8);
        e.type = EvidenceType::Graph;
        e.content = hit.content;
        e.score = graphScores[i] * config_.beta;
        e.sources = {kGraphSource};
        e.metadata["graph_kind"] = graphHitKindName(hit.kind);
        e.metadata["graph_score"] = formatScore(hit.score);
        if (hit.kind != GraphHitKind::Entity)
            e.metadata["path_length"] = std::to_string(hit.pathLength);
        std::vector<std::string> nodeIds;
        nodeIds.reserve(hit.nodes.size());
        for (const auto& n : hit.nodes)
            nodeIds.push_back(n.id);
        e.metadata["node_ids"] = fmt::format("{}", fmt::join(nodeIds, ","));
        candidates.push_back(std::move(e));
    }

    // Dedup by folded content, keeping first-seen order
    std::vector<Evidence> merged;
    std::unordered_map<std::string, size_t> byKey;
    for (auto& e : candidates) {
        const auto key = dedupKey(e.content);
        auto it = byKey.find(key);
        if (it == byKey.end()) {
            byKey.emplace(key, merged.size());
            merged.push_back(std::move(e));
        } else {
            merged[it->second] =
                combine(std::move(merged[it->second]), std::move(e), config_.secondaryWeight);
        }
    }

    for (auto& e : merged) {
        const double sourceBonus = e.sources.size() > 1 ? config_.multiSourceBonus : 0.0;
        const double lengthBonus = std::min(
            static_cast<double>(kg::utf8Length(e.content)) / 1000.0, config_.maxLengthBonus);
        e.score += sourceBonus + lengthBonus;
    }

    std::sort(merged.begin(), merged.end(), [](const Evidence& a, const Evidence& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.id < b.id;
    });
    if (merged.size() > maxResults)
        merged.resize(maxResults);

    spdlog::debug("[EvidenceMerger] merged {}+{} hits into {} evidence items", vectorHits.size(),
                  graphHits.size(), merged.size());
    return merged;
}

std::vector<Evidence> EvidenceMerger::rerank(const std::string& query,
                                             std::vector<Evidence> evidence, size_t topN) const {
    if (!hasReranker() || evidence.empty() || topN == 0)
        return evidence;
    const size_t n = std::min(topN, evidence.size());

    std::vector<std::string> documents;
    documents.reserve(n);
    for (size_t i = 0; i < n; ++i)
        documents.push_back(evidence[i].content);

    auto scores = reranker_->scoreDocuments(query, documents);
    if (!scores) {
        spdlog::warn("[EvidenceMerger] reranker failed, keeping merge order: {}",
                     scores.error().message);
        return evidence;
    }
    if (scores.value().size() != n) {
        spdlog::warn("[EvidenceMerger] reranker returned {} scores for {} documents, keeping "
                     "merge order",
                     scores.value().size(), n);
        return evidence;
    }

    std::vector<size_t> order(n);
    for (size_t i = 0; i < n; ++i)
        order[i] = i;
    const auto& s = scores.value();
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return s[a] > s[b]; });

    std::vector<Evidence> out;
    out.reserve(evidence.size());
    for (size_t idx : order) {
        evidence[idx].metadata["rerank_score"] = formatScore(s[idx]);
        out.push_back(std::move(evidence[idx]));
    }
    for (size_t i = n; i < evidence.size(); ++i)
        out.push_back(std::move(evidence[i]));
    return out;
}

MergeStatistics EvidenceMerger::mergeStatistics(const std::vector<Evidence>& evidence) const {
    MergeStatistics stats;
    stats.alpha = config_.alpha;
    stats.beta = config_.beta;
    stats.totalEvidence = evidence.size();
    if (evidence.empty())
        return stats;

    stats.minScore = evidence.front().score;
    stats.maxScore = evidence.front().score;
    double sum = 0.0;
    for (const auto& e : evidence) {
        ++stats.typeDistribution[evidenceTypeName(e.type)];
        for (const auto& src : e.sources)
            ++stats.sourceDistribution[src];
        if (e.type == EvidenceType::Hybrid)
            ++stats.hybridCount;
        stats.minScore = std::min(stats.minScore, e.score);
        stats.maxScore = std::max(stats.maxScore, e.score);
        sum += e.score;
    }
    stats.avgScore = sum / static_cast<double>(evidence.size());
    return stats;
}

} // namespace kgrag::search
