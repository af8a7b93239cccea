#include <kgrag/kg/thresholds.h>

#include <algorithm>

namespace kgrag::kg {

std::size_t evidenceCount(std::string_view evidence) {
    // every ';' opens another part, blank parts included
    return static_cast<std::size_t>(std::count(evidence.begin(), evidence.end(), ';')) + 1;
}

std::vector<KgEdge> ThresholdFilter::filterForStorage(const std::vector<KgEdge>& edges) const {
    std::vector<KgEdge> kept;
    kept.reserve(edges.size());
    for (const auto& e : edges) {
        if (e.confidence >= config_.thetaAdd)
            kept.push_back(e);
    }
    return kept;
}

std::vector<KgEdge> ThresholdFilter::filterForDisplay(const std::vector<KgEdge>& edges) const {
    std::vector<KgEdge> kept;
    for (const auto& e : edges) {
        if (e.confidence >= config_.thetaShow && evidenceCount(e.evidence) >= config_.minEvidenceCount)
            kept.push_back(e);
    }
    return kept;
}

} // namespace kgrag::kg
