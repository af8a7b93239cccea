#include <spdlog/spdlog.h>
#include <kgrag/kg/identity.h>
#include <kgrag/kg/normalizer.h>

#include <algorithm>
#include <set>

namespace kgrag::kg {

std::vector<std::string> Normalizer::normalizeAliases(const std::vector<std::string>& aliases,
                                                      const std::string& canonicalName) {
    const auto nameKey = toLowerAscii(canonicalName);
    std::set<std::string> unique;
    for (const auto& alias : aliases) {
        auto cleaned = canonicalize(alias);
        if (cleaned.empty() || toLowerAscii(cleaned) == nameKey)
            continue;
        unique.insert(std::move(cleaned));
    }
    return {unique.begin(), unique.end()};
}

DraftGraph Normalizer::normalize(DraftGraph draft, const SectionContext& ctx) const {
    DraftGraph out;
    out.hierarchy = std::move(draft.hierarchy);
    out.skippedLines = draft.skippedLines;
    out.nodes.reserve(draft.nodes.size());
    out.edges.reserve(draft.edges.size());

    for (auto& node : draft.nodes) {
        auto name = canonicalize(node.name);
        if (name.empty()) {
            spdlog::warn("[Normalizer] {}: dropping node without a name", ctx.sectionId);
            continue;
        }
        node.aliases = normalizeAliases(node.aliases, name);
        node.name = std::move(name);
        node.type = canonicalize(node.type);
        if (node.type.empty())
            node.type = std::string(kDefaultNodeType);
        node.description = canonicalize(node.description);
        out.nodes.push_back(std::move(node));
    }

    for (auto& edge : draft.edges) {
        edge.source = canonicalize(edge.source);
        edge.target = canonicalize(edge.target);
        if (edge.source.empty() || edge.target.empty()) {
            spdlog::warn("[Normalizer] {}: dropping edge with a missing endpoint ('{}' -> '{}')",
                         ctx.sectionId, edge.source, edge.target);
            continue;
        }
        edge.typeLabel = canonicalize(edge.typeLabel);
        if (edge.typeLabel.empty())
            edge.typeLabel = relationTypeName(RelationType::Related);
        edge.description = canonicalize(edge.description);
        edge.evidence = canonicalize(edge.evidence);
        if (edge.evidence.empty())
            edge.evidence = "Extracted relation: " + edge.source + " -> " + edge.target;
        edge.confidence = std::clamp(edge.confidence, 0.0, 1.0);
        edge.weight = std::max(edge.weight, 0.0);
        out.edges.push_back(std::move(edge));
    }

    const auto dropped = (draft.nodes.size() - out.nodes.size()) +
                         (draft.edges.size() - out.edges.size());
    if (dropped > 0) {
        spdlog::debug("[Normalizer] {}: dropped {} malformed entries", ctx.sectionId, dropped);
    }
    return out;
}

} // namespace kgrag::kg
