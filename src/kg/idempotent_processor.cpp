#include <spdlog/spdlog.h>
#include <kgrag/kg/identity.h>
#include <kgrag/kg/idempotent_processor.h>
#include <kgrag/kg/normalizer.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace kgrag::kg {

ProcessedGraph IdempotentProcessor::process(const DraftGraph& draft,
                                            const SectionContext& ctx) const {
    ProcessedGraph out;
    auto& graph = out.graph;
    auto& stats = out.stats;
    stats.inputNodes = draft.nodes.size();
    stats.inputEdges = draft.edges.size();
    graph.hierarchy = draft.hierarchy;

    const auto now = nowMillis();
    std::unordered_map<std::string, std::size_t> indexById;
    // lower-cased name or alias -> node id, used to resolve edge endpoints
    std::unordered_map<std::string, std::string> idByName;

    for (const auto& draftNode : draft.nodes) {
        const auto name = canonicalize(draftNode.name);
        const auto id = nodeId(name, draftNode.type, ctx.scope);
        if (id.empty()) {
            spdlog::warn("[IdempotentProcessor] {}: node '{}' has no usable id", ctx.sectionId,
                         draftNode.name);
            continue;
        }

        auto it = indexById.find(id);
        if (it != indexById.end()) {
            auto& existing = graph.nodes[it->second];
            auto aliases = existing.aliases;
            aliases.insert(aliases.end(), draftNode.aliases.begin(), draftNode.aliases.end());
            if (name != existing.name)
                aliases.push_back(name);
            existing.aliases = Normalizer::normalizeAliases(aliases, existing.name);
            existing.score = std::max(existing.score, draftNode.score);
            if (existing.description.empty())
                existing.description = draftNode.description;
        } else {
            KgNode node;
            node.id = id;
            node.name = name;
            node.type = draftNode.type.empty() ? std::string(kDefaultNodeType) : draftNode.type;
            node.description = draftNode.description;
            node.aliases = Normalizer::normalizeAliases(draftNode.aliases, name);
            node.scope = ctx.scope;
            node.score = draftNode.score;
            node.chapter = ctx.chapter;
            node.subchapter = ctx.subchapter;
            node.createdAt = now;
            node.updatedAt = now;
            indexById.emplace(id, graph.nodes.size());
            graph.nodes.push_back(std::move(node));
        }

        idByName.try_emplace(toLowerAscii(name), id);
        for (const auto& alias : draftNode.aliases)
            idByName.try_emplace(toLowerAscii(canonicalize(alias)), id);
    }

    std::unordered_set<std::string> seen;
    for (const auto& draftEdge : draft.edges) {
        const auto src = idByName.find(toLowerAscii(canonicalize(draftEdge.source)));
        const auto tgt = idByName.find(toLowerAscii(canonicalize(draftEdge.target)));
        if (src == idByName.end() || tgt == idByName.end()) {
            ++stats.invalidEdges;
            spdlog::warn("[IdempotentProcessor] {}: skipping edge '{}' -> '{}' with unknown endpoint",
                         ctx.sectionId, draftEdge.source, draftEdge.target);
            continue;
        }

        const auto parsed = parseRelationType(draftEdge.typeLabel);
        const auto typeName = relationTypeName(parsed.type);
        const auto rid = relationId(typeName, src->second, tgt->second, ctx.scope);
        if (!seen.insert(rid).second) {
            ++stats.duplicateEdges;
            continue;
        }

        KgEdge edge;
        edge.rid = rid;
        edge.type = parsed.type;
        edge.typeLabel = parsed.typeLabel;
        edge.sourceId = src->second;
        edge.targetId = tgt->second;
        edge.description = draftEdge.description;
        edge.evidence = draftEdge.evidence;
        edge.confidence = draftEdge.confidence;
        edge.weight = draftEdge.weight;
        edge.scope = ctx.scope;
        edge.srcSection = ctx.sectionId;
        edge.createdAt = now;
        edge.updatedAt = now;
        graph.edges.push_back(std::move(edge));
    }

    stats.outputNodes = graph.nodes.size();
    stats.outputEdges = graph.edges.size();
    spdlog::debug("[IdempotentProcessor] {}: {} -> {} nodes, {} -> {} edges ({} dup, {} invalid)",
                  ctx.sectionId, stats.inputNodes, stats.outputNodes, stats.inputEdges,
                  stats.outputEdges, stats.duplicateEdges, stats.invalidEdges);
    return out;
}

} // namespace kgrag::kg
