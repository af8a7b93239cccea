#include <spdlog/spdlog.h>
#include <kgrag/kg/book_merger.h>
#include <kgrag/kg/identity.h>
#include <kgrag/kg/normalizer.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <tuple>
#include <unordered_map>

namespace kgrag::kg {

namespace {

double round3(double v) {
    return std::round(v * 1000.0) / 1000.0;
}

double dedupRatio(std::size_t original, std::size_t merged) {
    if (original == 0)
        return 0.0;
    return round3(static_cast<double>(original - merged) / static_cast<double>(original));
}

std::string trimmed(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

void appendDistinct(std::vector<std::string>& parts, std::string_view text, char separator) {
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto next = text.find(separator, pos);
        if (next == std::string_view::npos)
            next = text.size();
        auto part = trimmed(text.substr(pos, next - pos));
        if (!part.empty() && std::find(parts.begin(), parts.end(), part) == parts.end())
            parts.push_back(std::move(part));
        pos = next + 1;
    }
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty())
            out += sep;
        out += p;
    }
    return out;
}

struct EdgeGroup {
    KgEdge edge;
    double weightSum = 0.0;
    std::size_t members = 0;
    std::vector<std::string> descriptions;
    std::vector<std::string> evidence;
    std::vector<std::string> sections;
};

} // namespace

BookMergeResult BookMerger::merge(std::vector<SectionGraph> sections,
                                  const BookMergeContext& ctx) const {
    std::stable_sort(sections.begin(), sections.end(),
                     [](const auto& a, const auto& b) { return a.sectionId < b.sectionId; });

    BookMergeResult result;
    auto& stats = result.stats;
    const auto scope = bookScope(ctx.bookId);
    stats.sectionsMerged = sections.size();

    // Nodes
    std::map<std::pair<std::string, std::string>, std::size_t> groupIndex;
    std::unordered_map<std::string, std::string> idMap;
    std::set<std::string> chapters;
    auto& nodes = result.graph.nodes;

    for (const auto& section : sections) {
        stats.originalNodes += section.graph.nodes.size();
        stats.originalEdges += section.graph.edges.size();

        for (const auto& node : section.graph.nodes) {
            if (!node.chapter.empty())
                chapters.insert(node.chapter);

            const auto name = canonicalize(node.name);
            auto key = std::make_pair(toLowerAscii(name), node.type);
            auto it = groupIndex.find(key);
            if (it == groupIndex.end()) {
                KgNode merged = node;
                merged.name = name;
                merged.scope = scope;
                merged.aliases = Normalizer::normalizeAliases(node.aliases, name);
                groupIndex.emplace(std::move(key), nodes.size());
                idMap[node.id] = merged.id;
                nodes.push_back(std::move(merged));
                continue;
            }

            auto& merged = nodes[it->second];
            idMap[node.id] = merged.id;
            if (node.description.size() > merged.description.size())
                merged.description = node.description;
            auto aliases = merged.aliases;
            aliases.insert(aliases.end(), node.aliases.begin(), node.aliases.end());
            if (name != merged.name)
                aliases.push_back(name);
            merged.aliases = Normalizer::normalizeAliases(aliases, merged.name);
            merged.score = std::max(merged.score, node.score);
            merged.updatedAt = std::max(merged.updatedAt, node.updatedAt);
            if (merged.createdAt == 0 || (node.createdAt > 0 && node.createdAt < merged.createdAt))
                merged.createdAt = node.createdAt;
        }
    }

    // Edges
    std::map<std::tuple<std::string, std::string, RelationType>, std::size_t> edgeIndex;
    std::vector<EdgeGroup> groups;
    std::size_t dangling = 0;

    for (const auto& section : sections) {
        for (const auto& edge : section.graph.edges) {
            const auto src = idMap.find(edge.sourceId);
            const auto tgt = idMap.find(edge.targetId);
            if (src == idMap.end() || tgt == idMap.end()) {
                ++dangling;
                continue;
            }

            auto key = std::make_tuple(src->second, tgt->second, edge.type);
            auto it = edgeIndex.find(key);
            if (it == edgeIndex.end()) {
                it = edgeIndex.emplace(std::move(key), groups.size()).first;
                EdgeGroup group;
                group.edge = edge;
                group.edge.sourceId = src->second;
                group.edge.targetId = tgt->second;
                groups.push_back(std::move(group));
            }

            auto& group = groups[it->second];
            group.weightSum += edge.weight;
            ++group.members;
            group.edge.confidence = std::max(group.edge.confidence, edge.confidence);
            group.edge.updatedAt = std::max(group.edge.updatedAt, edge.updatedAt);
            if (edge.createdAt > 0 && edge.createdAt < group.edge.createdAt)
                group.edge.createdAt = edge.createdAt;
            if (group.edge.typeLabel.empty())
                group.edge.typeLabel = edge.typeLabel;
            const auto desc = trimmed(edge.description);
            if (!desc.empty() &&
                std::find(group.descriptions.begin(), group.descriptions.end(), desc) ==
                    group.descriptions.end())
                group.descriptions.push_back(desc);
            appendDistinct(group.evidence, edge.evidence, ';');
            appendDistinct(group.sections, edge.srcSection.empty() ? section.sectionId : edge.srcSection,
                           ',');
        }
    }

    auto& edges = result.graph.edges;
    edges.reserve(groups.size());
    for (auto& group : groups) {
        auto& edge = group.edge;
        edge.weight = group.members > 0 ? group.weightSum / static_cast<double>(group.members) : 0.0;
        edge.description = join(group.descriptions, "; ");
        edge.evidence = join(group.evidence, "; ");
        edge.srcSection = join(group.sections, ",");
        edge.scope = scope;
        edge.rid = relationId(relationTypeName(edge.type), edge.sourceId, edge.targetId, scope);
        edges.push_back(std::move(edge));
    }

    stats.mergedNodes = nodes.size();
    stats.mergedEdges = edges.size();
    stats.nodeDedupRatio = dedupRatio(stats.originalNodes, stats.mergedNodes);
    stats.edgeDedupRatio = dedupRatio(stats.originalEdges, stats.mergedEdges);
    stats.chaptersCovered.assign(chapters.begin(), chapters.end());

    if (!chapters.empty()) {
        result.graph.hierarchy = fmt::format("Book: {} (ID: {})\nChapters: {}\nTotal Chapters: {}",
                                             ctx.topic, ctx.bookId, join(stats.chaptersCovered, ", "),
                                             stats.chaptersCovered.size());
    }

    if (dangling > 0) {
        spdlog::warn("[BookMerger] {}: dropped {} edges with unknown endpoints", ctx.bookId, dangling);
    }
    spdlog::info("[BookMerger] {}: {} sections, {} -> {} nodes, {} -> {} edges", ctx.bookId,
                 stats.sectionsMerged, stats.originalNodes, stats.mergedNodes, stats.originalEdges,
                 stats.mergedEdges);
    return result;
}

} // namespace kgrag::kg
