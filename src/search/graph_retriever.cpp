#include <kgrag/search/graph_retriever.h>

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <unordered_map>

namespace kgrag::search {

using kg::KgEdge;
using kg::KgNode;

const char* graphHitKindName(GraphHitKind kind) {
    switch (kind) {
        case GraphHitKind::Entity:
            return "entity";
        case GraphHitKind::Path:
            return "path";
        case GraphHitKind::Subgraph:
            return "subgraph";
    }
    return "entity";
}

double GraphHit::meanEdgeConfidence(double fallback) const {
    if (edges.empty())
        return fallback;
    double sum = 0.0;
    for (const auto& e : edges)
        sum += e.confidence;
    return sum / static_cast<double>(edges.size());
}

namespace {

const std::string& otherEnd(const KgEdge& edge, const std::string& from) {
    return edge.sourceId == from ? edge.targetId : edge.sourceId;
}

std::string nameOf(const std::vector<KgNode>& nodes, const std::string& id) {
    for (const auto& n : nodes) {
        if (n.id == id)
            return n.name;
    }
    return id;
}

// Cached adjacency over the store, edges ordered by rid
class Adjacency {
public:
    Adjacency(kg::GraphStore& store, const std::optional<std::string>& scope,
              const std::vector<kg::RelationType>& relTypes)
        : store_(store), scope_(scope), relTypes_(relTypes) {}

    Result<const std::vector<KgEdge>*> around(const std::string& nodeId) {
        auto it = cache_.find(nodeId);
        if (it == cache_.end()) {
            auto edges = store_.edgesAround(nodeId, scope_, relTypes_);
            if (!edges)
                return edges.error();
            auto sorted = std::move(edges).value();
            std::sort(sorted.begin(), sorted.end(),
                      [](const KgEdge& a, const KgEdge& b) { return a.rid < b.rid; });
            it = cache_.emplace(nodeId, std::move(sorted)).first;
        }
        return &it->second;
    }

private:
    kg::GraphStore& store_;
    const std::optional<std::string>& scope_;
    const std::vector<kg::RelationType>& relTypes_;
    std::unordered_map<std::string, std::vector<KgEdge>> cache_;
};

struct RawPath {
    std::vector<std::string> nodeIds;
    std::vector<KgEdge> edges;
    double score = 0.0;
};

class PathCollector {
public:
    PathCollector(Adjacency& adjacency, size_t maxHop, size_t maxPaths)
        : adjacency_(adjacency), maxHop_(maxHop), maxPaths_(maxPaths) {}

    Result<void> collect(const std::string& start) {
        nodeIds_.push_back(start);
        onPath_.insert(start);
        return extend(1.0);
    }

    std::vector<RawPath>& paths() { return paths_; }
    bool truncated() const { return truncated_; }

private:
    Result<void> extend(double raw) {
        if (edges_.size() >= maxHop_)
            return {};
        const std::string current = nodeIds_.back();
        auto around = adjacency_.around(current);
        if (!around)
            return around.error();

        for (const auto& edge : *around.value()) {
            if (paths_.size() >= maxPaths_) {
                truncated_ = true;
                return {};
            }
            const auto& next = otherEnd(edge, current);
            if (onPath_.count(next))
                continue;

            const double score = raw * edge.confidence * edge.weight;
            nodeIds_.push_back(next);
            onPath_.insert(next);
            edges_.push_back(edge);

            paths_.push_back(RawPath{nodeIds_, edges_, score / static_cast<double>(edges_.size())});
            auto r = extend(score);

            edges_.pop_back();
            onPath_.erase(next);
            nodeIds_.pop_back();
            if (!r)
                return r;
        }
        return {};
    }

    Adjacency& adjacency_;
    size_t maxHop_;
    size_t maxPaths_;
    std::vector<std::string> nodeIds_;
    std::vector<KgEdge> edges_;
    std::set<std::string> onPath_;
    std::vector<RawPath> paths_;
    bool truncated_ = false;
};

Result<std::map<std::string, KgNode>> loadNodes(kg::GraphStore& store,
                                                const std::set<std::string>& ids) {
    auto nodes = store.getNodes(std::vector<std::string>(ids.begin(), ids.end()));
    if (!nodes)
        return nodes.error();
    std::map<std::string, KgNode> byId;
    for (auto& n : nodes.value())
        byId.emplace(n.id, std::move(n));
    return byId;
}

bool hitOrder(const GraphHit& a, const GraphHit& b) {
    if (a.score != b.score)
        return a.score > b.score;
    if (a.pathLength != b.pathLength)
        return a.pathLength < b.pathLength;
    return a.content < b.content;
}

} // namespace

GraphRetriever::GraphRetriever(std::shared_ptr<kg::GraphStore> store, GraphRetrieverConfig config)
    : store_(std::move(store)), config_(config) {}

std::string GraphRetriever::formatEntity(const KgNode& node) {
    std::string out = fmt::format("{}: {}", node.type, node.name);
    if (!node.description.empty())
        out += " | Description: " + node.description;
    return out;
}

std::string GraphRetriever::formatPath(const std::vector<KgNode>& nodes,
                                       const std::vector<KgEdge>& edges) {
    if (nodes.empty())
        return {};
    std::string out = nodes.front().name;
    for (size_t i = 0; i < edges.size() && i + 1 < nodes.size(); ++i) {
        const auto* type = kg::relationTypeName(edges[i].type);
        if (edges[i].sourceId == nodes[i].id)
            out += fmt::format(" -{}-> {}", type, nodes[i + 1].name);
        else
            out += fmt::format(" <-{}- {}", type, nodes[i + 1].name);
    }
    return out;
}

std::string GraphRetriever::formatSubgraph(size_t hops, const std::vector<KgNode>& nodes,
                                           const std::vector<KgEdge>& edges) {
    std::vector<std::string> names;
    names.reserve(nodes.size());
    for (const auto& n : nodes)
        names.push_back(n.name);
    std::string out = fmt::format("Subgraph({} hops): {}", hops, fmt::join(names, ", "));

    if (!edges.empty()) {
        std::vector<std::string> relations;
        relations.reserve(edges.size());
        for (const auto& e : edges) {
            relations.push_back(fmt::format("{} -{}-> {}", nameOf(nodes, e.sourceId),
                                            kg::relationTypeName(e.type),
                                            nameOf(nodes, e.targetId)));
        }
        out += fmt::format(" | Relations: {}", fmt::join(relations, "; "));
    }
    return out;
}

Result<std::vector<GraphHit>>
GraphRetriever::searchEntities(const std::string& query, const std::vector<std::string>& types,
                               std::optional<std::string> scope, size_t limit) {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Graph retriever has no store"};
    }
    auto matches = store_->searchEntities(query, types, std::move(scope), limit);
    if (!matches)
        return matches.error();

    std::vector<GraphHit> hits;
    hits.reserve(matches.value().size());
    for (auto& m : matches.value()) {
        GraphHit hit;
        hit.kind = GraphHitKind::Entity;
        hit.content = formatEntity(m.node);
        hit.score = m.score;
        hit.nodes.push_back(std::move(m.node));
        hits.push_back(std::move(hit));
    }
    return hits;
}

Result<std::vector<GraphHit>>
GraphRetriever::subgraph(const std::string& entityId, size_t hop,
                         const std::vector<kg::RelationType>& relTypes, size_t limit,
                         std::optional<std::string> scope) {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Graph retriever has no store"};
    }
    std::vector<GraphHit> hits;
    if (hop == 0 || limit == 0)
        return hits;

    Adjacency adjacency(*store_, scope, relTypes);
    PathCollector collector(adjacency, hop, config_.maxPathsExplored);
    auto collected = collector.collect(entityId);
    if (!collected)
        return collected.error();
    if (collector.truncated()) {
        spdlog::warn("[GraphRetriever] path enumeration around {} stopped at {} paths", entityId,
                     config_.maxPathsExplored);
    }

    auto& paths = collector.paths();
    std::stable_sort(paths.begin(), paths.end(), [](const RawPath& a, const RawPath& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.edges.size() < b.edges.size();
    });
    if (paths.size() > limit)
        paths.resize(limit);

    std::set<std::string> ids;
    for (const auto& p : paths)
        ids.insert(p.nodeIds.begin(), p.nodeIds.end());
    auto nodes = loadNodes(*store_, ids);
    if (!nodes)
        return nodes.error();

    for (auto& p : paths) {
        GraphHit hit;
        hit.kind = GraphHitKind::Subgraph;
        hit.score = p.score;
        hit.pathLength = p.edges.size();
        bool complete = true;
        for (const auto& id : p.nodeIds) {
            auto it = nodes.value().find(id);
            if (it == nodes.value().end()) {
                complete = false;
                break;
            }
            hit.nodes.push_back(it->second);
        }
        if (!complete)
            continue;
        hit.edges = std::move(p.edges);
        hit.content = formatSubgraph(hit.pathLength, hit.nodes, hit.edges);
        hits.push_back(std::move(hit));
    }

    std::stable_sort(hits.begin(), hits.end(), hitOrder);
    spdlog::debug("[GraphRetriever] subgraph of {} (hop={}) -> {} paths", entityId, hop,
                  hits.size());
    return hits;
}

Result<std::vector<GraphHit>>
GraphRetriever::subgraphByName(const std::string& entityName, size_t hop,
                               const std::vector<kg::RelationType>& relTypes, size_t limit,
                               std::optional<std::string> scope) {
    auto entities = searchEntities(entityName, {}, scope, 1);
    if (!entities)
        return entities.error();
    if (entities.value().empty()) {
        spdlog::debug("[GraphRetriever] no entity matches '{}'", entityName);
        return std::vector<GraphHit>{};
    }
    return subgraph(entities.value().front().nodes.front().id, hop, relTypes, limit,
                    std::move(scope));
}

Result<std::optional<KgNode>>
GraphRetriever::resolveEntity(const std::string& idOrName,
                              const std::optional<std::string>& scope) {
    auto byId = store_->getNode(idOrName);
    if (!byId)
        return byId.error();
    if (byId.value())
        return byId;

    auto byName = store_->findNodesByName(idOrName, scope);
    if (!byName)
        return byName.error();
    if (byName.value().empty())
        return std::optional<KgNode>{};
    auto candidates = std::move(byName).value();
    std::sort(candidates.begin(), candidates.end(),
              [](const KgNode& a, const KgNode& b) { return a.id < b.id; });
    return std::optional<KgNode>{std::move(candidates.front())};
}

Result<std::vector<GraphHit>>
GraphRetriever::shortestPath(const std::string& start, const std::string& end, size_t maxHop,
                             const std::vector<kg::RelationType>& relTypes,
                             std::optional<std::string> scope) {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Graph retriever has no store"};
    }
    std::vector<GraphHit> hits;

    auto from = resolveEntity(start, scope);
    if (!from)
        return from.error();
    auto to = resolveEntity(end, scope);
    if (!to)
        return to.error();
    if (!from.value() || !to.value()) {
        spdlog::debug("[GraphRetriever] path endpoints not found: '{}' / '{}'", start, end);
        return hits;
    }
    const auto sourceId = from.value()->id;
    const auto targetId = to.value()->id;
    if (sourceId == targetId || maxHop == 0)
        return hits;

    Adjacency adjacency(*store_, scope, relTypes);
    // node id -> (parent id, edge used to reach it)
    std::unordered_map<std::string, std::pair<std::string, KgEdge>> parent;
    std::set<std::string> visited{sourceId};
    std::deque<std::pair<std::string, size_t>> queue{{sourceId, 0}};
    bool found = false;

    while (!queue.empty() && !found) {
        auto [current, depth] = queue.front();
        queue.pop_front();
        if (depth >= maxHop)
            continue;
        auto around = adjacency.around(current);
        if (!around)
            return around.error();
        for (const auto& edge : *around.value()) {
            const auto& next = otherEnd(edge, current);
            if (visited.count(next))
                continue;
            visited.insert(next);
            parent.emplace(next, std::make_pair(current, edge));
            if (next == targetId) {
                found = true;
                break;
            }
            queue.emplace_back(next, depth + 1);
        }
    }
    if (!found)
        return hits;

    std::vector<std::string> ids{targetId};
    std::vector<KgEdge> edges;
    for (auto cur = targetId; cur != sourceId;) {
        const auto& [prev, edge] = parent.at(cur);
        edges.push_back(edge);
        ids.push_back(prev);
        cur = prev;
    }
    std::reverse(ids.begin(), ids.end());
    std::reverse(edges.begin(), edges.end());

    auto nodes = loadNodes(*store_, std::set<std::string>(ids.begin(), ids.end()));
    if (!nodes)
        return nodes.error();

    GraphHit hit;
    hit.kind = GraphHitKind::Path;
    for (const auto& id : ids) {
        auto it = nodes.value().find(id);
        if (it == nodes.value().end()) {
            return Error{ErrorCode::NotFound, "Path node disappeared: " + id};
        }
        hit.nodes.push_back(it->second);
    }
    hit.edges = std::move(edges);
    hit.pathLength = hit.edges.size();
    hit.score = 1.0 / static_cast<double>(hit.pathLength + 1);
    hit.content = formatPath(hit.nodes, hit.edges);
    hits.push_back(std::move(hit));
    return hits;
}

Result<std::vector<GraphHit>>
GraphRetriever::search(const std::string& query, size_t topK, size_t hop,
                       const std::vector<kg::RelationType>& relTypes,
                       std::optional<std::string> scope) {
    if (topK == 0)
        return std::vector<GraphHit>{};
    const size_t half = std::max<size_t>(1, topK / 2);

    auto entities = searchEntities(query, {}, scope, half);
    if (!entities)
        return entities.error();
    auto all = std::move(entities).value();

    if (hop > 0) {
        const size_t expand = std::min(config_.expandedEntities, all.size());
        std::vector<GraphHit> expanded;
        for (size_t i = 0; i < expand; ++i) {
            auto sub = subgraph(all[i].nodes.front().id, hop, relTypes, half, scope);
            if (!sub)
                return sub.error();
            for (auto& h : sub.value()) {
                h.score *= config_.subgraphDiscount;
                expanded.push_back(std::move(h));
            }
        }
        all.insert(all.end(), std::make_move_iterator(expanded.begin()),
                   std::make_move_iterator(expanded.end()));
    }

    std::stable_sort(all.begin(), all.end(), hitOrder);
    if (all.size() > topK)
        all.resize(topK);
    spdlog::debug("[GraphRetriever] search '{}' -> {} hits", query, all.size());
    return all;
}

Result<std::vector<GraphHit>>
GraphRetriever::entitiesByChunks(const std::vector<std::string>& chunkIds, size_t topK) {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Graph retriever has no store"};
    }
    std::vector<GraphHit> hits;
    const std::set<std::string> distinctChunks(chunkIds.begin(), chunkIds.end());
    if (distinctChunks.empty() || topK == 0)
        return hits;

    auto mentions = store_->mentionsForChunks(
        std::vector<std::string>(distinctChunks.begin(), distinctChunks.end()));
    if (!mentions)
        return mentions.error();

    std::map<std::string, std::set<std::string>> chunksByNode;
    for (const auto& m : mentions.value())
        chunksByNode[m.nodeId].insert(m.chunkId);

    std::set<std::string> ids;
    for (const auto& [nodeId, chunks] : chunksByNode)
        ids.insert(nodeId);
    auto nodes = loadNodes(*store_, ids);
    if (!nodes)
        return nodes.error();

    for (const auto& [nodeId, chunks] : chunksByNode) {
        auto it = nodes.value().find(nodeId);
        if (it == nodes.value().end())
            continue;
        GraphHit hit;
        hit.kind = GraphHitKind::Entity;
        hit.score = static_cast<double>(chunks.size()) / static_cast<double>(distinctChunks.size());
        hit.content = formatEntity(it->second);
        hit.nodes.push_back(it->second);
        hits.push_back(std::move(hit));
    }

    std::stable_sort(hits.begin(), hits.end(), [](const GraphHit& a, const GraphHit& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.nodes.front().name < b.nodes.front().name;
    });
    if (hits.size() > topK)
        hits.resize(topK);
    return hits;
}

} // namespace kgrag::search
