#pragma once

#include <kgrag/core/types.h>
#include <kgrag/kg/graph_store.h>
#include <kgrag/search/evidence.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kgrag::search {

struct GraphRetrieverConfig {
    size_t expandedEntities = 3;    // Entities expanded into subgraphs by search()
    double subgraphDiscount = 0.8;  // Applied to subgraph hits inside search()
    size_t maxPathsExplored = 20000; // Guard against combinatorial path explosion
};

/**
 * Structural channel over a GraphStore. Every operation accepts an optional scope that
 * restricts traversed edges to that scope and entity candidates to its members.
 */
class GraphRetriever {
public:
    explicit GraphRetriever(std::shared_ptr<kg::GraphStore> store,
                            GraphRetrieverConfig config = {});

    Result<std::vector<GraphHit>> searchEntities(const std::string& query,
                                                 const std::vector<std::string>& types = {},
                                                 std::optional<std::string> scope = {},
                                                 size_t limit = 10);

    /**
     * Simple paths of 1..hop edges starting at the entity, traversing edges in either
     * direction. score = prod(confidence * weight) / length; ordered by score desc, then
     * length asc.
     */
    Result<std::vector<GraphHit>> subgraph(const std::string& entityId, size_t hop,
                                           const std::vector<kg::RelationType>& relTypes = {},
                                           size_t limit = 20,
                                           std::optional<std::string> scope = {});

    /// subgraph() around the best entity match for a name
    Result<std::vector<GraphHit>> subgraphByName(const std::string& entityName, size_t hop,
                                                 const std::vector<kg::RelationType>& relTypes = {},
                                                 size_t limit = 20,
                                                 std::optional<std::string> scope = {});

    /**
     * Breadth-first shortest path between two entities given by id or name.
     * Returns an empty list when none exists within maxHop; score = 1 / (length + 1).
     */
    Result<std::vector<GraphHit>> shortestPath(const std::string& start, const std::string& end,
                                               size_t maxHop = 3,
                                               const std::vector<kg::RelationType>& relTypes = {},
                                               std::optional<std::string> scope = {});

    /// Combined channel: entities, subgraph expansion of the top entities, sort, truncate
    Result<std::vector<GraphHit>> search(const std::string& query, size_t topK, size_t hop = 2,
                                         const std::vector<kg::RelationType>& relTypes = {},
                                         std::optional<std::string> scope = {});

    /// Entities mentioned by the chunks; score = mentioning chunks / chunk count
    Result<std::vector<GraphHit>> entitiesByChunks(const std::vector<std::string>& chunkIds,
                                                   size_t topK = 10);

    static std::string formatEntity(const kg::KgNode& node);
    static std::string formatPath(const std::vector<kg::KgNode>& nodes,
                                  const std::vector<kg::KgEdge>& edges);
    static std::string formatSubgraph(size_t hops, const std::vector<kg::KgNode>& nodes,
                                      const std::vector<kg::KgEdge>& edges);

private:
    Result<std::optional<kg::KgNode>> resolveEntity(const std::string& idOrName,
                                                    const std::optional<std::string>& scope);

    std::shared_ptr<kg::GraphStore> store_;
    GraphRetrieverConfig config_;
};

} // namespace kgrag::search
