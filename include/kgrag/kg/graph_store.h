#pragma once

#include <kgrag/core/types.h>
#include <kgrag/kg/types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::kg {

/**
 * GraphStoreConfig controls connection handling and write behavior of the graph store.
 */
struct GraphStoreConfig {
    bool enableWal = true;
    std::size_t minConnections = 1;
    std::size_t maxConnections = 8;
    std::chrono::milliseconds busyTimeout{5000};

    // Remove nodes left without edges and scope membership after each writeGraph
    bool pruneOrphans = true;

    // Default limit guard for unbounded scans
    std::size_t defaultLimit = 1000;
};

struct GraphStats {
    std::int64_t nodeCount = 0;
    std::int64_t edgeCount = 0;
    std::int64_t mentionCount = 0;
};

/**
 * Outcome of one scope rewrite. Store failures of single entities are counted in
 * `errors` instead of aborting the batch.
 */
struct StoreStats {
    std::size_t attempted = 0;
    std::size_t nodesWritten = 0;
    std::size_t edgesWritten = 0;
    std::size_t nodesCreated = 0;
    std::size_t edgesCreated = 0;
    std::int64_t edgesDeleted = 0;
    std::int64_t orphansPruned = 0;
    std::size_t errors = 0;
    bool success = false;
};

struct EntityMatch {
    KgNode node;
    double score = 0.0;
};

/**
 * Chunk -> node link (Chunk -MENTIONS-> Node).
 */
struct ChunkMention {
    std::string chunkId;
    std::string docId;
    std::string nodeId;
    double confidence = 1.0;
};

/**
 * GraphStore is the persistence boundary of the knowledge graph. Every write is a
 * parameterized per-entity upsert; nodes are shared across scopes through a membership
 * set while every edge belongs to exactly one scope.
 *
 * Implementations must be safe for concurrent use from worker threads.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // -----------------------------------------------------------------------------
    // Writes
    // -----------------------------------------------------------------------------

    // Insert or update by id, preserving created_at; records scope membership.
    // Returns true when the node did not exist before.
    virtual Result<bool> upsertNode(const KgNode& node) = 0;

    // Insert or update by rid, preserving created_at. Returns true when newly created.
    virtual Result<bool> upsertEdge(const KgEdge& edge) = 0;

    // Delete every edge of the scope and the scope's node memberships. Nodes are never
    // deleted here. Returns the number of deleted edges.
    virtual Result<std::int64_t> deleteByScope(std::string_view scope) = 0;

    // Re-index protocol: delete the scope's edges, upsert nodes then edges, optionally
    // prune orphans.
    virtual StoreStats writeGraph(const KgGraph& graph, const std::string& scope) = 0;

    // Remove nodes with no incident edge and no scope membership. Returns the count.
    virtual Result<std::int64_t> pruneOrphans() = 0;

    // -----------------------------------------------------------------------------
    // Reads
    // -----------------------------------------------------------------------------

    virtual Result<std::optional<KgNode>> getNode(std::string_view id) = 0;
    virtual Result<std::vector<KgNode>> getNodes(const std::vector<std::string>& ids) = 0;

    // Case-insensitive exact match on name or alias
    virtual Result<std::vector<KgNode>> findNodesByName(std::string_view name,
                                                        std::optional<std::string> scope = {}) = 0;

    virtual Result<std::vector<KgNode>> listNodes(std::optional<std::string> scope = {},
                                                  std::size_t limit = 0) = 0;

    // Member nodes and edges of one scope, ordered by id
    virtual Result<KgGraph> loadScope(std::string_view scope) = 0;

    // Scored candidate lookup over names, aliases and descriptions
    virtual Result<std::vector<EntityMatch>>
    searchEntities(std::string_view query, const std::vector<std::string>& types = {},
                   std::optional<std::string> scope = {}, std::size_t limit = 20) = 0;

    // Incident edges of a node in either direction
    virtual Result<std::vector<KgEdge>>
    edgesAround(std::string_view nodeId, std::optional<std::string> scope = {},
                const std::vector<RelationType>& relTypes = {}) = 0;

    virtual Result<GraphStats> getStats(std::optional<std::string> scope = {}) = 0;

    // -----------------------------------------------------------------------------
    // Chunk mentions
    // -----------------------------------------------------------------------------

    virtual Result<void> upsertChunkMentions(const std::vector<ChunkMention>& mentions) = 0;
    virtual Result<std::vector<ChunkMention>>
    mentionsForChunks(const std::vector<std::string>& chunkIds) = 0;
    virtual Result<std::int64_t> deleteMentionsForDocument(std::string_view docId) = 0;

    // -----------------------------------------------------------------------------
    // Book membership
    // -----------------------------------------------------------------------------

    virtual Result<void> recordBookSections(std::string_view bookId,
                                            const std::vector<std::string>& sectionIds) = 0;
    virtual Result<std::vector<std::string>> bookSections(std::string_view bookId) = 0;
    virtual Result<void> clearBookSections(std::string_view bookId) = 0;

    // -----------------------------------------------------------------------------
    // Maintenance
    // -----------------------------------------------------------------------------

    virtual Result<void> healthCheck() = 0;
};

// Score a node against a lower-cased query: exact name 1.0, alias 0.9, prefix 0.8, name
// contains 0.7, description contains 0.6, other partial matches 0.5, otherwise 0.
double entityMatchScore(const KgNode& node, std::string_view loweredQuery);

// Create a SQLite-backed store. The schema is migrated before the store is returned;
// open or migration failures are reported as errors.
Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const GraphStoreConfig& cfg = {});

} // namespace kgrag::kg
