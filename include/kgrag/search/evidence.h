#pragma once

#include <kgrag/kg/types.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace kgrag::search {

/**
 * Hit from the vector channel
 */
struct VectorHit {
    std::string chunkId;
    std::string docId;
    std::string text;
    double score = 0.0;
    std::map<std::string, std::string> metadata;
};

enum class GraphHitKind { Entity, Path, Subgraph };

const char* graphHitKindName(GraphHitKind kind);

/**
 * Hit from the graph channel. Entity hits carry a single node; path and subgraph hits carry
 * the node sequence and the edges between consecutive nodes.
 */
struct GraphHit {
    GraphHitKind kind = GraphHitKind::Entity;
    std::string content; // Readable rendering used as evidence text
    double score = 0.0;
    std::size_t pathLength = 0; // Number of edges
    std::vector<kg::KgNode> nodes;
    std::vector<kg::KgEdge> edges;

    /// Mean edge confidence, or `fallback` when the hit has no edges
    double meanEdgeConfidence(double fallback = 0.8) const;
};

enum class EvidenceType { Vector, Graph, Hybrid };

const char* evidenceTypeName(EvidenceType type);

/**
 * Query-time evidence record produced by the merger
 */
struct Evidence {
    std::string id;
    EvidenceType type = EvidenceType::Vector;
    std::string content;
    double score = 0.0;
    std::vector<std::string> sources; // "vector" / "graph", sorted
    std::map<std::string, std::string> metadata;
};

} // namespace kgrag::search
