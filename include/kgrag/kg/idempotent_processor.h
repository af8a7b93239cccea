#pragma once

#include <kgrag/kg/types.h>

#include <cstddef>

namespace kgrag::kg {

struct ProcessingStats {
    std::size_t inputNodes = 0;
    std::size_t outputNodes = 0;
    std::size_t inputEdges = 0;
    std::size_t outputEdges = 0;
    std::size_t duplicateEdges = 0;
    std::size_t invalidEdges = 0;
};

struct ProcessedGraph {
    KgGraph graph;
    ProcessingStats stats;
};

/**
 * @brief Assigns deterministic ids to a normalized draft and deduplicates within the batch.
 *
 * Nodes collapsing onto one id are merged (aliases unioned, first description kept, max
 * score). Edges are keyed on (source, target, type, scope) and the first occurrence wins.
 * Edges naming an endpoint absent from the batch are dropped.
 */
class IdempotentProcessor {
public:
    ProcessedGraph process(const DraftGraph& draft, const SectionContext& ctx) const;
};

} // namespace kgrag::kg
