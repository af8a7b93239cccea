#pragma once

#include <kgrag/kg/types.h>

#include <cstddef>
#include <string>
#include <vector>

namespace kgrag::kg {

/// One section's persisted graph, as loaded from its scope
struct SectionGraph {
    std::string sectionId;
    KgGraph graph;
};

struct BookMergeContext {
    std::string bookId;
    std::string topic;
};

struct MergeStats {
    std::size_t originalNodes = 0;
    std::size_t mergedNodes = 0;
    std::size_t originalEdges = 0;
    std::size_t mergedEdges = 0;
    double nodeDedupRatio = 0.0;
    double edgeDedupRatio = 0.0;
    std::size_t sectionsMerged = 0;
    std::vector<std::string> chaptersCovered;
};

struct BookMergeResult {
    KgGraph graph;
    MergeStats stats;
};

/**
 * @brief Merges section graphs into one book-scoped graph.
 *
 * Pure and deterministic: sections are processed in section id order, so the output only
 * depends on the set of sections given.
 *
 * Nodes group on (case-insensitive canonical name, type) and keep the first-seen id. Edges
 * group on (source, target, type) after id remapping; weights are averaged, confidence is
 * the maximum, and distinct descriptions and evidence are joined with "; ".
 */
class BookMerger {
public:
    BookMergeResult merge(std::vector<SectionGraph> sections, const BookMergeContext& ctx) const;
};

} // namespace kgrag::kg
