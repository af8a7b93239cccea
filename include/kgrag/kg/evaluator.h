#pragma once

#include <kgrag/kg/types.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace kgrag::kg {

struct QualityReport {
    std::size_t nodeCount = 0;
    std::size_t edgeCount = 0;
    std::size_t components = 0;
    std::size_t maxComponentSize = 0;
    double connectivity = 0.0;     ///< largest component / node count
    double relationRichness = 0.0; ///< min(1, edges / nodes)
    std::map<std::string, std::size_t> relationshipTypes;
    double subchapterCoverage = 1.0;
    double keywordCoverage = 1.0;
    std::vector<std::string> coveredKeywords;
    double coverageScore = 0.0;
    std::string summary;
};

/**
 * @brief Structural and coverage metrics of a section graph.
 *
 * coverageScore = 0.4 * subchapter + 0.3 * keyword + 0.2 * connectivity + 0.1 * richness
 */
class GraphEvaluator {
public:
    QualityReport evaluate(const KgGraph& graph, const SectionContext& ctx,
                           const std::vector<std::string>& expectedSubchapters,
                           const std::vector<std::string>& keywords) const;
};

} // namespace kgrag::kg
