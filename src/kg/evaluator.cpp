#include <spdlog/spdlog.h>
#include <kgrag/kg/evaluator.h>
#include <kgrag/kg/identity.h>

#include <algorithm>
#include <numeric>
#include <set>
#include <unordered_map>

namespace kgrag::kg {

namespace {

// Union-find over node indices
class Components {
public:
    explicit Components(std::size_t n) : parent_(n), size_(n, 1) {
        std::iota(parent_.begin(), parent_.end(), std::size_t{0});
    }

    std::size_t find(std::size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b)
            return;
        if (size_[a] < size_[b])
            std::swap(a, b);
        parent_[b] = a;
        size_[a] += size_[b];
    }

    std::size_t sizeOf(std::size_t root) const { return size_[root]; }

private:
    std::vector<std::size_t> parent_;
    std::vector<std::size_t> size_;
};

} // namespace

QualityReport GraphEvaluator::evaluate(const KgGraph& graph, const SectionContext& ctx,
                                       const std::vector<std::string>& expectedSubchapters,
                                       const std::vector<std::string>& keywords) const {
    QualityReport report;
    report.nodeCount = graph.nodes.size();
    report.edgeCount = graph.edges.size();

    for (const auto& edge : graph.edges)
        ++report.relationshipTypes[relationTypeName(edge.type)];

    if (report.nodeCount > 0) {
        std::unordered_map<std::string, std::size_t> index;
        for (std::size_t i = 0; i < graph.nodes.size(); ++i)
            index.emplace(graph.nodes[i].id, i);

        Components uf(graph.nodes.size());
        for (const auto& edge : graph.edges) {
            auto s = index.find(edge.sourceId);
            auto t = index.find(edge.targetId);
            if (s != index.end() && t != index.end())
                uf.unite(s->second, t->second);
        }
        std::set<std::size_t> roots;
        for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
            const auto root = uf.find(i);
            roots.insert(root);
            report.maxComponentSize = std::max(report.maxComponentSize, uf.sizeOf(root));
        }
        report.components = roots.size();
        report.connectivity =
            static_cast<double>(report.maxComponentSize) / static_cast<double>(report.nodeCount);
        report.relationRichness = std::min(
            1.0, static_cast<double>(report.edgeCount) / static_cast<double>(report.nodeCount));
    }

    if (!expectedSubchapters.empty()) {
        std::set<std::string> expected;
        for (const auto& s : expectedSubchapters)
            expected.insert(toLowerAscii(canonicalize(s)));
        std::set<std::string> covered;
        for (const auto& node : graph.nodes) {
            auto key = toLowerAscii(canonicalize(node.subchapter));
            if (expected.count(key))
                covered.insert(std::move(key));
        }
        report.subchapterCoverage =
            static_cast<double>(covered.size()) / static_cast<double>(expected.size());
    }

    std::set<std::string> uniqueKeywords;
    for (const auto& k : keywords) {
        if (!canonicalize(k).empty())
            uniqueKeywords.insert(canonicalize(k));
    }
    if (!uniqueKeywords.empty()) {
        for (const auto& kw : uniqueKeywords) {
            const auto needle = toLowerAscii(kw);
            const bool found = std::any_of(graph.nodes.begin(), graph.nodes.end(), [&](const auto& n) {
                if (toLowerAscii(n.name).find(needle) != std::string::npos ||
                    toLowerAscii(n.description).find(needle) != std::string::npos)
                    return true;
                return std::any_of(n.aliases.begin(), n.aliases.end(), [&](const auto& a) {
                    return toLowerAscii(a).find(needle) != std::string::npos;
                });
            });
            if (found)
                report.coveredKeywords.push_back(kw);
        }
        report.keywordCoverage = static_cast<double>(report.coveredKeywords.size()) /
                                 static_cast<double>(uniqueKeywords.size());
    }

    report.coverageScore = 0.4 * report.subchapterCoverage + 0.3 * report.keywordCoverage +
                           0.2 * report.connectivity + 0.1 * report.relationRichness;
    report.summary = fmt::format("{}: {} nodes, {} edges, {} components, connectivity {:.2f}, "
                                 "coverage {:.2f}",
                                 ctx.sectionId.empty() ? ctx.subchapter : ctx.sectionId,
                                 report.nodeCount, report.edgeCount, report.components,
                                 report.connectivity, report.coverageScore);
    spdlog::debug("[GraphEvaluator] {}", report.summary);
    return report;
}

} // namespace kgrag::kg
