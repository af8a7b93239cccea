#pragma once

#include <kgrag/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::kg {

/**
 * @brief Closed set of relation types persisted in the graph.
 *
 * Labels coming from extraction are mapped onto this set; anything unknown becomes
 * RELATED and keeps its original text in KgEdge::typeLabel.
 */
enum class RelationType {
    Related,
    IsA,
    PartOf,
    InstanceOf,
    HasProperty,
    DependsOn,
    PrerequisiteOf,
    Uses,
    Implements,
    Causes,
    ContrastsWith,
    ExampleOf,
    DerivedFrom,
    Mentions
};

/// Canonical upper-case identifier, e.g. "PART_OF"
const char* relationTypeName(RelationType type) noexcept;

/// True when the label matches ^[A-Z][A-Z0-9_]{0,63}$
bool isSafeIdentifier(std::string_view label) noexcept;

struct ParsedRelation {
    RelationType type = RelationType::Related;
    std::string typeLabel; ///< original label when it did not map onto a known type
};

/**
 * @brief Map a free-text relation label onto the closed enum.
 *
 * The label is trimmed, upper-cased and spaces/hyphens become underscores before the
 * lookup. Empty labels map to RELATED with no type label.
 */
ParsedRelation parseRelationType(std::string_view label);

/// Exact (already canonical) name lookup, used when reading rows back
std::optional<RelationType> relationTypeFromName(std::string_view name) noexcept;

inline constexpr std::string_view kDefaultNodeType = "Concept";

struct KgNode {
    std::string id;
    std::string name;
    std::string type{kDefaultNodeType};
    std::string description;
    std::vector<std::string> aliases;
    std::string scope;
    double score = 1.0;
    std::string chapter;
    std::string subchapter;
    EpochMillis createdAt = 0;
    EpochMillis updatedAt = 0;
};

struct KgEdge {
    std::string rid;
    RelationType type = RelationType::Related;
    std::string typeLabel;
    std::string sourceId;
    std::string targetId;
    std::string description;
    std::string evidence;
    double confidence = 0.8;
    double weight = 1.0;
    std::string scope;
    std::string srcSection;
    EpochMillis createdAt = 0;
    EpochMillis updatedAt = 0;
};

struct KgGraph {
    std::vector<KgNode> nodes;
    std::vector<KgEdge> edges;
    std::string hierarchy;

    bool empty() const noexcept { return nodes.empty() && edges.empty(); }
};

// Extraction output before ids are assigned; edges reference nodes by name.
struct DraftNode {
    std::string name;
    std::string type{kDefaultNodeType};
    std::string description;
    std::vector<std::string> aliases;
    double score = 1.0;
};

struct DraftEdge {
    std::string source;
    std::string target;
    std::string typeLabel;
    std::string description;
    std::string evidence;
    double confidence = 0.8;
    double weight = 1.0;
};

struct DraftGraph {
    std::vector<DraftNode> nodes;
    std::vector<DraftEdge> edges;
    std::string hierarchy;
    std::size_t skippedLines = 0;
};

/**
 * @brief Context of a single content unit (one subchapter) flowing through the pipeline.
 */
struct SectionContext {
    std::string topic;
    std::string chapter;
    std::string subchapter;
    std::string sectionId;
    std::string scope;
    std::vector<std::string> keywords;
    std::string language;
};

/// Build the context for a unit: derives the section id and its scope.
SectionContext makeSectionContext(std::string topic, std::string chapter, std::string subchapter,
                                  std::vector<std::string> keywords = {},
                                  std::string language = {});

} // namespace kgrag::kg
