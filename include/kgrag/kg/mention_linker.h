#pragma once

#include <kgrag/core/types.h>
#include <kgrag/kg/types.h>

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kgrag::kg {

struct MentionLinkerConfig {
    // Minimum confidence for emitting a link
    double minConfidence = 0.5;

    // Consider multi-token phrases up to this n-gram size
    std::size_t maxNgram = 4;

    // Attempt simple plural/singular normalization ("graphs" -> "graph")
    bool pluralNormalization = true;

    bool isValid() const { return minConfidence >= 0.0 && minConfidence <= 1.0 && maxNgram >= 1; }
};

// Surface form -> node mapping in the dictionary
struct MentionAlias {
    std::string alias;
    std::string nodeId;
    double prior = 0.9; ///< confidence assigned to links through this alias
};

// A node mention found in text
struct LinkedMention {
    std::string text;
    std::size_t start = 0; ///< byte offset in the input
    std::size_t end = 0;   ///< exclusive byte offset
    std::string nodeId;
    double confidence = 0.0;
    std::string matchedAlias;
};

/**
 * Dictionary-based mention linker. ASCII aliases are matched as longest-first token
 * n-grams; aliases containing non-ASCII characters (CJK names are not space separated)
 * are matched as substrings.
 */
class MentionLinker {
public:
    MentionLinker() = default;
    explicit MentionLinker(MentionLinkerConfig cfg) : config_(cfg) {}

    Result<void> addAlias(const MentionAlias& entry);

    // Register each node's name and aliases with the given prior
    Result<void> addNodes(const std::vector<KgNode>& nodes, double prior);

    void clear();
    std::size_t size() const;

    Result<std::vector<LinkedMention>> link(std::string_view text) const;

private:
    using NodePrior = std::pair<std::string, double>;

    struct TokenSpan {
        std::string token;
        std::size_t start;
        std::size_t end;
    };

    MentionLinkerConfig config_{};
    std::unordered_map<std::string, std::vector<NodePrior>> asciiAliases_;
    std::unordered_map<std::string, std::vector<NodePrior>> wideAliases_;
    mutable std::mutex mutex_;

    static std::string normalize(std::string_view s);
    static std::string singularize(const std::string& s);
    static std::vector<TokenSpan> tokenize(std::string_view text);
    const NodePrior* lookupBest(const std::string& alias) const;
};

} // namespace kgrag::kg
