#pragma once

#include <kgrag/kg/types.h>

#include <string>
#include <vector>

namespace kgrag::kg {

/**
 * @brief Cleans a draft graph before ids are assigned.
 *
 * Names and aliases are canonicalized, descriptions whitespace-collapsed, confidence clamped
 * to [0,1] and negative weights raised to 0. Nameless nodes and edges missing an endpoint
 * are dropped with a warning. Never throws.
 */
class Normalizer {
public:
    DraftGraph normalize(DraftGraph draft, const SectionContext& ctx) const;

    static std::vector<std::string> normalizeAliases(const std::vector<std::string>& aliases,
                                                     const std::string& canonicalName);
};

} // namespace kgrag::kg
