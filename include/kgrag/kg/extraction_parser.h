#pragma once

#include <kgrag/core/types.h>
#include <kgrag/kg/types.h>

#include <string_view>

namespace kgrag::kg {

struct ParserOptions {
    double defaultConfidence = 0.8;
    double defaultWeight = 1.0;
};

/**
 * @brief Parses the markdown an extraction model returns into a draft graph.
 *
 * Recognized sections (English or Chinese headings):
 *   ### Nodes      - name: description
 *   ### Relations  - A -> B: TYPE [| confidence]
 *   ### Hierarchy  free text
 *
 * Lines that cannot be parsed inside a known section are skipped and counted in
 * DraftGraph::skippedLines. Output with no recognizable section at all is InvalidData.
 */
class ExtractionParser {
public:
    explicit ExtractionParser(ParserOptions options = {});

    Result<DraftGraph> parse(std::string_view text) const;

private:
    ParserOptions options_;
};

} // namespace kgrag::kg
