#pragma once

#include <kgrag/core/types.h>
#include <kgrag/kg/extraction_parser.h>
#include <kgrag/kg/types.h>

#include <memory>
#include <string>

namespace kgrag::kg {

/**
 * @brief Text generation backend used for extraction.
 *
 * NetworkError and Timeout are treated as transient by the orchestrator; InvalidArgument
 * and the other validation-class codes are not retried.
 */
class ILlmClient {
public:
    virtual ~ILlmClient() = default;

    virtual Result<std::string> generate(const std::string& prompt, int maxTokens) = 0;
};

struct ExtractorOptions {
    std::size_t maxContentChars = 3000;
    int maxTokens = 2048;
    double defaultConfidence = 0.8;
    double defaultWeight = 1.0;
};

class Extractor {
public:
    Extractor(std::shared_ptr<ILlmClient> llm, ExtractorOptions options = {});

    /// Run the model over one unit of content and parse its answer into a draft graph
    Result<DraftGraph> extract(const std::string& content, const SectionContext& ctx) const;

    std::string buildPrompt(const std::string& content, const SectionContext& ctx) const;

    const ExtractorOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<ILlmClient> llm_;
    ExtractorOptions options_;
    ExtractionParser parser_;
};

} // namespace kgrag::kg
