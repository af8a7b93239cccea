#include <spdlog/spdlog.h>
#include <kgrag/kg/extractor.h>
#include <kgrag/kg/identity.h>

namespace kgrag::kg {

namespace {

std::string joinKeywords(const std::vector<std::string>& keywords) {
    std::string out;
    for (const auto& k : keywords) {
        if (k.empty())
            continue;
        if (!out.empty())
            out += ", ";
        out += k;
    }
    return out;
}

} // namespace

Extractor::Extractor(std::shared_ptr<ILlmClient> llm, ExtractorOptions options)
    : llm_(std::move(llm)), options_(options),
      parser_(ParserOptions{options.defaultConfidence, options.defaultWeight}) {}

std::string Extractor::buildPrompt(const std::string& content, const SectionContext& ctx) const {
    const auto cut = utf8PrefixBytes(content, options_.maxContentChars);
    const auto language = ctx.language.empty() ? std::string("English") : ctx.language;

    std::string relationTypes;
    for (int i = 0; i <= static_cast<int>(RelationType::Mentions); ++i) {
        if (!relationTypes.empty())
            relationTypes += ", ";
        relationTypes += relationTypeName(static_cast<RelationType>(i));
    }

    return fmt::format(
        "Extract a knowledge graph from the text below.\n"
        "Topic: {}\nChapter: {}\nSection: {}\nKeywords: {}\nAnswer in {}.\n\n"
        "Reply with exactly these markdown sections:\n"
        "### Nodes\n- <concept name>: <one sentence description>\n"
        "### Relations\n- <source concept> -> <target concept>: <TYPE>\n"
        "### Hierarchy\n<indented outline of the concepts>\n\n"
        "Allowed relation types: {}.\n\n"
        "Text:\n{}\n",
        ctx.topic, ctx.chapter, ctx.subchapter, joinKeywords(ctx.keywords), language,
        relationTypes, std::string_view(content).substr(0, cut));
}

Result<DraftGraph> Extractor::extract(const std::string& content, const SectionContext& ctx) const {
    if (!llm_) {
        return Error{ErrorCode::NotInitialized, "No LLM client configured"};
    }
    if (content.empty()) {
        return Error{ErrorCode::InvalidArgument, "Section content is empty"};
    }

    auto response = llm_->generate(buildPrompt(content, ctx), options_.maxTokens);
    if (!response) {
        spdlog::warn("[Extractor] generation failed for {}: {}", ctx.sectionId,
                     response.error().message);
        return response.error();
    }

    const auto& text = response.value();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Error{ErrorCode::InvalidData, "Model returned an empty extraction for " + ctx.sectionId};
    }

    auto draft = parser_.parse(text);
    if (!draft) {
        spdlog::warn("[Extractor] unusable extraction for {}: {}", ctx.sectionId,
                     draft.error().message);
        return draft.error();
    }
    spdlog::debug("[Extractor] {} drafted {} nodes, {} edges", ctx.sectionId,
                  draft.value().nodes.size(), draft.value().edges.size());
    return draft;
}

} // namespace kgrag::kg
