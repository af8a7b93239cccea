#include <kgrag/app/kg_service.h>
#include <kgrag/kg/identity.h>
#include <kgrag/kg/mention_linker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <limits>
#include <utility>

namespace kgrag::app {

namespace {

constexpr double kChunkMentionConfidence = 0.9;

kg::ExtractorOptions extractorOptions(const config::ExtractionConfig& cfg) {
    kg::ExtractorOptions opts;
    opts.maxContentChars = cfg.max_content_chars;
    opts.maxTokens = cfg.max_tokens;
    opts.defaultConfidence = cfg.default_confidence;
    opts.defaultWeight = cfg.default_weight;
    return opts;
}

search::EvidenceMergerConfig mergerConfig(const config::RetrievalConfig& cfg) {
    search::EvidenceMergerConfig mc;
    mc.alpha = cfg.alpha;
    mc.beta = cfg.beta;
    mc.maxResults = std::max<std::size_t>(cfg.final_top_k, 1);
    return mc;
}

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Nothing reached the store: the write is worth another attempt
bool writeFailedEntirely(const kg::StoreStats& stats) {
    return !stats.success && stats.attempted > 0 && stats.nodesWritten == 0 &&
           stats.edgesWritten == 0;
}

} // namespace

KgService::KgService(std::shared_ptr<AppContext> ctx)
    : ctx_(std::move(ctx)), extractor_(ctx_->llm, extractorOptions(ctx_->config.extraction)),
      thresholds_(ctx_->config.thresholds), chunker_(ctx_->config.chunking),
      vectorRetriever_(std::make_shared<search::VectorRetriever>(
          ctx_->embedder, ctx_->vectorStore, ctx_->config.embedding.batch_size)),
      graphRetriever_(std::make_shared<search::GraphRetriever>(ctx_->graphStore)),
      evidenceMerger_(mergerConfig(ctx_->config.retrieval), ctx_->reranker) {}

KgService::ScopeLock::ScopeLock(KgService& owner, const std::string& scope)
    : owner_(owner), scope_(scope) {
    {
        std::lock_guard lock(owner_.scopesMutex_);
        slot_ = &owner_.scopeLocks_[scope_];
        ++slot_->users;
    }
    slot_->mutex.lock();
}

KgService::ScopeLock::~ScopeLock() {
    slot_->mutex.unlock();
    std::lock_guard lock(owner_.scopesMutex_);
    if (--slot_->users == 0)
        owner_.scopeLocks_.erase(scope_);
}

std::size_t KgService::busyScopes() const {
    std::lock_guard lock(scopesMutex_);
    return scopeLocks_.size();
}

// ---------------------------------------------------------------------------------------
// Section graphs
// ---------------------------------------------------------------------------------------

Result<SectionBuildResult> KgService::buildSectionGraph(const SectionInput& input) {
    if (isBlank(input.topic) && isBlank(input.chapterTitle) && isBlank(input.subchapterTitle)) {
        return Error{ErrorCode::InvalidArgument,
                     "Section needs a topic, chapter or subchapter title"};
    }

    auto sctx = kg::makeSectionContext(input.topic, input.chapterTitle, input.subchapterTitle,
                                       input.keywords, input.language);

    SectionBuildResult out;
    out.sectionId = sctx.sectionId;
    out.scope = sctx.scope;
    out.contentHash = kg::contentHash(input.content);

    ScopeLock guard(*this, sctx.scope);

    auto draft = extractor_.extract(input.content, sctx);
    if (!draft) {
        spdlog::warn("[KgService] extraction failed for {} ({}): {}", sctx.sectionId,
                     input.subchapterTitle, draft.error().message);
        return draft.error();
    }

    auto normalized = normalizer_.normalize(std::move(draft).value(), sctx);
    auto processed = processor_.process(normalized, sctx);
    out.processingStats = processed.stats;

    kg::KgGraph graph = std::move(processed.graph);
    auto stored = thresholds_.filterForStorage(graph.edges);
    out.edgesBelowThreshold = graph.edges.size() - stored.size();
    graph.edges = std::move(stored);

    out.storeStats = ctx_->graphStore->writeGraph(graph, sctx.scope);
    if (!out.storeStats.success) {
        spdlog::warn("[KgService] {} stored with {} errors", sctx.scope, out.storeStats.errors);
    }

    std::vector<std::string> expected;
    if (!sctx.subchapter.empty())
        expected.push_back(sctx.subchapter);
    out.quality = evaluator_.evaluate(graph, sctx, expected, sctx.keywords);

    spdlog::info("[KgService] built {}: {} nodes, {} edges ({} below threshold), coverage {:.2f}",
                 sctx.scope, graph.nodes.size(), graph.edges.size(), out.edgesBelowThreshold,
                 out.quality.coverageScore);
    return out;
}

SectionBatchResult KgService::buildSectionGraphs(const std::vector<SectionInput>& inputs,
                                                 std::stop_token st) {
    std::vector<orchestrator::Task<SectionBuildResult>> tasks;
    tasks.reserve(inputs.size());
    for (const auto& input : inputs) {
        tasks.push_back([this, input]() -> Result<SectionBuildResult> {
            auto built = buildSectionGraph(input);
            if (built && writeFailedEntirely(built.value().storeStats)) {
                return Error{ErrorCode::DatabaseError,
                             "Nothing of " + built.value().scope + " could be stored"};
            }
            return built;
        });
    }

    auto report = ctx_->taskRunner->runBatch<SectionBuildResult>(std::move(tasks), st);

    std::sort(report.outcomes.begin(), report.outcomes.end(),
              [](const auto& a, const auto& b) { return a.index < b.index; });

    SectionBatchResult out;
    out.retries = report.retries;
    out.timeouts = report.timeouts;
    out.cancelled = report.cancelled;
    for (auto& outcome : report.outcomes) {
        if (outcome.result) {
            out.built.push_back(std::move(outcome.result).value());
        } else {
            out.failures.emplace(outcome.index, outcome.result.error());
        }
    }
    spdlog::info("[KgService] section batch: {} built, {} failed, {} retries, {} timeouts",
                 out.built.size(), out.failures.size(), out.retries, out.timeouts);
    return out;
}

// ---------------------------------------------------------------------------------------
// Book graphs
// ---------------------------------------------------------------------------------------

Result<BookMergeOutcome> KgService::mergeBookGraph(const std::vector<std::string>& sectionIds,
                                                   const BookContext& book) {
    if (isBlank(book.topic))
        return Error{ErrorCode::InvalidArgument, "Book topic is empty"};

    BookMergeOutcome out;
    out.bookId = kg::bookId(book.topic, book.runId);
    out.scope = kg::bookScope(out.bookId);

    ScopeLock guard(*this, out.scope);

    auto& store = *ctx_->graphStore;
    if (book.rebuild) {
        if (auto r = store.clearBookSections(out.bookId); !r)
            return r.error();
    }
    if (auto r = store.recordBookSections(out.bookId, sectionIds); !r)
        return r.error();

    auto members = store.bookSections(out.bookId);
    if (!members)
        return members.error();
    out.sections = std::move(members).value();
    std::sort(out.sections.begin(), out.sections.end());

    std::vector<kg::SectionGraph> sections;
    sections.reserve(out.sections.size());
    for (const auto& id : out.sections) {
        auto graph = store.loadScope(kg::sectionScope(id));
        if (!graph)
            return graph.error();
        if (graph.value().empty()) {
            spdlog::warn("[KgService] section {} of {} has no stored graph", id, out.bookId);
            continue;
        }
        sections.push_back(kg::SectionGraph{id, std::move(graph).value()});
    }

    auto merged = bookMerger_.merge(std::move(sections), kg::BookMergeContext{out.bookId,
                                                                              book.topic});
    out.mergeStats = merged.stats;
    out.storeStats = store.writeGraph(merged.graph, out.scope);

    spdlog::info("[KgService] merged {} sections into {}: nodes {} -> {}, edges {} -> {}",
                 out.mergeStats.sectionsMerged, out.scope, out.mergeStats.originalNodes,
                 out.mergeStats.mergedNodes, out.mergeStats.originalEdges,
                 out.mergeStats.mergedEdges);
    return out;
}

// ---------------------------------------------------------------------------------------
// Retrieval
// ---------------------------------------------------------------------------------------

RetrievalResponse KgService::retrieve(const std::string& query, std::size_t topK,
                                      bool includeGraph, std::optional<std::string> scope) {
    const auto& rcfg = ctx_->config.retrieval;
    if (topK == 0)
        topK = rcfg.final_top_k;

    RetrievalResponse response;
    auto& md = response.metadata;
    md.alpha = evidenceMerger_.alpha();
    md.beta = evidenceMerger_.beta();

    if (isBlank(query)) {
        spdlog::debug("[KgService] blank query, nothing to retrieve");
        return response;
    }

    auto vectorRetriever = vectorRetriever_;
    auto vectorFuture = ctx_->taskRunner->submit<std::vector<search::VectorHit>>(
        [vectorRetriever, query, k = rcfg.vector_top_k] {
            return vectorRetriever->search(query, k);
        });

    std::optional<std::future<Result<std::vector<search::GraphHit>>>> graphFuture;
    if (includeGraph) {
        auto graphRetriever = graphRetriever_;
        graphFuture = ctx_->taskRunner->submit<std::vector<search::GraphHit>>(
            [graphRetriever, query, k = rcfg.graph_top_k, hop = rcfg.graph_hop, scope] {
                return graphRetriever->search(query, k, hop, {}, scope);
            });
    }

    std::vector<search::VectorHit> vectorHits;
    auto vr = vectorFuture.get();
    if (vr) {
        vectorHits = std::move(vr).value();
    } else {
        md.vector_ok = false;
        md.vector_error = vr.error().message;
        spdlog::warn("[KgService] vector channel failed: {}", md.vector_error);
    }

    std::vector<search::GraphHit> graphHits;
    if (graphFuture) {
        auto gr = graphFuture->get();
        if (gr) {
            graphHits = std::move(gr).value();
        } else {
            md.graph_ok = false;
            md.graph_error = gr.error().message;
            spdlog::warn("[KgService] graph channel failed: {}", md.graph_error);
        }
    }

    md.vector_count = vectorHits.size();
    md.graph_count = graphHits.size();

    // Twice the final size so reranking has candidates to promote
    auto merged = evidenceMerger_.merge(vectorHits, graphHits, topK * 2);
    md.merged_count = merged.size();

    if (rcfg.use_reranker && evidenceMerger_.hasReranker() && !merged.empty()) {
        merged = evidenceMerger_.rerank(query, std::move(merged),
                                        std::max(topK, rcfg.rerank_top_n));
        md.reranker_used = true;
    }
    if (merged.size() > topK)
        merged.erase(merged.begin() + static_cast<std::ptrdiff_t>(topK), merged.end());

    md.final_count = merged.size();
    response.evidence = std::move(merged);

    spdlog::info("[KgService] retrieval: vector={}, graph={}, merged={}, final={}",
                 md.vector_count, md.graph_count, md.merged_count, md.final_count);
    return response;
}

// ---------------------------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------------------------

Result<DocumentIndexResult>
KgService::indexDocument(const std::string& docId, const std::string& text,
                         const std::map<std::string, std::string>& metadata,
                         std::optional<std::string> linkScope) {
    auto chunks = chunker_.chunkDocument(docId, text, metadata);
    if (!chunks)
        return chunks.error();

    auto removed = vectorRetriever_->removeDocument(docId);
    if (!removed)
        return removed.error();
    auto unlinked = ctx_->graphStore->deleteMentionsForDocument(docId);
    if (!unlinked)
        return unlinked.error();

    auto indexed = vectorRetriever_->index(chunks.value());
    if (!indexed)
        return indexed.error();

    DocumentIndexResult out;
    out.docId = docId;
    out.chunks = indexed.value().chunks;
    out.indexed = indexed.value().indexed;
    out.failed = indexed.value().failed;

    if (linkScope) {
        auto nodes = ctx_->graphStore->listNodes(*linkScope,
                                                 std::numeric_limits<std::int32_t>::max());
        if (!nodes)
            return nodes.error();

        kg::MentionLinker linker;
        if (auto r = linker.addNodes(nodes.value(), kChunkMentionConfidence); !r)
            return r.error();

        std::map<std::pair<std::string, std::string>, double> best;
        for (const auto& chunk : chunks.value()) {
            auto links = linker.link(chunk.content);
            if (!links) {
                spdlog::warn("[KgService] linking {} failed: {}", chunk.chunk_id,
                             links.error().message);
                continue;
            }
            for (const auto& m : links.value()) {
                auto& slot = best[{chunk.chunk_id, m.nodeId}];
                slot = std::max(slot, m.confidence);
            }
        }

        std::vector<kg::ChunkMention> mentions;
        mentions.reserve(best.size());
        for (const auto& [key, confidence] : best)
            mentions.push_back(kg::ChunkMention{key.first, docId, key.second, confidence});
        if (!mentions.empty()) {
            if (auto r = ctx_->graphStore->upsertChunkMentions(mentions); !r)
                return r.error();
        }
        out.mentions = mentions.size();
    }

    spdlog::info("[KgService] indexed {}: {} chunks ({} failed), {} mentions", docId,
                 out.indexed, out.failed, out.mentions);
    return out;
}

Result<kg::KgGraph> KgService::sectionGraph(const std::string& sectionId, bool displayOnly) {
    auto graph = ctx_->graphStore->loadScope(kg::sectionScope(sectionId));
    if (!graph)
        return graph.error();
    if (!displayOnly)
        return graph;

    auto out = std::move(graph).value();
    out.edges = thresholds_.filterForDisplay(out.edges);
    return out;
}

Result<std::int64_t> KgService::pruneOrphans() {
    return ctx_->graphStore->pruneOrphans();
}

Result<kg::GraphStats> KgService::getStats(std::optional<std::string> scope) {
    return ctx_->graphStore->getStats(std::move(scope));
}

} // namespace kgrag::app
