#pragma once

#include <kgrag/app/context.h>
#include <kgrag/core/types.h>
#include <kgrag/kg/book_merger.h>
#include <kgrag/kg/evaluator.h>
#include <kgrag/kg/extractor.h>
#include <kgrag/kg/graph_store.h>
#include <kgrag/kg/idempotent_processor.h>
#include <kgrag/kg/normalizer.h>
#include <kgrag/kg/thresholds.h>
#include <kgrag/search/evidence.h>
#include <kgrag/search/evidence_merger.h>
#include <kgrag/search/graph_retriever.h>
#include <kgrag/search/vector_retriever.h>
#include <kgrag/vector/document_chunker.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgrag::app {

// ===========================
// Section graphs
// ===========================

struct SectionInput {
    std::string topic;
    std::string chapterTitle;
    std::string subchapterTitle;
    std::string content;
    std::vector<std::string> keywords;
    std::string language;
};

struct SectionBuildResult {
    std::string sectionId;
    std::string contentHash;
    std::string scope;
    kg::StoreStats storeStats;
    kg::ProcessingStats processingStats;
    std::size_t edgesBelowThreshold = 0;
    kg::QualityReport quality;
};

struct SectionBatchResult {
    std::vector<SectionBuildResult> built; // input order
    std::map<std::size_t, Error> failures; // input index -> error
    std::size_t retries = 0;
    std::size_t timeouts = 0;
    std::size_t cancelled = 0;
};

// ===========================
// Book graphs
// ===========================

struct BookContext {
    std::string topic;
    std::string runId;
    bool rebuild = false; // merge exactly the given sections, forgetting earlier ones
};

struct BookMergeOutcome {
    std::string bookId;
    std::string scope;
    std::vector<std::string> sections; // every section merged, sorted
    kg::MergeStats mergeStats;
    kg::StoreStats storeStats;
};

// ===========================
// Retrieval
// ===========================

struct RetrievalMetadata {
    std::size_t vector_count = 0;
    std::size_t graph_count = 0;
    std::size_t merged_count = 0;
    std::size_t final_count = 0;
    bool reranker_used = false;
    bool vector_ok = true;
    bool graph_ok = true;
    std::string vector_error;
    std::string graph_error;
    double alpha = 0.0;
    double beta = 0.0;
};

struct RetrievalResponse {
    std::vector<search::Evidence> evidence;
    RetrievalMetadata metadata;
};

// ===========================
// Documents
// ===========================

struct DocumentIndexResult {
    std::string docId;
    std::size_t chunks = 0;
    std::size_t indexed = 0;
    std::size_t failed = 0;
    std::size_t mentions = 0;
};

/**
 * @brief Entry point for knowledge graph construction and hybrid retrieval
 *
 * Section builds for the same scope are serialized; everything else may run concurrently.
 * The blocking operations (buildSectionGraphs, retrieve) must not be called from a thread
 * of the context's worker pool, and the service must outlive the batches it submits.
 */
class KgService {
public:
    explicit KgService(std::shared_ptr<AppContext> ctx);

    /**
     * Extract, normalize, identify, filter and persist the graph of one content unit, then
     * evaluate it. Re-running the same input rewrites the section scope to the same
     * nodes and edges. Extraction failures are returned as errors; store failures are
     * reported through storeStats.
     */
    Result<SectionBuildResult> buildSectionGraph(const SectionInput& input);

    /// Build many sections on the worker pool. One failing section never aborts the rest.
    SectionBatchResult buildSectionGraphs(const std::vector<SectionInput>& inputs,
                                          std::stop_token st = {});

    /**
     * Merge the given sections, together with the sections previously merged into the
     * same book, into the book scope.
     */
    Result<BookMergeOutcome> mergeBookGraph(const std::vector<std::string>& sectionIds,
                                            const BookContext& book);

    /**
     * Dual-channel retrieval. Never fails: a failing channel is reported in the metadata
     * and the other channel's evidence is returned.
     */
    RetrievalResponse retrieve(const std::string& query, std::size_t topK = 0,
                               bool includeGraph = true,
                               std::optional<std::string> scope = std::nullopt);

    /**
     * Chunk and embed a document, replacing any earlier version. With a link scope, the
     * chunks are linked to the entities of that scope they mention.
     */
    Result<DocumentIndexResult>
    indexDocument(const std::string& docId, const std::string& text,
                  const std::map<std::string, std::string>& metadata = {},
                  std::optional<std::string> linkScope = std::nullopt);

    /// Stored graph of a section; with displayOnly, only edges passing the display gate
    Result<kg::KgGraph> sectionGraph(const std::string& sectionId, bool displayOnly = false);

    Result<std::int64_t> pruneOrphans();
    Result<kg::GraphStats> getStats(std::optional<std::string> scope = std::nullopt);

    std::shared_ptr<search::GraphRetriever> graphRetriever() const { return graphRetriever_; }
    std::shared_ptr<search::VectorRetriever> vectorRetriever() const { return vectorRetriever_; }

    /// Scopes with a build or merge currently running or waiting.
    std::size_t busyScopes() const;

private:
    struct ScopeSlot {
        std::mutex mutex;
        std::size_t users = 0;
    };

    // Serializes writers of one scope; the slot is dropped once its last user leaves.
    class ScopeLock {
    public:
        ScopeLock(KgService& owner, const std::string& scope);
        ~ScopeLock();
        ScopeLock(const ScopeLock&) = delete;
        ScopeLock& operator=(const ScopeLock&) = delete;

    private:
        KgService& owner_;
        std::string scope_;
        ScopeSlot* slot_;
    };

    std::shared_ptr<AppContext> ctx_;
    kg::Extractor extractor_;
    kg::Normalizer normalizer_;
    kg::IdempotentProcessor processor_;
    kg::ThresholdFilter thresholds_;
    kg::BookMerger bookMerger_;
    kg::GraphEvaluator evaluator_;
    vector::DocumentChunker chunker_;
    std::shared_ptr<search::VectorRetriever> vectorRetriever_;
    std::shared_ptr<search::GraphRetriever> graphRetriever_;
    search::EvidenceMerger evidenceMerger_;

    mutable std::mutex scopesMutex_;
    std::unordered_map<std::string, ScopeSlot> scopeLocks_;
};

} // namespace kgrag::app
