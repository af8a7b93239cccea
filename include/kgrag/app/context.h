#pragma once

#include <kgrag/config/config.h>
#include <kgrag/core/types.h>
#include <kgrag/kg/extractor.h>
#include <kgrag/kg/graph_store.h>
#include <kgrag/orchestrator/task_runner.h>
#include <kgrag/orchestrator/worker_pool.h>
#include <kgrag/search/reranker.h>
#include <kgrag/vector/embedding_provider.h>
#include <kgrag/vector/vector_store.h>

#include <memory>

namespace kgrag::app {

/**
 * Collaborators supplied by the caller instead of being built from configuration.
 * Any member left empty is created by AppContext::create.
 */
struct AppCollaborators {
    std::shared_ptr<kg::GraphStore> graphStore;
    std::shared_ptr<vector::IVectorStore> vectorStore; // must not be initialized yet
    std::shared_ptr<vector::IEmbeddingProvider> embedder;
    std::shared_ptr<search::IReranker> reranker;
};

/**
 * Long-lived application wiring: stores, model clients and the worker pool. Created once
 * and shared by the services; the pool is stopped when the context is destroyed.
 */
struct AppContext {
    config::KgragConfig config;
    std::shared_ptr<kg::GraphStore> graphStore;
    std::shared_ptr<vector::IVectorStore> vectorStore;
    std::shared_ptr<vector::IEmbeddingProvider> embedder;
    std::shared_ptr<kg::ILlmClient> llm;
    std::shared_ptr<search::IReranker> reranker; // null unless retrieval.use_reranker
    std::shared_ptr<orchestrator::WorkerPool> workerPool;
    std::shared_ptr<orchestrator::TaskRunner> taskRunner;

    ~AppContext();

    /**
     * Validate the configuration, apply the log level, open and migrate the graph store,
     * open the vector collection and start the worker pool.
     *
     * Fails on invalid configuration, store open or migration failure, and on an embedder
     * whose dimension differs from the configured or persisted collection dimension.
     */
    static Result<std::shared_ptr<AppContext>> create(config::KgragConfig cfg,
                                                      std::shared_ptr<kg::ILlmClient> llm,
                                                      AppCollaborators collaborators = {});
};

} // namespace kgrag::app
