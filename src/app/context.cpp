#include <kgrag/app/context.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace kgrag::app {

namespace {

void ensureParentDir(const std::string& path) {
    if (path.empty() || path == ":memory:")
        return;
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty())
        return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
        spdlog::warn("[AppContext] cannot create {}: {}", parent.string(), ec.message());
}

} // namespace

AppContext::~AppContext() {
    if (workerPool)
        workerPool->stop();
}

Result<std::shared_ptr<AppContext>> AppContext::create(config::KgragConfig cfg,
                                                       std::shared_ptr<kg::ILlmClient> llm,
                                                       AppCollaborators collaborators) {
    if (auto v = cfg.validate(); !v)
        return v.error();

    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    auto ctx = std::make_shared<AppContext>();
    ctx->llm = std::move(llm);

    // Graph store
    if (collaborators.graphStore) {
        ctx->graphStore = std::move(collaborators.graphStore);
    } else {
        kg::GraphStoreConfig gcfg;
        gcfg.enableWal = cfg.storage.enable_wal;
        gcfg.minConnections = cfg.storage.min_connections;
        gcfg.maxConnections = cfg.storage.max_connections;
        gcfg.pruneOrphans = cfg.storage.prune_orphans;
        ensureParentDir(cfg.storage.graph_db_path);
        auto store = kg::makeSqliteGraphStore(cfg.storage.graph_db_path, gcfg);
        if (!store) {
            spdlog::error("[AppContext] graph store {} unavailable: {}", cfg.storage.graph_db_path,
                          store.error().message);
            return store.error();
        }
        ctx->graphStore = std::shared_ptr<kg::GraphStore>(std::move(store).value());
    }

    // Embedding provider
    if (collaborators.embedder) {
        ctx->embedder = std::move(collaborators.embedder);
    } else {
        ctx->embedder = vector::makeHashingEmbeddingProvider(cfg.embedding.dimension);
    }
    if (ctx->embedder->dimension() != cfg.embedding.dimension) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding provider '" + ctx->embedder->name() + "' has dimension " +
                         std::to_string(ctx->embedder->dimension()) + ", configured " +
                         std::to_string(cfg.embedding.dimension)};
    }

    // Vector collection
    if (collaborators.vectorStore) {
        ctx->vectorStore = std::move(collaborators.vectorStore);
    } else {
        auto metric = vector::parseMetric(cfg.embedding.metric);
        if (!metric)
            return Error{ErrorCode::ValidationError,
                         "Unknown distance metric: " + cfg.embedding.metric};
        vector::VectorStoreConfig vcfg;
        vcfg.dimension = cfg.embedding.dimension;
        vcfg.metric = *metric;
        vcfg.enableWal = cfg.storage.enable_wal;
        vcfg.maxConnections = cfg.storage.max_connections;
        ensureParentDir(cfg.storage.vector_db_path);
        auto store = vector::makeSqliteVectorStore(cfg.storage.vector_db_path, vcfg);
        if (!store) {
            spdlog::error("[AppContext] vector store {} unavailable: {}",
                          cfg.storage.vector_db_path, store.error().message);
            return store.error();
        }
        ctx->vectorStore = std::shared_ptr<vector::IVectorStore>(std::move(store).value());
    }
    if (auto init = ctx->vectorStore->initialize(); !init) {
        spdlog::error("[AppContext] vector collection rejected: {}", init.error().message);
        return init.error();
    }

    if (cfg.retrieval.use_reranker) {
        ctx->reranker = collaborators.reranker ? std::move(collaborators.reranker)
                                               : std::make_shared<search::LexicalReranker>();
    }

    ctx->workerPool = std::make_shared<orchestrator::WorkerPool>(cfg.orchestrator.max_workers);
    orchestrator::TaskRunnerConfig tcfg;
    tcfg.taskTimeout = cfg.orchestrator.task_timeout;
    tcfg.retryCount = cfg.orchestrator.retry_count;
    tcfg.retryBackoff = cfg.orchestrator.retry_backoff;
    ctx->taskRunner = std::make_shared<orchestrator::TaskRunner>(ctx->workerPool, tcfg);

    ctx->config = std::move(cfg);
    spdlog::info("[AppContext] ready: graph={}, vectors={} ({} dims, {}), {} workers",
                 ctx->config.storage.graph_db_path, ctx->config.storage.vector_db_path,
                 ctx->embedder->dimension(), ctx->config.embedding.metric,
                 ctx->config.orchestrator.max_workers);
    return ctx;
}

} // namespace kgrag::app
