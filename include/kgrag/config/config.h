#pragma once

#include <kgrag/core/types.h>
#include <kgrag/kg/thresholds.h>
#include <kgrag/vector/document_chunker.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace kgrag::config {

struct RetrievalConfig {
    std::size_t vector_top_k = 12;
    std::size_t graph_top_k = 8;
    std::size_t final_top_k = 4;
    double alpha = 0.7; // vector channel weight
    double beta = 0.3;  // graph channel weight
    bool use_reranker = false;
    std::size_t rerank_top_n = 8;
    std::size_t graph_hop = 2;

    bool isValid() const {
        return vector_top_k > 0 && graph_top_k > 0 && final_top_k > 0 && alpha >= 0 &&
               beta >= 0;
    }
};

struct OrchestratorConfig {
    std::size_t max_workers = 16;
    std::chrono::milliseconds task_timeout{120000};
    std::size_t retry_count = 3;
    std::chrono::milliseconds retry_backoff{200};

    bool isValid() const {
        return max_workers > 0 && task_timeout.count() > 0 && retry_backoff.count() >= 0;
    }
};

struct ExtractionConfig {
    std::size_t max_content_chars = 3000;
    int max_tokens = 2048;
    double default_confidence = 0.8;
    double default_weight = 1.0;

    bool isValid() const {
        return max_content_chars > 0 && max_tokens > 0 && default_confidence >= 0 &&
               default_confidence <= 1 && default_weight >= 0;
    }
};

struct EmbeddingConfig {
    std::size_t dimension = 384;
    std::string metric = "cosine"; // cosine | dot | euclidean
    std::size_t batch_size = 32;

    bool isValid() const;
};

struct StorageConfig {
    std::string graph_db_path;  // empty = <data dir>/graph.db
    std::string vector_db_path; // empty = <data dir>/vectors.db
    bool prune_orphans = true;
    bool enable_wal = true;
    std::size_t min_connections = 1;
    std::size_t max_connections = 8;

    bool isValid() const { return min_connections > 0 && max_connections >= min_connections; }
};

struct KgragConfig {
    kg::ThresholdConfig thresholds;
    vector::ChunkingConfig chunking;
    RetrievalConfig retrieval;
    OrchestratorConfig orchestrator;
    ExtractionConfig extraction;
    EmbeddingConfig embedding;
    StorageConfig storage;
    std::string log_level = "info";

    // ValidationError naming the first invalid section
    Result<void> validate() const;
};

bool isValidLogLevel(std::string_view level);

// Path resolution: override, KGRAG_CONFIG_PATH, $XDG_CONFIG_HOME/kgrag/config.json,
// ~/.config/kgrag/config.json
std::filesystem::path get_config_path(const std::string& override_path = "");

// $XDG_DATA_HOME/kgrag, ~/.local/share/kgrag, or ./kgrag_data
std::filesystem::path get_data_dir();

std::filesystem::path expand_tilde(const std::string& path);

Result<KgragConfig> fromJson(const nlohmann::json& j);
nlohmann::json toJson(const KgragConfig& cfg);

Result<KgragConfig> parseConfig(const std::string& text);

// KGRAG_GRAPH_DB, KGRAG_VECTOR_DB, KGRAG_MAX_WORKERS, KGRAG_LOG_LEVEL
Result<void> applyEnvOverrides(KgragConfig& cfg);

/**
 * Load the configuration file (defaults when no file exists at the default locations),
 * apply environment overrides, fill default store paths, and validate.
 * An explicit or KGRAG_CONFIG_PATH path that does not exist is FileNotFound.
 */
Result<KgragConfig> loadConfig(const std::string& explicitPath = "");

} // namespace kgrag::config
