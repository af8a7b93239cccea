#include <kgrag/config/config.h>
#include <kgrag/vector/vector_store.h>

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <type_traits>

namespace kgrag::config {

using nlohmann::json;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info",    "warn",
                                                        "error", "critical", "off"};

// Read one optional field; a present value of the wrong type is a ValidationError
template <typename T>
Result<void> readField(const json& obj, const char* section, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return {};

    auto typeError = [&](const char* expected) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("config {}.{}: expected {}, got {}", section, key, expected,
                                 it->type_name())};
    };
    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean())
            return typeError("boolean");
    } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
        if (!it->is_number_unsigned())
            return typeError("non-negative integer");
    } else if constexpr (std::is_integral_v<T>) {
        if (!it->is_number_integer())
            return typeError("integer");
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!it->is_number())
            return typeError("number");
    } else {
        if (!it->is_string())
            return typeError("string");
    }

    try {
        out = it->template get<T>();
    } catch (const json::exception& e) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("config {}.{}: {}", section, key, e.what())};
    }
    return {};
}

Result<void> readMillis(const json& obj, const char* section, const char* key,
                        std::chrono::milliseconds& out) {
    std::size_t ms = static_cast<std::size_t>(out.count());
    auto r = readField(obj, section, key, ms);
    if (!r)
        return r;
    out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
    return {};
}

void logUnknownKeys(const json& obj, const char* section, std::set<std::string_view> known) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!known.count(it.key()))
            spdlog::debug("[Config] ignoring unknown key {}.{}", section, it.key());
    }
}

// Section object or null when absent; a non-object section is a ValidationError
Result<const json*> section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null())
        return static_cast<const json*>(nullptr);
    if (!it->is_object()) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("config section '{}' must be an object", name)};
    }
    return &*it;
}

#define KGRAG_CONFIG_READ(expr)                                                                    \
    do {                                                                                           \
        auto _r = (expr);                                                                          \
        if (!_r)                                                                                   \
            return _r.error();                                                                     \
    } while (0)

std::optional<std::size_t> parseSize(const char* text) {
    std::string_view sv(text);
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
        return std::nullopt;
    return value;
}

} // namespace

bool EmbeddingConfig::isValid() const {
    return dimension > 0 && batch_size > 0 && vector::parseMetric(metric).has_value();
}

bool isValidLogLevel(std::string_view level) {
    for (auto l : kLogLevels) {
        if (l == level)
            return true;
    }
    return false;
}

Result<void> KgragConfig::validate() const {
    auto invalid = [](const char* name) {
        return Error{ErrorCode::ValidationError, fmt::format("invalid '{}' configuration", name)};
    };
    if (!thresholds.isValid())
        return invalid("thresholds");
    if (!chunking.isValid())
        return invalid("chunking");
    if (!retrieval.isValid())
        return invalid("retrieval");
    if (!orchestrator.isValid())
        return invalid("orchestrator");
    if (!extraction.isValid())
        return invalid("extraction");
    if (!embedding.isValid())
        return invalid("embedding");
    if (!storage.isValid())
        return invalid("storage");
    if (!isValidLogLevel(log_level))
        return invalid("log_level");
    return {};
}

std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("KGRAG_CONFIG_PATH"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "kgrag" / "config.json";
    }
    return configHome / "kgrag" / "config.json";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "kgrag";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "kgrag";
    }
    return std::filesystem::current_path() / "kgrag_data";
}

Result<KgragConfig> fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::ValidationError, "config root must be an object"};
    }
    KgragConfig cfg;

    KGRAG_CONFIG_READ(readField(j, "root", "log_level", cfg.log_level));
    logUnknownKeys(j, "root",
                   {"log_level", "thresholds", "chunking", "retrieval", "orchestrator",
                    "extraction", "embedding", "storage"});

    auto s = section(j, "thresholds");
    if (!s)
        return s.error();
    if (const json* o = s.value()) {
        KGRAG_CONFIG_READ(readField(*o, "thresholds", "theta_add", cfg.thresholds.thetaAdd));
        KGRAG_CONFIG_READ(readField(*o, "thresholds", "theta_show", cfg.thresholds.thetaShow));
        KGRAG_CONFIG_READ(readField(*o, "thresholds", "min_evidence_count",
                                    cfg.thresholds.minEvidenceCount));
        logUnknownKeys(*o, "thresholds", {"theta_add", "theta_show", "min_evidence_count"});
    }

    s = section(j, "chunking");
    if (!s)
        return s.error();
    if (const json* o = s.value()) {
        KGRAG_CONFIG_READ(readField(*o, "chunking", "chunk_size", cfg.chunking.chunk_size));
        KGRAG_CONFIG_READ(readField(*o, "chunking", "overlap", cfg.chunking.overlap));
        logUnknownKeys(*o, "chunking", {"chunk_size", "overlap"});
    }

    s = section(j, "retrieval");
    if (!s)
        return s.error();
    if (const json* o = s.value()) {
        auto& r = cfg.retrieval;
        KGRAG_CONFIG_READ(readField(*o, "retrieval", "vector_top_k", r.vector_top_k));
        KGRAG_CONFIG_READ(readField(*o, "retrieval", "graph_top_k", r.graph_top_k));
        KGRAG_CONFIG_READ(readField(*o, "retrieval", "final_top_k", r.final_top_k));
        KGRAG_CONFIG_READ(readField(*o, "retrieval", "alpha", r.alpha));
        KGRAG_CONFIG_READ(readField(*o, "retrieval", "beta", r.beta));
        KGRAG_CONFIG_READ(readField(*o, "retrieval", "use_reranker", r.use_reranker));
        KGRAG_CONFIG_READ(readField(*o, "retrieval", "rerank_top_n", r.rerank_top_n));
        KGRAG_CONFIG_READ(readField(*o, "retrieval", "graph_hop", r.graph_hop));
        logUnknownKeys(*o, "retrieval",
                       {"vector_top_k", "graph_top_k", "final_top_k", "alpha", "beta",
                        "use_reranker", "rerank_top_n", "graph_hop"});
    }

    s = section(j, "orchestrator");
    if (!s)
        return s.error();
    if (const json* o = s.value()) {
        auto& r = cfg.orchestrator;
        KGRAG_CONFIG_READ(readField(*o, "orchestrator", "max_workers", r.max_workers));
        KGRAG_CONFIG_READ(readMillis(*o, "orchestrator", "task_timeout_ms", r.task_timeout));
        KGRAG_CONFIG_READ(readField(*o, "orchestrator", "retry_count", r.retry_count));
        KGRAG_CONFIG_READ(readMillis(*o, "orchestrator", "retry_backoff_ms", r.retry_backoff));
        logUnknownKeys(*o, "orchestrator",
                       {"max_workers", "task_timeout_ms", "retry_count", "retry_backoff_ms"});
    }

    s = section(j, "extraction");
    if (!s)
        return s.error();
    if (const json* o = s.value()) {
        auto& r = cfg.extraction;
        KGRAG_CONFIG_READ(readField(*o, "extraction", "max_content_chars", r.max_content_chars));
        KGRAG_CONFIG_READ(readField(*o, "extraction", "max_tokens", r.max_tokens));
        KGRAG_CONFIG_READ(
            readField(*o, "extraction", "default_confidence", r.default_confidence));
        KGRAG_CONFIG_READ(readField(*o, "extraction", "default_weight", r.default_weight));
        logUnknownKeys(*o, "extraction",
                       {"max_content_chars", "max_tokens", "default_confidence",
                        "default_weight"});
    }

    s = section(j, "embedding");
    if (!s)
        return s.error();
    if (const json* o = s.value()) {
        auto& r = cfg.embedding;
        KGRAG_CONFIG_READ(readField(*o, "embedding", "dimension", r.dimension));
        KGRAG_CONFIG_READ(readField(*o, "embedding", "metric", r.metric));
        KGRAG_CONFIG_READ(readField(*o, "embedding", "batch_size", r.batch_size));
        logUnknownKeys(*o, "embedding", {"dimension", "metric", "batch_size"});
    }

    s = section(j, "storage");
    if (!s)
        return s.error();
    if (const json* o = s.value()) {
        auto& r = cfg.storage;
        KGRAG_CONFIG_READ(readField(*o, "storage", "graph_db_path", r.graph_db_path));
        KGRAG_CONFIG_READ(readField(*o, "storage", "vector_db_path", r.vector_db_path));
        KGRAG_CONFIG_READ(readField(*o, "storage", "prune_orphans", r.prune_orphans));
        KGRAG_CONFIG_READ(readField(*o, "storage", "enable_wal", r.enable_wal));
        KGRAG_CONFIG_READ(readField(*o, "storage", "min_connections", r.min_connections));
        KGRAG_CONFIG_READ(readField(*o, "storage", "max_connections", r.max_connections));
        logUnknownKeys(*o, "storage",
                       {"graph_db_path", "vector_db_path", "prune_orphans", "enable_wal",
                        "min_connections", "max_connections"});
    }

    return cfg;
}

json toJson(const KgragConfig& cfg) {
    json j;
    j["log_level"] = cfg.log_level;
    j["thresholds"] = {{"theta_add", cfg.thresholds.thetaAdd},
                       {"theta_show", cfg.thresholds.thetaShow},
                       {"min_evidence_count", cfg.thresholds.minEvidenceCount}};
    j["chunking"] = {{"chunk_size", cfg.chunking.chunk_size},
                     {"overlap", cfg.chunking.overlap}};
    j["retrieval"] = {{"vector_top_k", cfg.retrieval.vector_top_k},
                      {"graph_top_k", cfg.retrieval.graph_top_k},
                      {"final_top_k", cfg.retrieval.final_top_k},
                      {"alpha", cfg.retrieval.alpha},
                      {"beta", cfg.retrieval.beta},
                      {"use_reranker", cfg.retrieval.use_reranker},
                      {"rerank_top_n", cfg.retrieval.rerank_top_n},
                      {"graph_hop", cfg.retrieval.graph_hop}};
    j["orchestrator"] = {{"max_workers", cfg.orchestrator.max_workers},
                         {"task_timeout_ms", cfg.orchestrator.task_timeout.count()},
                         {"retry_count", cfg.orchestrator.retry_count},
                         {"retry_backoff_ms", cfg.orchestrator.retry_backoff.count()}};
    j["extraction"] = {{"max_content_chars", cfg.extraction.max_content_chars},
                       {"max_tokens", cfg.extraction.max_tokens},
                       {"default_confidence", cfg.extraction.default_confidence},
                       {"default_weight", cfg.extraction.default_weight}};
    j["embedding"] = {{"dimension", cfg.embedding.dimension},
                      {"metric", cfg.embedding.metric},
                      {"batch_size", cfg.embedding.batch_size}};
    j["storage"] = {{"graph_db_path", cfg.storage.graph_db_path},
                    {"vector_db_path", cfg.storage.vector_db_path},
                    {"prune_orphans", cfg.storage.prune_orphans},
                    {"enable_wal", cfg.storage.enable_wal},
                    {"min_connections", cfg.storage.min_connections},
                    {"max_connections", cfg.storage.max_connections}};
    return j;
}

Result<KgragConfig> parseConfig(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::ValidationError, "config is not valid JSON"};
    }
    return fromJson(j);
}

Result<void> applyEnvOverrides(KgragConfig& cfg) {
    if (const char* env = std::getenv("KGRAG_GRAPH_DB"); env && *env) {
        cfg.storage.graph_db_path = expand_tilde(env).string();
    }
    if (const char* env = std::getenv("KGRAG_VECTOR_DB"); env && *env) {
        cfg.storage.vector_db_path = expand_tilde(env).string();
    }
    if (const char* env = std::getenv("KGRAG_MAX_WORKERS"); env && *env) {
        auto workers = parseSize(env);
        if (!workers || *workers == 0) {
            return Error{ErrorCode::ValidationError,
                         fmt::format("KGRAG_MAX_WORKERS must be a positive integer, got '{}'",
                                     env)};
        }
        cfg.orchestrator.max_workers = *workers;
    }
    if (const char* env = std::getenv("KGRAG_LOG_LEVEL"); env && *env) {
        if (!isValidLogLevel(env)) {
            return Error{ErrorCode::ValidationError,
                         fmt::format("KGRAG_LOG_LEVEL '{}' is not a log level", env)};
        }
        cfg.log_level = env;
    }
    return {};
}

Result<KgragConfig> loadConfig(const std::string& explicitPath) {
    const bool required =
        !explicitPath.empty() || (std::getenv("KGRAG_CONFIG_PATH") && *std::getenv("KGRAG_CONFIG_PATH"));
    const auto path = get_config_path(explicitPath);

    KgragConfig cfg;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream file(path);
        if (!file) {
            return Error{ErrorCode::PermissionDenied,
                         fmt::format("cannot read config file {}", path.string())};
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        auto parsed = parseConfig(buffer.str());
        if (!parsed) {
            return Error{parsed.error().code,
                         fmt::format("{}: {}", path.string(), parsed.error().message)};
        }
        cfg = std::move(parsed).value();
        spdlog::info("[Config] loaded {}", path.string());
    } else if (required) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("config file {} does not exist", path.string())};
    } else {
        spdlog::debug("[Config] no config file at {}, using defaults", path.string());
    }

    auto env = applyEnvOverrides(cfg);
    if (!env)
        return env.error();

    if (cfg.storage.graph_db_path.empty())
        cfg.storage.graph_db_path = (get_data_dir() / "graph.db").string();
    else
        cfg.storage.graph_db_path = expand_tilde(cfg.storage.graph_db_path).string();
    if (cfg.storage.vector_db_path.empty())
        cfg.storage.vector_db_path = (get_data_dir() / "vectors.db").string();
    else
        cfg.storage.vector_db_path = expand_tilde(cfg.storage.vector_db_path).string();

    auto valid = cfg.validate();
    if (!valid)
        return valid.error();
    return cfg;
}

} // namespace kgrag::config
