#include <kgrag/storage/connection_pool.h>
#include <kgrag/storage/database.h>
#include <kgrag/vector/vector_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <span>

namespace kgrag::vector {

using storage::ConnectionPool;
using storage::ConnectionPoolConfig;
using storage::Database;
using storage::Statement;

const char* metricName(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::Cosine:
            return "cosine";
        case DistanceMetric::Dot:
            return "dot";
        case DistanceMetric::Euclidean:
            return "euclidean";
    }
    return "cosine";
}

std::optional<DistanceMetric> parseMetric(std::string_view name) {
    if (name == "cosine")
        return DistanceMetric::Cosine;
    if (name == "dot" || name == "ip")
        return DistanceMetric::Dot;
    if (name == "euclidean" || name == "l2")
        return DistanceMetric::Euclidean;
    return std::nullopt;
}

float similarity(const std::vector<float>& a, const std::vector<float>& b, DistanceMetric metric) {
    const size_t n = std::min(a.size(), b.size());
    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    double dist = 0.0;
    for (size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
        const double d = static_cast<double>(a[i]) - b[i];
        dist += d * d;
    }
    switch (metric) {
        case DistanceMetric::Cosine:
            if (na <= 0.0 || nb <= 0.0)
                return 0.0f;
            return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb)));
        case DistanceMetric::Dot:
            return static_cast<float>(dot);
        case DistanceMetric::Euclidean:
            return static_cast<float>(1.0 / (1.0 + std::sqrt(dist)));
    }
    return 0.0f;
}

bool VectorFilter::matches(const VectorRecord& record) const {
    if (docId && record.doc_id != *docId)
        return false;
    for (const auto& [key, value] : metadata) {
        auto it = record.metadata.find(key);
        if (it == record.metadata.end() || it->second != value)
            return false;
    }
    return true;
}

namespace {

std::vector<std::byte> vectorToBlob(const std::vector<float>& vec) {
    std::vector<std::byte> blob(vec.size() * sizeof(float));
    std::memcpy(blob.data(), vec.data(), blob.size());
    return blob;
}

std::vector<float> blobToVector(const std::vector<std::byte>& blob) {
    std::vector<float> vec(blob.size() / sizeof(float));
    std::memcpy(vec.data(), blob.data(), vec.size() * sizeof(float));
    return vec;
}

std::string metadataToJson(const std::map<std::string, std::string>& metadata) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : metadata)
        j[key] = value;
    return j.dump();
}

std::map<std::string, std::string> metadataFromJson(const std::string& text) {
    std::map<std::string, std::string> out;
    if (text.empty())
        return out;
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("[VectorStore] ignoring unreadable metadata: {}", text);
        return out;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        out[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return out;
}

constexpr const char* kCreateTables = R"(
    CREATE TABLE IF NOT EXISTS vector_collection (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL
    );
    CREATE TABLE IF NOT EXISTS vector_chunks (
        chunk_id TEXT PRIMARY KEY,
        doc_id TEXT NOT NULL,
        content TEXT NOT NULL DEFAULT '',
        embedding BLOB NOT NULL,
        metadata TEXT NOT NULL DEFAULT '{}',
        updated_at INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_vector_chunks_doc ON vector_chunks(doc_id);
)";

VectorRecord readRecord(const Statement& stmt) {
    VectorRecord record;
    record.chunk_id = stmt.columnText(0);
    record.doc_id = stmt.columnText(1);
    record.content = stmt.columnText(2);
    record.embedding = blobToVector(stmt.columnBlob(3));
    record.metadata = metadataFromJson(stmt.columnText(4));
    return record;
}

Result<void> writeCollectionParams(Database& db, const VectorStoreConfig& cfg) {
    auto stmtR = db.prepare("INSERT OR REPLACE INTO vector_collection (key, value) VALUES (?, ?)");
    if (!stmtR)
        return stmtR.error();
    auto stmt = std::move(stmtR).value();
    const std::pair<std::string, std::string> rows[] = {
        {"dimension", std::to_string(cfg.dimension)}, {"metric", metricName(cfg.metric)}};
    for (const auto& [key, value] : rows) {
        auto br = stmt.bindAll(key, value);
        if (!br)
            return br;
        auto er = stmt.execute();
        if (!er)
            return er;
        auto rr = stmt.reset();
        if (!rr)
            return rr;
    }
    return {};
}

class SqliteVectorStore final : public IVectorStore {
public:
    SqliteVectorStore(std::unique_ptr<ConnectionPool> pool, VectorStoreConfig cfg)
        : cfg_(std::move(cfg)), pool_(std::move(pool)) {}

    Result<void> initialize() override {
        auto r = pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto cr = db.execute(kCreateTables);
                if (!cr)
                    return cr;

                auto stmtR = db.prepare("SELECT key, value FROM vector_collection");
                if (!stmtR)
                    return stmtR.error();
                auto stmt = std::move(stmtR).value();
                std::map<std::string, std::string> params;
                while (true) {
                    auto step = stmt.step();
                    if (!step)
                        return step.error();
                    if (!step.value())
                        break;
                    params[stmt.columnText(0)] = stmt.columnText(1);
                }

                if (params.empty())
                    return writeCollectionParams(db, cfg_);

                const auto storedDim = params["dimension"];
                const auto storedMetric = params["metric"];
                if (storedDim != std::to_string(cfg_.dimension) ||
                    storedMetric != metricName(cfg_.metric)) {
                    return Error{ErrorCode::InvalidArgument,
                                 fmt::format("Vector collection is dim={} metric={}, configured "
                                             "dim={} metric={}; recreate the collection to change",
                                             storedDim, storedMetric, cfg_.dimension,
                                             metricName(cfg_.metric))};
                }
                return {};
            });
        });
        if (!r) {
            spdlog::error("[VectorStore] initialize failed for {}: {}", pool_->path(),
                          r.error().message);
            return r;
        }
        spdlog::info("[VectorStore] collection ready at {} (dim={}, metric={})", pool_->path(),
                     cfg_.dimension, metricName(cfg_.metric));
        return {};
    }

    Result<void> recreate() override {
        auto r = pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto dr = db.execute("DROP TABLE IF EXISTS vector_chunks;"
                                     "DROP TABLE IF EXISTS vector_collection;");
                if (!dr)
                    return dr;
                auto cr = db.execute(kCreateTables);
                if (!cr)
                    return cr;
                return writeCollectionParams(db, cfg_);
            });
        });
        if (r) {
            spdlog::warn("[VectorStore] collection at {} recreated (dim={}, metric={})",
                         pool_->path(), cfg_.dimension, metricName(cfg_.metric));
        }
        return r;
    }

    Result<void> upsert(const VectorRecord& record) override {
        return upsertBatch({record});
    }

    Result<void> upsertBatch(const std::vector<VectorRecord>& records) override {
        for (const auto& record : records) {
            if (record.chunk_id.empty()) {
                return Error{ErrorCode::InvalidArgument, "Vector record requires a chunk_id"};
            }
            if (record.embedding.size() != cfg_.dimension) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("Embedding dimension {} does not match collection "
                                         "dimension {}",
                                         record.embedding.size(), cfg_.dimension)};
            }
        }
        if (records.empty())
            return {};

        return pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto stmtR = db.prepare(R"(
                    INSERT INTO vector_chunks (chunk_id, doc_id, content, embedding, metadata,
                                               updated_at)
                    VALUES (?, ?, ?, ?, ?, ?)
                    ON CONFLICT(chunk_id) DO UPDATE SET
                        doc_id = excluded.doc_id,
                        content = excluded.content,
                        embedding = excluded.embedding,
                        metadata = excluded.metadata,
                        updated_at = excluded.updated_at
                )");
                if (!stmtR)
                    return stmtR.error();
                auto stmt = std::move(stmtR).value();
                const auto now = nowMillis();
                for (const auto& record : records) {
                    const auto blob = vectorToBlob(record.embedding);
                    auto br = stmt.bindAll(record.chunk_id, record.doc_id, record.content,
                                           std::span<const std::byte>(blob),
                                           metadataToJson(record.metadata),
                                           static_cast<int64_t>(now));
                    if (!br)
                        return br;
                    auto er = stmt.execute();
                    if (!er)
                        return er;
                    auto rr = stmt.reset();
                    if (!rr)
                        return rr;
                }
                return {};
            });
        });
    }

    Result<size_t> deleteByDocument(const std::string& docId) override {
        return pool_->withConnection([&](Database& db) -> Result<size_t> {
            auto stmtR = db.prepare("DELETE FROM vector_chunks WHERE doc_id = ?");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, docId);
            if (!br)
                return br.error();
            auto er = stmt.execute();
            if (!er)
                return er.error();
            return static_cast<size_t>(db.changes());
        });
    }

    Result<std::vector<VectorRecord>> search(const std::vector<float>& query, size_t k,
                                             const VectorFilter& filter) override {
        if (query.size() != cfg_.dimension) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Query dimension {} does not match collection dimension {}",
                                     query.size(), cfg_.dimension)};
        }
        if (k == 0)
            return std::vector<VectorRecord>{};

        auto rowsR = pool_->withConnection([&](Database& db) -> Result<std::vector<VectorRecord>> {
            std::string sql =
                "SELECT chunk_id, doc_id, content, embedding, metadata FROM vector_chunks";
            if (filter.docId)
                sql += " WHERE doc_id = ?";
            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            if (filter.docId) {
                auto br = stmt.bind(1, *filter.docId);
                if (!br)
                    return br.error();
            }
            std::vector<VectorRecord> rows;
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                auto record = readRecord(stmt);
                if (record.embedding.size() != cfg_.dimension) {
                    spdlog::warn("[VectorStore] skipping {}: stored dimension {}",
                                 record.chunk_id, record.embedding.size());
                    continue;
                }
                if (!filter.matches(record))
                    continue;
                record.score = similarity(query, record.embedding, cfg_.metric);
                rows.push_back(std::move(record));
            }
            return rows;
        });
        if (!rowsR)
            return rowsR.error();

        auto rows = std::move(rowsR).value();
        auto byScore = [](const VectorRecord& a, const VectorRecord& b) {
            if (a.score != b.score)
                return a.score > b.score;
            return a.chunk_id < b.chunk_id;
        };
        if (rows.size() > k) {
            std::partial_sort(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(k),
                              rows.end(), byScore);
            rows.resize(k);
        } else {
            std::sort(rows.begin(), rows.end(), byScore);
        }
        return rows;
    }

    Result<std::optional<VectorRecord>> get(const std::string& chunkId) override {
        return pool_->withConnection([&](Database& db) -> Result<std::optional<VectorRecord>> {
            auto stmtR = db.prepare("SELECT chunk_id, doc_id, content, embedding, metadata "
                                    "FROM vector_chunks WHERE chunk_id = ?");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, chunkId);
            if (!br)
                return br.error();
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                return std::optional<VectorRecord>{};
            return std::optional<VectorRecord>{readRecord(stmt)};
        });
    }

    Result<size_t> count() override {
        return pool_->withConnection([&](Database& db) -> Result<size_t> {
            auto stmtR = db.prepare("SELECT COUNT(*) FROM vector_chunks");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto step = stmt.step();
            if (!step)
                return step.error();
            return static_cast<size_t>(step.value() ? stmt.columnInt64(0) : 0);
        });
    }

    size_t dimension() const override { return cfg_.dimension; }
    DistanceMetric metric() const override { return cfg_.metric; }

private:
    VectorStoreConfig cfg_;
    std::unique_ptr<ConnectionPool> pool_;
};

} // namespace

Result<std::unique_ptr<IVectorStore>> makeSqliteVectorStore(const std::string& dbPath,
                                                            const VectorStoreConfig& cfg) {
    if (!cfg.isValid()) {
        return Error{ErrorCode::InvalidArgument, "Invalid vector store configuration"};
    }
    ConnectionPoolConfig pcfg;
    pcfg.minConnections = 1;
    pcfg.maxConnections = cfg.maxConnections;
    pcfg.enableWAL = cfg.enableWal;
    pcfg.busyTimeout = cfg.busyTimeout;
    auto pool = std::make_unique<ConnectionPool>(dbPath, pcfg);
    auto r = pool->initialize();
    if (!r)
        return r.error();
    return std::unique_ptr<IVectorStore>(std::make_unique<SqliteVectorStore>(std::move(pool), cfg));
}

} // namespace kgrag::vector
