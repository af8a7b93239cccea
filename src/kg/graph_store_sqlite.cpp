#include <kgrag/kg/graph_store.h>
#include <kgrag/kg/identity.h>
#include <kgrag/storage/connection_pool.h>
#include <kgrag/storage/database.h>
#include <kgrag/storage/migration.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kgrag::kg {

using storage::ConnectionPool;
using storage::ConnectionPoolConfig;
using storage::Database;
using storage::SchemaStep;
using storage::Statement;

namespace {

inline ConnectionPoolConfig toPoolConfig(const GraphStoreConfig& cfg) {
    ConnectionPoolConfig pcfg;
    pcfg.minConnections = cfg.minConnections;
    pcfg.maxConnections = cfg.maxConnections;
    pcfg.enableWAL = cfg.enableWal;
    pcfg.enableForeignKeys = true;
    pcfg.busyTimeout = cfg.busyTimeout;
    return pcfg;
}

std::vector<SchemaStep> graphSchema() {
    std::vector<SchemaStep> steps;

    steps.push_back(SchemaStep{1, "Create knowledge graph tables", R"(
        CREATE TABLE IF NOT EXISTS kg_nodes (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            type TEXT NOT NULL DEFAULT 'Concept',
            description TEXT NOT NULL DEFAULT '',
            scope TEXT NOT NULL DEFAULT '',
            score REAL NOT NULL DEFAULT 1.0,
            chapter TEXT NOT NULL DEFAULT '',
            subchapter TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_kg_nodes_name ON kg_nodes(name COLLATE NOCASE);
        CREATE INDEX IF NOT EXISTS idx_kg_nodes_type ON kg_nodes(type);

        CREATE TABLE IF NOT EXISTS kg_node_aliases (
            node_id TEXT NOT NULL REFERENCES kg_nodes(id) ON DELETE CASCADE,
            alias TEXT NOT NULL,
            alias_lower TEXT NOT NULL,
            PRIMARY KEY (node_id, alias)
        );
        CREATE INDEX IF NOT EXISTS idx_kg_node_aliases_lower ON kg_node_aliases(alias_lower);

        CREATE TABLE IF NOT EXISTS kg_node_scopes (
            node_id TEXT NOT NULL REFERENCES kg_nodes(id) ON DELETE CASCADE,
            scope TEXT NOT NULL,
            PRIMARY KEY (node_id, scope)
        );
        CREATE INDEX IF NOT EXISTS idx_kg_node_scopes_scope ON kg_node_scopes(scope);

        CREATE TABLE IF NOT EXISTS kg_edges (
            rid TEXT PRIMARY KEY,
            type TEXT NOT NULL,
            type_label TEXT NOT NULL DEFAULT '',
            source_id TEXT NOT NULL REFERENCES kg_nodes(id),
            target_id TEXT NOT NULL REFERENCES kg_nodes(id),
            description TEXT NOT NULL DEFAULT '',
            evidence TEXT NOT NULL DEFAULT '',
            confidence REAL NOT NULL DEFAULT 0.8,
            weight REAL NOT NULL DEFAULT 1.0,
            scope TEXT NOT NULL,
            src_section TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_kg_edges_scope ON kg_edges(scope);
        CREATE INDEX IF NOT EXISTS idx_kg_edges_source ON kg_edges(source_id);
        CREATE INDEX IF NOT EXISTS idx_kg_edges_target ON kg_edges(target_id);
    )",
                                   {}});

    steps.push_back(SchemaStep{2, "Create chunk mention table", R"(
        CREATE TABLE IF NOT EXISTS kg_chunk_mentions (
            chunk_id TEXT NOT NULL,
            doc_id TEXT NOT NULL,
            node_id TEXT NOT NULL REFERENCES kg_nodes(id) ON DELETE CASCADE,
            confidence REAL NOT NULL DEFAULT 1.0,
            PRIMARY KEY (chunk_id, node_id)
        );
        CREATE INDEX IF NOT EXISTS idx_kg_chunk_mentions_doc ON kg_chunk_mentions(doc_id);
        CREATE INDEX IF NOT EXISTS idx_kg_chunk_mentions_node ON kg_chunk_mentions(node_id);
    )",
                                   {}});

    steps.push_back(SchemaStep{3, "Create book membership table", R"(
        CREATE TABLE IF NOT EXISTS kg_book_sections (
            book_id TEXT NOT NULL,
            section_id TEXT NOT NULL,
            added_at INTEGER NOT NULL,
            PRIMARY KEY (book_id, section_id)
        );
    )",
                                   {}});

    return steps;
}

constexpr const char* kNodeColumns =
    "n.id, n.name, n.type, n.description, n.scope, n.score, n.chapter, n.subchapter, "
    "n.created_at, n.updated_at";

constexpr const char* kEdgeColumns =
    "rid, type, type_label, source_id, target_id, description, evidence, confidence, weight, "
    "scope, src_section, created_at, updated_at";

KgNode readNode(const Statement& stmt) {
    KgNode node;
    node.id = stmt.columnText(0);
    node.name = stmt.columnText(1);
    node.type = stmt.columnText(2);
    node.description = stmt.columnText(3);
    node.scope = stmt.columnText(4);
    node.score = stmt.columnDouble(5);
    node.chapter = stmt.columnText(6);
    node.subchapter = stmt.columnText(7);
    node.createdAt = stmt.columnInt64(8);
    node.updatedAt = stmt.columnInt64(9);
    return node;
}

KgEdge readEdge(const Statement& stmt) {
    KgEdge edge;
    edge.rid = stmt.columnText(0);
    const auto typeName = stmt.columnText(1);
    edge.type = relationTypeFromName(typeName).value_or(RelationType::Related);
    edge.typeLabel = stmt.columnText(2);
    edge.sourceId = stmt.columnText(3);
    edge.targetId = stmt.columnText(4);
    edge.description = stmt.columnText(5);
    edge.evidence = stmt.columnText(6);
    edge.confidence = stmt.columnDouble(7);
    edge.weight = stmt.columnDouble(8);
    edge.scope = stmt.columnText(9);
    edge.srcSection = stmt.columnText(10);
    edge.createdAt = stmt.columnInt64(11);
    edge.updatedAt = stmt.columnInt64(12);
    return edge;
}

// Collect all rows of a prepared node query and hydrate their aliases
Result<std::vector<KgNode>> collectNodes(Database& db, Statement& stmt) {
    std::vector<KgNode> nodes;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        nodes.push_back(readNode(stmt));
    }
    if (nodes.empty())
        return nodes;

    auto aliasStmtR = db.prepare("SELECT alias FROM kg_node_aliases WHERE node_id = ? ORDER BY alias");
    if (!aliasStmtR)
        return aliasStmtR.error();
    auto aliasStmt = std::move(aliasStmtR).value();
    for (auto& node : nodes) {
        auto br = aliasStmt.bind(1, node.id);
        if (!br)
            return br.error();
        while (true) {
            auto step = aliasStmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            node.aliases.push_back(aliasStmt.columnText(0));
        }
        auto rr = aliasStmt.reset();
        if (!rr)
            return rr.error();
    }
    return nodes;
}

Result<std::vector<KgEdge>> collectEdges(Statement& stmt) {
    std::vector<KgEdge> edges;
    while (true) {
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            break;
        edges.push_back(readEdge(stmt));
    }
    return edges;
}

Result<bool> rowExists(Database& db, const char* sql, const std::string& key) {
    auto stmtR = db.prepare(sql);
    if (!stmtR)
        return stmtR.error();
    auto stmt = std::move(stmtR).value();
    auto br = stmt.bind(1, key);
    if (!br)
        return br.error();
    return stmt.step();
}

Result<std::int64_t> countQuery(Database& db, const std::string& sql,
                                const std::optional<std::string>& scope) {
    auto stmtR = db.prepare(sql);
    if (!stmtR)
        return stmtR.error();
    auto stmt = std::move(stmtR).value();
    if (scope) {
        auto br = stmt.bind(1, *scope);
        if (!br)
            return br.error();
    }
    auto step = stmt.step();
    if (!step)
        return step.error();
    return step.value() ? stmt.columnInt64(0) : std::int64_t{0};
}

} // namespace

double entityMatchScore(const KgNode& node, std::string_view q) {
    if (q.empty())
        return 0.0;
    const auto name = toLowerAscii(node.name);
    if (name == q)
        return 1.0;

    std::vector<std::string> aliases;
    aliases.reserve(node.aliases.size());
    for (const auto& a : node.aliases)
        aliases.push_back(toLowerAscii(a));
    if (std::find(aliases.begin(), aliases.end(), q) != aliases.end())
        return 0.9;

    if (name.rfind(q, 0) == 0)
        return 0.8;
    if (name.find(q) != std::string::npos)
        return 0.7;
    if (toLowerAscii(node.description).find(q) != std::string::npos)
        return 0.6;

    const bool aliasContains = std::any_of(aliases.begin(), aliases.end(), [&](const auto& a) {
        return a.find(q) != std::string::npos;
    });
    if (aliasContains || (!name.empty() && q.find(name) != std::string_view::npos))
        return 0.5;
    return 0.0;
}

class SqliteGraphStore final : public GraphStore {
public:
    SqliteGraphStore(std::unique_ptr<ConnectionPool> pool, GraphStoreConfig cfg)
        : cfg_(std::move(cfg)), pool_(std::move(pool)) {}

    static Result<std::unique_ptr<SqliteGraphStore>> create(const std::string& dbPath,
                                                            const GraphStoreConfig& cfg) {
        auto pool = std::make_unique<ConnectionPool>(dbPath, toPoolConfig(cfg));
        auto rInit = pool->initialize();
        if (!rInit)
            return rInit.error();

        auto rMig = pool->withConnection([](Database& db) -> Result<int> {
            return storage::upgradeSchema(db, "graph", graphSchema());
        });
        if (!rMig) {
            spdlog::error("[GraphStore] schema migration failed for {}: {}", dbPath,
                          rMig.error().message);
            return rMig.error();
        }

        spdlog::info("[GraphStore] opened {}", dbPath);
        return std::make_unique<SqliteGraphStore>(std::move(pool), cfg);
    }

    // Writes

    Result<bool> upsertNode(const KgNode& node) override {
        if (node.id.empty() || node.name.empty()) {
            return Error{ErrorCode::InvalidArgument, "Node requires id and name"};
        }
        return pool_->withConnection([&](Database& db) -> Result<bool> {
            bool created = false;
            auto tr = db.transaction([&]() -> Result<void> {
                auto exists = rowExists(db, "SELECT 1 FROM kg_nodes WHERE id = ?", node.id);
                if (!exists)
                    return exists.error();
                created = !exists.value();

                const auto now = nowMillis();
                auto stmtR = db.prepare(R"(
                    INSERT INTO kg_nodes (id, name, type, description, scope, score, chapter,
                                          subchapter, created_at, updated_at)
                    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
                    ON CONFLICT(id) DO UPDATE SET
                        name = excluded.name,
                        type = excluded.type,
                        description = excluded.description,
                        scope = excluded.scope,
                        score = excluded.score,
                        chapter = excluded.chapter,
                        subchapter = excluded.subchapter,
                        updated_at = excluded.updated_at
                )");
                if (!stmtR)
                    return stmtR.error();
                auto stmt = std::move(stmtR).value();
                auto br = stmt.bindAll(node.id, node.name, node.type, node.description, node.scope,
                                       node.score, node.chapter, node.subchapter,
                                       node.createdAt > 0 ? node.createdAt : now,
                                       node.updatedAt > 0 ? node.updatedAt : now);
                if (!br)
                    return br;
                auto er = stmt.execute();
                if (!er)
                    return er;

                auto delR = db.prepare("DELETE FROM kg_node_aliases WHERE node_id = ?");
                if (!delR)
                    return delR.error();
                auto del = std::move(delR).value();
                br = del.bind(1, node.id);
                if (!br)
                    return br;
                er = del.execute();
                if (!er)
                    return er;

                if (!node.aliases.empty()) {
                    auto insR = db.prepare("INSERT OR IGNORE INTO kg_node_aliases (node_id, alias, "
                                           "alias_lower) VALUES (?, ?, ?)");
                    if (!insR)
                        return insR.error();
                    auto ins = std::move(insR).value();
                    for (const auto& alias : node.aliases) {
                        br = ins.bindAll(node.id, alias, toLowerAscii(alias));
                        if (!br)
                            return br;
                        er = ins.execute();
                        if (!er)
                            return er;
                        auto rr = ins.reset();
                        if (!rr)
                            return rr;
                    }
                }

                if (!node.scope.empty()) {
                    auto memR = db.prepare(
                        "INSERT OR IGNORE INTO kg_node_scopes (node_id, scope) VALUES (?, ?)");
                    if (!memR)
                        return memR.error();
                    auto mem = std::move(memR).value();
                    br = mem.bindAll(node.id, node.scope);
                    if (!br)
                        return br;
                    return mem.execute();
                }
                return {};
            });
            if (!tr)
                return tr.error();
            return created;
        });
    }

    Result<bool> upsertEdge(const KgEdge& edge) override {
        if (edge.rid.empty() || edge.sourceId.empty() || edge.targetId.empty() ||
            edge.scope.empty()) {
            return Error{ErrorCode::InvalidArgument, "Edge requires rid, endpoints and scope"};
        }
        return pool_->withConnection([&](Database& db) -> Result<bool> {
            bool created = false;
            auto tr = db.transaction([&]() -> Result<void> {
                auto exists = rowExists(db, "SELECT 1 FROM kg_edges WHERE rid = ?", edge.rid);
                if (!exists)
                    return exists.error();
                created = !exists.value();

                const auto now = nowMillis();
                auto stmtR = db.prepare(R"(
                    INSERT INTO kg_edges (rid, type, type_label, source_id, target_id, description,
                                          evidence, confidence, weight, scope, src_section,
                                          created_at, updated_at)
                    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
                    ON CONFLICT(rid) DO UPDATE SET
                        type_label = excluded.type_label,
                        description = excluded.description,
                        evidence = excluded.evidence,
                        confidence = excluded.confidence,
                        weight = excluded.weight,
                        src_section = excluded.src_section,
                        updated_at = excluded.updated_at
                )");
                if (!stmtR)
                    return stmtR.error();
                auto stmt = std::move(stmtR).value();
                auto br = stmt.bindAll(edge.rid, relationTypeName(edge.type), edge.typeLabel,
                                       edge.sourceId, edge.targetId, edge.description,
                                       edge.evidence, edge.confidence, edge.weight, edge.scope,
                                       edge.srcSection, edge.createdAt > 0 ? edge.createdAt : now,
                                       edge.updatedAt > 0 ? edge.updatedAt : now);
                if (!br)
                    return br;
                return stmt.execute();
            });
            if (!tr)
                return tr.error();
            return created;
        });
    }

    Result<std::int64_t> deleteByScope(std::string_view scope) override {
        if (scope.empty()) {
            return Error{ErrorCode::InvalidArgument, "Scope must not be empty"};
        }
        const std::string key(scope);
        return pool_->withConnection([&](Database& db) -> Result<std::int64_t> {
            std::int64_t deleted = 0;
            auto tr = db.transaction([&]() -> Result<void> {
                auto stmtR = db.prepare("DELETE FROM kg_edges WHERE scope = ?");
                if (!stmtR)
                    return stmtR.error();
                auto stmt = std::move(stmtR).value();
                auto br = stmt.bind(1, key);
                if (!br)
                    return br;
                auto er = stmt.execute();
                if (!er)
                    return er;
                deleted = db.changes();

                auto memR = db.prepare("DELETE FROM kg_node_scopes WHERE scope = ?");
                if (!memR)
                    return memR.error();
                auto mem = std::move(memR).value();
                br = mem.bind(1, key);
                if (!br)
                    return br;
                return mem.execute();
            });
            if (!tr)
                return tr.error();
            return deleted;
        });
    }

    StoreStats writeGraph(const KgGraph& graph, const std::string& scope) override {
        StoreStats stats;
        stats.attempted = graph.nodes.size() + graph.edges.size();

        auto deleted = deleteByScope(scope);
        if (!deleted) {
            ++stats.errors;
            spdlog::warn("[GraphStore] clearing scope {} failed: {}", scope,
                         deleted.error().message);
        } else {
            stats.edgesDeleted = deleted.value();
        }

        for (const auto& node : graph.nodes) {
            KgNode scoped = node;
            scoped.scope = scope;
            auto r = upsertNode(scoped);
            if (!r) {
                ++stats.errors;
                spdlog::warn("[GraphStore] node {} not written: {}", node.id, r.error().message);
                continue;
            }
            ++stats.nodesWritten;
            if (r.value())
                ++stats.nodesCreated;
        }

        for (const auto& edge : graph.edges) {
            if (edge.scope != scope) {
                ++stats.errors;
                spdlog::warn("[GraphStore] edge {} belongs to scope '{}', not {}", edge.rid,
                             edge.scope, scope);
                continue;
            }
            auto r = upsertEdge(edge);
            if (!r) {
                ++stats.errors;
                spdlog::warn("[GraphStore] edge {} not written: {}", edge.rid, r.error().message);
                continue;
            }
            ++stats.edgesWritten;
            if (r.value())
                ++stats.edgesCreated;
        }

        if (cfg_.pruneOrphans) {
            auto pruned = pruneOrphans();
            if (!pruned) {
                ++stats.errors;
                spdlog::warn("[GraphStore] orphan pruning failed: {}", pruned.error().message);
            } else {
                stats.orphansPruned = pruned.value();
            }
        }

        stats.success = stats.errors == 0;
        spdlog::debug("[GraphStore] wrote {}: {} nodes ({} new), {} edges ({} new), {} deleted, "
                      "{} pruned, {} errors",
                      scope, stats.nodesWritten, stats.nodesCreated, stats.edgesWritten,
                      stats.edgesCreated, stats.edgesDeleted, stats.orphansPruned, stats.errors);
        return stats;
    }

    Result<std::int64_t> pruneOrphans() override {
        return pool_->withConnection([&](Database& db) -> Result<std::int64_t> {
            auto stmtR = db.prepare(R"(
                DELETE FROM kg_nodes
                WHERE NOT EXISTS (SELECT 1 FROM kg_node_scopes s WHERE s.node_id = kg_nodes.id)
                  AND NOT EXISTS (SELECT 1 FROM kg_edges e
                                  WHERE e.source_id = kg_nodes.id OR e.target_id = kg_nodes.id)
            )");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto er = stmt.execute();
            if (!er)
                return er.error();
            return static_cast<std::int64_t>(db.changes());
        });
    }

    // Reads

    Result<std::optional<KgNode>> getNode(std::string_view id) override {
        auto nodes = getNodes({std::string(id)});
        if (!nodes)
            return nodes.error();
        if (nodes.value().empty())
            return std::optional<KgNode>{};
        return std::optional<KgNode>{std::move(nodes.value().front())};
    }

    Result<std::vector<KgNode>> getNodes(const std::vector<std::string>& ids) override {
        return pool_->withConnection([&](Database& db) -> Result<std::vector<KgNode>> {
            std::vector<KgNode> out;
            auto stmtR =
                db.prepare(std::string("SELECT ") + kNodeColumns + " FROM kg_nodes n WHERE n.id = ?");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            for (const auto& id : ids) {
                auto br = stmt.bind(1, id);
                if (!br)
                    return br.error();
                auto rows = collectNodes(db, stmt);
                if (!rows)
                    return rows.error();
                for (auto& n : rows.value())
                    out.push_back(std::move(n));
                auto rr = stmt.reset();
                if (!rr)
                    return rr.error();
            }
            return out;
        });
    }

    Result<std::vector<KgNode>> findNodesByName(std::string_view name,
                                                std::optional<std::string> scope) override {
        const auto lowered = toLowerAscii(canonicalize(name));
        if (lowered.empty())
            return std::vector<KgNode>{};
        return pool_->withConnection([&](Database& db) -> Result<std::vector<KgNode>> {
            std::string sql = std::string("SELECT ") + kNodeColumns +
                              " FROM kg_nodes n WHERE (lower(n.name) = ?1 OR EXISTS (SELECT 1 FROM "
                              "kg_node_aliases a WHERE a.node_id = n.id AND a.alias_lower = ?1))";
            if (scope)
                sql += " AND EXISTS (SELECT 1 FROM kg_node_scopes s WHERE s.node_id = n.id AND "
                       "s.scope = ?2)";
            sql += " ORDER BY n.id";
            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, lowered);
            if (!br)
                return br.error();
            if (scope) {
                br = stmt.bind(2, *scope);
                if (!br)
                    return br.error();
            }
            return collectNodes(db, stmt);
        });
    }

    Result<std::vector<KgNode>> listNodes(std::optional<std::string> scope,
                                          std::size_t limit) override {
        const auto cap = static_cast<std::int64_t>(limit > 0 ? limit : cfg_.defaultLimit);
        return pool_->withConnection([&](Database& db) -> Result<std::vector<KgNode>> {
            std::string sql = std::string("SELECT ") + kNodeColumns + " FROM kg_nodes n";
            if (scope)
                sql += " JOIN kg_node_scopes s ON s.node_id = n.id WHERE s.scope = ?";
            sql += " ORDER BY n.id LIMIT ?";
            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = scope ? stmt.bindAll(*scope, cap) : stmt.bindAll(cap);
            if (!br)
                return br.error();
            return collectNodes(db, stmt);
        });
    }

    Result<KgGraph> loadScope(std::string_view scope) override {
        const std::string key(scope);
        auto nodes = listNodes(key, std::numeric_limits<std::int32_t>::max());
        if (!nodes)
            return nodes.error();

        auto edges = pool_->withConnection([&](Database& db) -> Result<std::vector<KgEdge>> {
            auto stmtR = db.prepare(std::string("SELECT ") + kEdgeColumns +
                                    " FROM kg_edges WHERE scope = ? ORDER BY rid");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, key);
            if (!br)
                return br.error();
            return collectEdges(stmt);
        });
        if (!edges)
            return edges.error();

        KgGraph graph;
        graph.nodes = std::move(nodes).value();
        graph.edges = std::move(edges).value();
        return graph;
    }

    Result<std::vector<EntityMatch>> searchEntities(std::string_view query,
                                                    const std::vector<std::string>& types,
                                                    std::optional<std::string> scope,
                                                    std::size_t limit) override {
        const auto q = toLowerAscii(canonicalize(query));
        if (q.empty())
            return std::vector<EntityMatch>{};

        auto candidates = pool_->withConnection([&](Database& db) -> Result<std::vector<KgNode>> {
            std::string sql = std::string("SELECT ") + kNodeColumns + R"( FROM kg_nodes n
                WHERE (instr(lower(n.name), ?1) > 0
                       OR instr(lower(n.description), ?1) > 0
                       OR instr(?1, lower(n.name)) > 0
                       OR EXISTS (SELECT 1 FROM kg_node_aliases a
                                  WHERE a.node_id = n.id AND instr(a.alias_lower, ?1) > 0)))";
            if (scope)
                sql += " AND EXISTS (SELECT 1 FROM kg_node_scopes s WHERE s.node_id = n.id AND "
                       "s.scope = ?2)";
            if (!types.empty()) {
                sql += " AND n.type IN (";
                for (std::size_t i = 0; i < types.size(); ++i)
                    sql += (i ? ", ?" : "?") + std::to_string(i + 3);
                sql += ")";
            }
            // Same tiers as entityMatchScore, so the cap never drops a better match
            sql += R"( ORDER BY CASE
                    WHEN lower(n.name) = ?1 THEN 0
                    WHEN EXISTS (SELECT 1 FROM kg_node_aliases a
                                 WHERE a.node_id = n.id AND a.alias_lower = ?1) THEN 1
                    WHEN substr(lower(n.name), 1, length(?1)) = ?1 THEN 2
                    WHEN instr(lower(n.name), ?1) > 0 THEN 3
                    WHEN instr(lower(n.description), ?1) > 0 THEN 4
                    ELSE 5 END, n.name, n.id)";
            sql += " LIMIT " + std::to_string(cfg_.defaultLimit);
            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, q);
            if (!br)
                return br.error();
            if (scope) {
                br = stmt.bind(2, *scope);
                if (!br)
                    return br.error();
            }
            for (std::size_t i = 0; i < types.size(); ++i) {
                br = stmt.bind(static_cast<int>(i + 3), types[i]);
                if (!br)
                    return br.error();
            }
            return collectNodes(db, stmt);
        });
        if (!candidates)
            return candidates.error();

        std::vector<EntityMatch> matches;
        for (auto& node : candidates.value()) {
            if (!types.empty() && std::find(types.begin(), types.end(), node.type) == types.end())
                continue;
            const double score = entityMatchScore(node, q);
            if (score <= 0.0)
                continue;
            matches.push_back(EntityMatch{std::move(node), score});
        }
        std::sort(matches.begin(), matches.end(), [](const auto& a, const auto& b) {
            if (a.score != b.score)
                return a.score > b.score;
            if (a.node.name != b.node.name)
                return a.node.name < b.node.name;
            return a.node.id < b.node.id;
        });
        if (limit > 0 && matches.size() > limit)
            matches.resize(limit);
        return matches;
    }

    Result<std::vector<KgEdge>> edgesAround(std::string_view nodeId,
                                            std::optional<std::string> scope,
                                            const std::vector<RelationType>& relTypes) override {
        const std::string id(nodeId);
        auto edges = pool_->withConnection([&](Database& db) -> Result<std::vector<KgEdge>> {
            std::string sql = std::string("SELECT ") + kEdgeColumns +
                              " FROM kg_edges WHERE (source_id = ?1 OR target_id = ?1)";
            if (scope)
                sql += " AND scope = ?2";
            sql += " ORDER BY rid";
            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, id);
            if (!br)
                return br.error();
            if (scope) {
                br = stmt.bind(2, *scope);
                if (!br)
                    return br.error();
            }
            return collectEdges(stmt);
        });
        if (!edges || relTypes.empty())
            return edges;

        std::vector<KgEdge> filtered;
        for (auto& e : edges.value()) {
            if (std::find(relTypes.begin(), relTypes.end(), e.type) != relTypes.end())
                filtered.push_back(std::move(e));
        }
        return filtered;
    }

    Result<GraphStats> getStats(std::optional<std::string> scope) override {
        return pool_->withConnection([&](Database& db) -> Result<GraphStats> {
            GraphStats stats;
            auto nodes = countQuery(db,
                                    scope ? "SELECT COUNT(*) FROM kg_node_scopes WHERE scope = ?"
                                          : "SELECT COUNT(*) FROM kg_nodes",
                                    scope);
            if (!nodes)
                return nodes.error();
            auto edges = countQuery(db,
                                    scope ? "SELECT COUNT(*) FROM kg_edges WHERE scope = ?"
                                          : "SELECT COUNT(*) FROM kg_edges",
                                    scope);
            if (!edges)
                return edges.error();
            auto mentions = countQuery(
                db,
                scope ? "SELECT COUNT(*) FROM kg_chunk_mentions m JOIN kg_node_scopes s ON "
                        "s.node_id = m.node_id WHERE s.scope = ?"
                      : "SELECT COUNT(*) FROM kg_chunk_mentions",
                scope);
            if (!mentions)
                return mentions.error();
            stats.nodeCount = nodes.value();
            stats.edgeCount = edges.value();
            stats.mentionCount = mentions.value();
            return stats;
        });
    }

    // Chunk mentions

    Result<void> upsertChunkMentions(const std::vector<ChunkMention>& mentions) override {
        if (mentions.empty())
            return {};
        return pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto stmtR = db.prepare(R"(
                    INSERT INTO kg_chunk_mentions (chunk_id, doc_id, node_id, confidence)
                    VALUES (?, ?, ?, ?)
                    ON CONFLICT(chunk_id, node_id) DO UPDATE SET
                        doc_id = excluded.doc_id,
                        confidence = excluded.confidence
                )");
                if (!stmtR)
                    return stmtR.error();
                auto stmt = std::move(stmtR).value();
                for (const auto& m : mentions) {
                    auto br = stmt.bindAll(m.chunkId, m.docId, m.nodeId, m.confidence);
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

    Result<std::vector<ChunkMention>>
    mentionsForChunks(const std::vector<std::string>& chunkIds) override {
        return pool_->withConnection([&](Database& db) -> Result<std::vector<ChunkMention>> {
            std::vector<ChunkMention> out;
            auto stmtR = db.prepare("SELECT chunk_id, doc_id, node_id, confidence FROM "
                                    "kg_chunk_mentions WHERE chunk_id = ? ORDER BY node_id");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            for (const auto& chunkId : chunkIds) {
                auto br = stmt.bind(1, chunkId);
                if (!br)
                    return br.error();
                while (true) {
                    auto step = stmt.step();
                    if (!step)
                        return step.error();
                    if (!step.value())
                        break;
                    out.push_back(ChunkMention{stmt.columnText(0), stmt.columnText(1),
                                               stmt.columnText(2), stmt.columnDouble(3)});
                }
                auto rr = stmt.reset();
                if (!rr)
                    return rr.error();
            }
            return out;
        });
    }

    Result<std::int64_t> deleteMentionsForDocument(std::string_view docId) override {
        const std::string key(docId);
        return pool_->withConnection([&](Database& db) -> Result<std::int64_t> {
            auto stmtR = db.prepare("DELETE FROM kg_chunk_mentions WHERE doc_id = ?");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, key);
            if (!br)
                return br.error();
            auto er = stmt.execute();
            if (!er)
                return er.error();
            return static_cast<std::int64_t>(db.changes());
        });
    }

    // Book membership

    Result<void> recordBookSections(std::string_view bookId,
                                    const std::vector<std::string>& sectionIds) override {
        const std::string book(bookId);
        return pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto stmtR = db.prepare("INSERT OR IGNORE INTO kg_book_sections (book_id, "
                                        "section_id, added_at) VALUES (?, ?, ?)");
                if (!stmtR)
                    return stmtR.error();
                auto stmt = std::move(stmtR).value();
                const auto now = nowMillis();
                for (const auto& sid : sectionIds) {
                    auto br = stmt.bindAll(book, sid, now);
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

    Result<std::vector<std::string>> bookSections(std::string_view bookId) override {
        const std::string book(bookId);
        return pool_->withConnection([&](Database& db) -> Result<std::vector<std::string>> {
            auto stmtR = db.prepare(
                "SELECT section_id FROM kg_book_sections WHERE book_id = ? ORDER BY section_id");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, book);
            if (!br)
                return br.error();
            std::vector<std::string> out;
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                out.push_back(stmt.columnText(0));
            }
            return out;
        });
    }

    Result<void> clearBookSections(std::string_view bookId) override {
        const std::string book(bookId);
        return pool_->withConnection([&](Database& db) -> Result<void> {
            auto stmtR = db.prepare("DELETE FROM kg_book_sections WHERE book_id = ?");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, book);
            if (!br)
                return br;
            return stmt.execute();
        });
    }

    Result<void> healthCheck() override {
        return pool_->withConnection([](Database& db) -> Result<void> {
            auto stmtR = db.prepare("PRAGMA integrity_check");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (step.value() && stmt.columnText(0) != "ok") {
                return Error{ErrorCode::CorruptedData, "Graph store integrity check failed"};
            }
            return {};
        });
    }

private:
    GraphStoreConfig cfg_{};
    std::unique_ptr<ConnectionPool> pool_;
};

Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const GraphStoreConfig& cfg) {
    auto s = SqliteGraphStore::create(dbPath, cfg);
    if (!s)
        return s.error();
    return std::unique_ptr<GraphStore>(std::move(s).value());
}

} // namespace kgrag::kg
