#include <kgrag/storage/migration.h>

#include <spdlog/spdlog.h>

namespace kgrag::storage {

namespace {

constexpr const char* kSchemaTable = R"(
    CREATE TABLE IF NOT EXISTS kgrag_schema (
        component TEXT NOT NULL,
        version INTEGER NOT NULL,
        description TEXT NOT NULL,
        applied_at INTEGER NOT NULL,
        PRIMARY KEY (component, version)
    )
)";

Result<void> applyStep(Database& db, std::string_view component, const SchemaStep& step) {
    return db.transaction([&]() -> Result<void> {
        if (!step.sql.empty()) {
            auto r = db.execute(step.sql);
            if (!r)
                return r;
        }
        if (step.apply) {
            auto r = step.apply(db);
            if (!r)
                return r;
        }
        auto stmtR = db.prepare("INSERT INTO kgrag_schema (component, version, description, "
                                "applied_at) VALUES (?, ?, ?, ?)");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(component, step.version, step.description, nowMillis());
        if (!br)
            return br;
        return stmt.execute();
    });
}

} // namespace

Result<int> schemaVersion(Database& db, std::string_view component) {
    auto created = db.execute(kSchemaTable);
    if (!created)
        return created.error();

    auto stmtR = db.prepare("SELECT COALESCE(MAX(version), 0) FROM kgrag_schema "
                            "WHERE component = ?");
    if (!stmtR)
        return stmtR.error();
    auto stmt = std::move(stmtR).value();
    auto br = stmt.bind(1, component);
    if (!br)
        return br.error();
    auto row = stmt.step();
    if (!row)
        return row.error();
    return row.value() ? static_cast<int>(stmt.columnInt64(0)) : 0;
}

Result<int> upgradeSchema(Database& db, std::string_view component,
                          std::span<const SchemaStep> steps) {
    for (std::size_t i = 1; i < steps.size(); ++i) {
        if (steps[i].version <= steps[i - 1].version) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("{} schema step {} is out of order after {}", component,
                                     steps[i].version, steps[i - 1].version)};
        }
    }

    auto current = schemaVersion(db, component);
    if (!current)
        return current.error();
    int version = current.value();

    for (const auto& step : steps) {
        if (step.version <= version)
            continue;
        auto applied = applyStep(db, component, step);
        if (!applied) {
            spdlog::error("[Schema] {} v{} ({}) failed: {}", component, step.version,
                          step.description, applied.error().message);
            return applied.error();
        }
        version = step.version;
        spdlog::debug("[Schema] {} at v{} ({})", component, version, step.description);
    }
    return version;
}

} // namespace kgrag::storage
