#pragma once

#include <kgrag/storage/database.h>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace kgrag::storage {

/**
 * @brief One versioned change to a component's tables
 *
 * @c sql runs first, then @c apply when set. Both commit together with the version row.
 */
struct SchemaStep {
    int version = 0;
    std::string description;
    std::string sql;
    std::function<Result<void>(Database&)> apply;
};

/// Highest version recorded for @p component, 0 when none.
Result<int> schemaVersion(Database& db, std::string_view component);

/**
 * @brief Applies every step of @p component newer than its recorded version
 *
 * Versions are tracked per component in the kgrag_schema table, so several stores may
 * share one database file. @p steps must be in strictly increasing version order.
 * Stops at the first failing step, leaving earlier steps committed.
 *
 * @return the version the component is at afterwards
 */
Result<int> upgradeSchema(Database& db, std::string_view component,
                          std::span<const SchemaStep> steps);

} // namespace kgrag::storage
