#pragma once

#include "core/result.hpp"

#include <vector>

namespace konnect::storage {

class Database;

/// One forward step of the trust database schema.
struct Migration {
    int version;
    const char* name;
    const char* up_sql;
};

/// Ordered by version, starting at 1.
[[nodiscard]] const std::vector<Migration>& trust_schema();

[[nodiscard]] int latest_schema_version();

/**
 * Apply every migration newer than the database's user_version in a single
 * transaction. A database written by a newer release (user_version above
 * latest_schema_version()) is refused rather than modified.
 */
[[nodiscard]] Res<void> migrate(Database& db);

} // namespace konnect::storage
