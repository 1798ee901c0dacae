#include "storage/migrations.hpp"

#include "core/logging.hpp"
#include "storage/database.hpp"

namespace konnect::storage {

const std::vector<Migration>& trust_schema() {
    static const std::vector<Migration> migrations = {
        {
            1,
            "trusted_devices",
            // Name and protocol version are as seen when pairing; the version
            // lets the transport refuse later downgrades.
            R"SQL(
                CREATE TABLE trusted_devices (
                    device_id TEXT PRIMARY KEY,
                    device_name TEXT NOT NULL DEFAULT '',
                    certificate BLOB NOT NULL,
                    fingerprint TEXT NOT NULL,
                    paired_at INTEGER NOT NULL,
                    protocol_version INTEGER NOT NULL DEFAULT 0
                );
            )SQL",
        },
    };
    return migrations;
}

int latest_schema_version() {
    return trust_schema().back().version;
}

Res<void> migrate(Database& db) {
    auto version = db.user_version();
    if (version.is_err()) {
        return Res<void>::err(version.unwrap_err());
    }
    const int current = version.unwrap();
    const int latest = latest_schema_version();
    if (current > latest) {
        return fail(ErrorCode::Storage, "trust database has schema version " + std::to_string(current) +
                                            ", newer than supported " + std::to_string(latest));
    }
    if (current == latest) {
        return Res<void>::ok();
    }

    return db.transaction([&]() -> Res<void> {
        for (const auto& m : trust_schema()) {
            if (m.version <= current) {
                continue;
            }
            auto applied = db.execute(m.up_sql);
            if (applied.is_err()) {
                return fail(ErrorCode::Storage, "migration " + std::to_string(m.version) + " (" +
                                                    m.name + ") failed: " + applied.unwrap_err().message);
            }
            qCDebug(konnectTrustLog) << "Applied trust schema migration" << m.version << m.name;
        }
        return db.set_user_version(latest);
    });
}

} // namespace konnect::storage
