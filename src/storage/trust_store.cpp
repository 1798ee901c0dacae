#include "storage/trust_store.hpp"
#include "storage/migrations.hpp"
#include "crypto/certificate.hpp"

#include <QDir>
#include <QFileInfo>

namespace konnect::storage {

// ============================================================================
// InMemoryTrustStore
// ============================================================================

std::optional<TrustedDevice> InMemoryTrustStore::find(const QString& device_id) const {
    QMutexLocker lock(&mu_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

std::vector<TrustedDevice> InMemoryTrustStore::all() const {
    QMutexLocker lock(&mu_);
    std::vector<TrustedDevice> out;
    out.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        out.push_back(device);
    }
    return out;
}

Result<void, Error> InMemoryTrustStore::add(const TrustedDevice& device) {
    if (device.device_id.isEmpty() || device.certificate.isEmpty()) {
        return fail(ErrorCode::InvalidArgument, "trusted device needs an id and a certificate");
    }

    QMutexLocker lock(&mu_);
    auto it = devices_.find(device.device_id);
    if (it != devices_.end()) {
        if (crypto::same_certificate(it->second.certificate, device.certificate)) {
            return Result<void, Error>::ok();
        }
        return fail(ErrorCode::TrustViolation,
                    "device " + device.device_id.toStdString() +
                        " is already trusted with a different certificate");
    }

    auto persisted = persist_add(device);
    if (persisted.is_err()) return persisted;
    devices_.emplace(device.device_id, device);
    return Result<void, Error>::ok();
}

Result<void, Error> InMemoryTrustStore::remove(const QString& device_id) {
    QMutexLocker lock(&mu_);
    if (devices_.find(device_id) == devices_.end()) {
        return Result<void, Error>::ok();
    }
    auto persisted = persist_remove(device_id);
    if (persisted.is_err()) return persisted;
    devices_.erase(device_id);
    return Result<void, Error>::ok();
}

void InMemoryTrustStore::load_cache(std::vector<TrustedDevice> devices) {
    QMutexLocker lock(&mu_);
    devices_.clear();
    for (auto& device : devices) {
        auto id = device.device_id;
        devices_.emplace(std::move(id), std::move(device));
    }
}

// ============================================================================
// SqliteTrustStore
// ============================================================================

Result<std::unique_ptr<SqliteTrustStore>, Error> SqliteTrustStore::open(const QString& path) {
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return Result<std::unique_ptr<SqliteTrustStore>, Error>::err(
            Error{"cannot create " + info.absolutePath().toStdString(), ErrorCode::Storage});
    }
    auto db = Database::open(path);
    if (db.is_err()) {
        return Result<std::unique_ptr<SqliteTrustStore>, Error>::err(db.unwrap_err());
    }
    return init(std::move(db).unwrap());
}

Result<std::unique_ptr<SqliteTrustStore>, Error> SqliteTrustStore::open_memory() {
    auto db = Database::open_memory();
    if (db.is_err()) {
        return Result<std::unique_ptr<SqliteTrustStore>, Error>::err(db.unwrap_err());
    }
    return init(std::move(db).unwrap());
}

Result<std::unique_ptr<SqliteTrustStore>, Error> SqliteTrustStore::init(Database db) {
    using R = Result<std::unique_ptr<SqliteTrustStore>, Error>;

    auto migrated = migrate(db);
    if (migrated.is_err()) return R::err(migrated.unwrap_err());

    std::unique_ptr<SqliteTrustStore> store(new SqliteTrustStore(std::move(db)));
    auto rows = store->load_rows();
    if (rows.is_err()) return R::err(rows.unwrap_err());
    store->load_cache(std::move(rows).unwrap());
    return R::ok(std::move(store));
}

Result<std::vector<TrustedDevice>, Error> SqliteTrustStore::load_rows() {
    using R = Result<std::vector<TrustedDevice>, Error>;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT device_id, device_name, certificate, fingerprint, paired_at, protocol_version
        FROM trusted_devices ORDER BY device_id;
    )SQL");
    if (stmt_result.is_err()) return R::err(stmt_result.unwrap_err());
    auto stmt = std::move(stmt_result).unwrap();

    std::vector<TrustedDevice> devices;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) return R::err(step_result.unwrap_err());
        if (!step_result.unwrap()) break;

        devices.push_back(TrustedDevice{
            .device_id = stmt.text(0),
            .device_name = stmt.text(1),
            .certificate = stmt.blob(2),
            .fingerprint = stmt.text(3),
            .paired_at = Timestamp(stmt.integer(4)),
            .protocol_version = static_cast<int>(stmt.integer(5)),
        });
    }
    return R::ok(std::move(devices));
}

Result<void, Error> SqliteTrustStore::persist_add(const TrustedDevice& device) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare(R"SQL(
            INSERT INTO trusted_devices
                (device_id, device_name, certificate, fingerprint, paired_at, protocol_version)
            VALUES (?, ?, ?, ?, ?, ?);
        )SQL");
        if (stmt_result.is_err()) return Result<void, Error>::err(stmt_result.unwrap_err());
        auto stmt = std::move(stmt_result).unwrap();

        auto bound = stmt.bind(1, device.device_id)
                         .and_then([&] { return stmt.bind(2, device.device_name); })
                         .and_then([&] { return stmt.bind(3, device.certificate); })
                         .and_then([&] { return stmt.bind(4, device.fingerprint); })
                         .and_then([&] { return stmt.bind(5, device.paired_at.millis()); })
                         .and_then([&] { return stmt.bind(6, int64_t{device.protocol_version}); });
        if (bound.is_err()) return bound;

        auto step_result = stmt.step();
        if (step_result.is_err()) return Result<void, Error>::err(step_result.unwrap_err());
        return Result<void, Error>::ok();
    });
}

Result<void, Error> SqliteTrustStore::persist_remove(const QString& device_id) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare("DELETE FROM trusted_devices WHERE device_id = ?;");
        if (stmt_result.is_err()) return Result<void, Error>::err(stmt_result.unwrap_err());
        auto stmt = std::move(stmt_result).unwrap();

        auto bound = stmt.bind(1, device_id);
        if (bound.is_err()) return bound;

        auto step_result = stmt.step();
        if (step_result.is_err()) return Result<void, Error>::err(step_result.unwrap_err());
        return Result<void, Error>::ok();
    });
}

} // namespace konnect::storage
