#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/database.hpp"

#include <QByteArray>
#include <QMutex>
#include <QString>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace konnect::storage {

/**
 * TrustedDevice - a paired peer and the certificate pinned when pairing.
 */
struct TrustedDevice {
    QString device_id;
    QString device_name;
    QByteArray certificate;  // DER
    QString fingerprint;
    Timestamp paired_at;
    int protocol_version{0};

    bool operator==(const TrustedDevice&) const = default;
};

/**
 * TrustStore - the set of paired peers.
 *
 * At most one record per device id. add() of an id that is already trusted
 * succeeds only when the certificate is byte-identical (a no-op); any other
 * certificate is refused with ErrorCode::TrustViolation and the stored
 * record is left untouched. Records disappear only through remove().
 *
 * Implementations are safe to call from any thread.
 */
class TrustStore {
public:
    virtual ~TrustStore() = default;

    [[nodiscard]] virtual std::optional<TrustedDevice> find(const QString& device_id) const = 0;
    [[nodiscard]] virtual std::vector<TrustedDevice> all() const = 0;

    /// Persist a new record. Returns only after the write is durable.
    [[nodiscard]] virtual Result<void, Error> add(const TrustedDevice& device) = 0;

    /// Delete the record; removing an unknown id is not an error.
    [[nodiscard]] virtual Result<void, Error> remove(const QString& device_id) = 0;

    [[nodiscard]] bool contains(const QString& device_id) const {
        return find(device_id).has_value();
    }
};

/**
 * InMemoryTrustStore - volatile store for tests and ephemeral runs.
 */
class InMemoryTrustStore : public TrustStore {
public:
    [[nodiscard]] std::optional<TrustedDevice> find(const QString& device_id) const override;
    [[nodiscard]] std::vector<TrustedDevice> all() const override;
    [[nodiscard]] Result<void, Error> add(const TrustedDevice& device) override;
    [[nodiscard]] Result<void, Error> remove(const QString& device_id) override;

protected:
    // Hooks run under the lock before the cache changes; a failing hook
    // leaves the cache unchanged.
    [[nodiscard]] virtual Result<void, Error> persist_add(const TrustedDevice&) {
        return Result<void, Error>::ok();
    }
    [[nodiscard]] virtual Result<void, Error> persist_remove(const QString&) {
        return Result<void, Error>::ok();
    }

    void load_cache(std::vector<TrustedDevice> devices);

private:
    mutable QMutex mu_;
    std::map<QString, TrustedDevice> devices_;
};

/**
 * SqliteTrustStore - trusted_devices table in an SQLite file.
 *
 * Loaded into memory on open(); every add/remove is committed in its own
 * transaction before the call returns.
 */
class SqliteTrustStore : public InMemoryTrustStore {
public:
    [[nodiscard]] static Result<std::unique_ptr<SqliteTrustStore>, Error> open(const QString& path);
    [[nodiscard]] static Result<std::unique_ptr<SqliteTrustStore>, Error> open_memory();

protected:
    [[nodiscard]] Result<void, Error> persist_add(const TrustedDevice& device) override;
    [[nodiscard]] Result<void, Error> persist_remove(const QString& device_id) override;

private:
    explicit SqliteTrustStore(Database db) : db_(std::move(db)) {}

    [[nodiscard]] static Result<std::unique_ptr<SqliteTrustStore>, Error> init(Database db);
    [[nodiscard]] Result<std::vector<TrustedDevice>, Error> load_rows();

    Database db_;
};

} // namespace konnect::storage
