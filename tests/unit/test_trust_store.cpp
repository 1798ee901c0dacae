#include <catch2/catch_test_macros.hpp>
#include "crypto/certificate.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/trust_store.hpp"

#include <QFile>

#include <QTemporaryDir>

using namespace konnect;
using namespace konnect::storage;

namespace {

TrustedDevice make_device(const QString& id, const QByteArray& der) {
    TrustedDevice device;
    device.device_id = id;
    device.device_name = QStringLiteral("Phone");
    device.certificate = der;
    device.fingerprint = crypto::fingerprint(der);
    device.paired_at = Timestamp(1700000000000);
    device.protocol_version = 8;
    return device;
}

void check_store_contract(TrustStore& store) {
    const QByteArray cert_a("certificate-a");
    const QByteArray cert_b("certificate-b");

    REQUIRE_FALSE(store.contains("b_1"));
    REQUIRE(store.all().empty());

    REQUIRE(store.add(make_device("b_1", cert_a)).is_ok());
    REQUIRE(store.contains("b_1"));
    REQUIRE(store.find("b_1")->certificate == cert_a);

    // Same certificate again is a no-op.
    REQUIRE(store.add(make_device("b_1", cert_a)).is_ok());
    REQUIRE(store.all().size() == 1);

    // A different certificate for a trusted id is refused and changes nothing.
    auto replaced = store.add(make_device("b_1", cert_b));
    REQUIRE(replaced.is_err());
    REQUIRE(replaced.unwrap_err().code == ErrorCode::TrustViolation);
    REQUIRE(store.find("b_1")->certificate == cert_a);

    REQUIRE(store.add(make_device("c_2", cert_b)).is_ok());
    REQUIRE(store.all().size() == 2);

    REQUIRE(store.remove("b_1").is_ok());
    REQUIRE_FALSE(store.contains("b_1"));
    REQUIRE(store.remove("b_1").is_ok());

    // After removal the id may be paired with a new certificate.
    REQUIRE(store.add(make_device("b_1", cert_b)).is_ok());
    REQUIRE(store.find("b_1")->certificate == cert_b);
}

} // namespace

TEST_CASE("TrustStore: in-memory contract", "[storage]") {
    InMemoryTrustStore store;
    check_store_contract(store);
}

TEST_CASE("TrustStore: sqlite contract", "[storage]") {
    auto store = SqliteTrustStore::open_memory();
    REQUIRE(store.is_ok());
    check_store_contract(*store.unwrap());
}

TEST_CASE("TrustStore: incomplete records are refused", "[storage]") {
    InMemoryTrustStore store;
    auto no_cert = store.add(make_device("b_1", QByteArray()));
    REQUIRE(no_cert.is_err());
    REQUIRE(no_cert.unwrap_err().code == ErrorCode::InvalidArgument);
    REQUIRE(store.add(make_device("", QByteArray("x"))).is_err());
}

TEST_CASE("TrustStore: sqlite survives reopen", "[storage]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("nested/trusted.db");
    const auto device = make_device("b_1", QByteArray("\x30\x82\x01\x00", 4));

    {
        auto store = SqliteTrustStore::open(path);
        REQUIRE(store.is_ok());
        REQUIRE(store.unwrap()->add(device).is_ok());
        REQUIRE(store.unwrap()->add(make_device("c_2", QByteArray("other"))).is_ok());
        REQUIRE(store.unwrap()->remove("c_2").is_ok());
    }

    auto reopened = SqliteTrustStore::open(path);
    REQUIRE(reopened.is_ok());
    const auto all = reopened.unwrap()->all();
    REQUIRE(all.size() == 1);
    REQUIRE(all.front() == device);
}

TEST_CASE("TrustStore: failed persistence leaves the cache unchanged", "[storage]") {
    class BrokenStore : public InMemoryTrustStore {
    protected:
        Result<void, Error> persist_add(const TrustedDevice&) override {
            return fail(ErrorCode::Storage, "disk full");
        }
    };

    BrokenStore store;
    auto added = store.add(make_device("b_1", QByteArray("cert")));
    REQUIRE(added.is_err());
    REQUIRE(added.unwrap_err().code == ErrorCode::Storage);
    REQUIRE_FALSE(store.contains("b_1"));
}

TEST_CASE("TrustStore: schema migrations", "[storage]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("trusted.db"));

    SECTION("An unversioned file gets the current schema") {
        auto store = SqliteTrustStore::open(path);
        REQUIRE(store.is_ok());
        REQUIRE(store.unwrap()->add(make_device("b_1", QByteArray("cert"))).is_ok());

        auto db = Database::open(path).unwrap();
        REQUIRE(db.user_version().unwrap() == latest_schema_version());
        auto columns = db.prepare("SELECT device_name, protocol_version FROM trusted_devices;");
        REQUIRE(columns.is_ok());
        REQUIRE(columns.unwrap().step().unwrap());
        REQUIRE(columns.unwrap().text(0) == "Phone");
    }

    SECTION("Reopening a current database changes nothing") {
        REQUIRE(SqliteTrustStore::open(path).is_ok());
        REQUIRE(SqliteTrustStore::open(path).is_ok());
        auto db = Database::open(path).unwrap();
        REQUIRE(db.user_version().unwrap() == latest_schema_version());
    }

    SECTION("A database from a newer release is refused untouched") {
        {
            auto db = Database::open(path).unwrap();
            REQUIRE(db.set_user_version(latest_schema_version() + 1).is_ok());
        }
        auto store = SqliteTrustStore::open(path);
        REQUIRE(store.is_err());
        REQUIRE(store.unwrap_err().code == ErrorCode::Storage);
        REQUIRE(Database::open(path).unwrap().user_version().unwrap() == latest_schema_version() + 1);
    }

    SECTION("New files are readable by the owner only") {
        REQUIRE(SqliteTrustStore::open(path).is_ok());
        const auto permissions = QFile::permissions(path);
        REQUIRE(permissions.testFlag(QFile::ReadOwner));
        REQUIRE_FALSE(permissions.testFlag(QFile::ReadOther));
        REQUIRE_FALSE(permissions.testFlag(QFile::ReadGroup));
    }
}
