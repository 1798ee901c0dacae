#include <catch2/catch_test_macros.hpp>
#include "crypto/certificate.hpp"

#include <QDateTime>
#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>

using namespace konnect;
using namespace konnect::crypto;

TEST_CASE("Certificate: generated for the device id", "[crypto]") {
    auto generated = generate_certificate(QStringLiteral("a_9"));
    REQUIRE(generated.is_ok());
    const auto& local = generated.unwrap();
    REQUIRE_FALSE(local.is_null());
    REQUIRE(common_name(local.certificate) == "a_9");
    REQUIRE(local.certificate.subjectInfo(QSslCertificate::Organization).value(0) == "KDE");
    REQUIRE(local.certificate.effectiveDate() < QDateTime::currentDateTimeUtc());
    REQUIRE(local.certificate.expiryDate() > QDateTime::currentDateTimeUtc().addYears(5));
    REQUIRE(local.private_key.algorithm() == QSsl::Ec);

    REQUIRE(generate_certificate(QString()).is_err());
}

TEST_CASE("Certificate: fingerprint format", "[crypto]") {
    auto local = generate_certificate(QStringLiteral("a_9")).unwrap();
    const QString fp = fingerprint(local.certificate);
    static const QRegularExpression pattern(QStringLiteral("^([0-9A-F]{2}:){31}[0-9A-F]{2}$"));
    REQUIRE(pattern.match(fp).hasMatch());
    REQUIRE(fp == fingerprint(local.certificate.toDer()));
}

TEST_CASE("Certificate: byte comparison", "[crypto]") {
    auto a = generate_certificate(QStringLiteral("a_9")).unwrap();
    auto b = generate_certificate(QStringLiteral("a_9")).unwrap();

    REQUIRE(same_certificate(a.certificate.toDer(), a.certificate.toDer()));
    REQUIRE_FALSE(same_certificate(a.certificate.toDer(), b.certificate.toDer()));
    REQUIRE_FALSE(same_certificate(QByteArray(), QByteArray()));
    REQUIRE_FALSE(same_certificate(a.certificate.toDer(), a.certificate.toDer().chopped(1)));
}

TEST_CASE("Certificate: verification key", "[crypto]") {
    auto a = generate_certificate(QStringLiteral("a_9")).unwrap();
    auto b = generate_certificate(QStringLiteral("b_1")).unwrap();

    const QString ab = verification_key(a.certificate, b.certificate, 1700000000);
    const QString ba = verification_key(b.certificate, a.certificate, 1700000000);
    REQUIRE(ab.size() == 8);
    REQUIRE(ab == ba);
    REQUIRE(ab != verification_key(a.certificate, b.certificate, 1700000001));
}

TEST_CASE("Certificate: load or create", "[crypto]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    auto first = load_or_create_certificate(dir.path(), QStringLiteral("a_9"));
    REQUIRE(first.is_ok());
    REQUIRE(QFile::exists(dir.filePath(CERTIFICATE_FILE)));
    REQUIRE(QFile::exists(dir.filePath(PRIVATE_KEY_FILE)));

    SECTION("Reloading returns the same certificate") {
        auto second = load_or_create_certificate(dir.path(), QStringLiteral("a_9"));
        REQUIRE(second.is_ok());
        REQUIRE(second.unwrap().certificate == first.unwrap().certificate);
    }

    SECTION("A different device id regenerates") {
        auto other = load_or_create_certificate(dir.path(), QStringLiteral("c_3"));
        REQUIRE(other.is_ok());
        REQUIRE(common_name(other.unwrap().certificate) == "c_3");
        REQUIRE_FALSE(other.unwrap().certificate == first.unwrap().certificate);
    }

    SECTION("A corrupt file regenerates") {
        QFile file(dir.filePath(CERTIFICATE_FILE));
        REQUIRE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write("garbage");
        file.close();
        auto regenerated = load_or_create_certificate(dir.path(), QStringLiteral("a_9"));
        REQUIRE(regenerated.is_ok());
        REQUIRE(common_name(regenerated.unwrap().certificate) == "a_9");
    }
}
