#include <catch2/catch_test_macros.hpp>
#include "core/logging.hpp"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QTemporaryDir>

using namespace konnect;

namespace {

QByteArray read_all(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

} // namespace

TEST_CASE("Logging: file sink", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("logs/konnect.log"));

    SECTION("Lines carry level and category") {
        install_file_logging(path);
        qCWarning(konnectPairingLog) << "pairing went sideways";
        qCInfo(konnectDaemonLog) << "daemon says hi";
        uninstall_file_logging();

        const QByteArray contents = read_all(path);
        REQUIRE(contents.contains(" W konnect.pairing pairing went sideways\n"));
        REQUIRE(contents.contains(" I konnect.daemon daemon says hi\n"));
    }

    SECTION("Disabled categories are not written") {
        install_file_logging(path);
        qCDebug(konnectTransportLog) << "not by default";
        qCInfo(konnectTransportLog) << "visible";
        uninstall_file_logging();

        const QByteArray contents = read_all(path);
        REQUIRE_FALSE(contents.contains("not by default"));
        REQUIRE(contents.contains("visible"));
    }

    SECTION("A full file is rotated") {
        REQUIRE(QDir().mkpath(QFileInfo(path).absolutePath()));
        {
            QFile big(path);
            REQUIRE(big.open(QIODevice::WriteOnly));
            REQUIRE(big.write(QByteArray(4 * 1024 * 1024, 'x')) == 4 * 1024 * 1024);
        }
        install_file_logging(path);
        qCInfo(konnectDaemonLog) << "fresh start";
        uninstall_file_logging();

        REQUIRE(QFileInfo(path + QStringLiteral(".1")).size() == 4 * 1024 * 1024);
        const QByteArray contents = read_all(path);
        REQUIRE(contents.contains("fresh start"));
        REQUIRE(contents.size() < 1024);
    }
}
