#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QSettings>
#include <QTextStream>

#include <memory>

#include "core/config.hpp"
#include "core/identity.hpp"
#include "core/logging.hpp"
#include "crypto/certificate.hpp"
#include "network/device_manager.hpp"
#include "storage/trust_store.hpp"

namespace {

int report(const konnect::Error& error, const char* what) {
    QTextStream(stderr) << what << ": " << QString::fromStdString(error.describe()) << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("konnectd");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("konnect");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("KDE Connect compatible device link daemon"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("config")},
        QStringLiteral("INI file with discovery/transport/pairing settings."),
        QStringLiteral("path"));
    parser.addOption(configOption);

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("Rename this device (persisted)."),
        QStringLiteral("name"));
    parser.addOption(nameOption);

    const QCommandLineOption typeOption(
        QStringList{QStringLiteral("type")},
        QStringLiteral("Device type: desktop, laptop, phone, tablet or tv (persisted)."),
        QStringLiteral("type"));
    parser.addOption(typeOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log output to this file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption pairOption(
        QStringList{QStringLiteral("pair")},
        QStringLiteral("Request pairing with this device once it connects."),
        QStringLiteral("deviceId"));
    parser.addOption(pairOption);

    const QCommandLineOption unpairOption(
        QStringList{QStringLiteral("unpair")},
        QStringLiteral("Forget a paired device and exit."),
        QStringLiteral("deviceId"));
    parser.addOption(unpairOption);

    const QCommandLineOption acceptOption(
        QStringList{QStringLiteral("accept-pairing")},
        QStringLiteral("Accept incoming pairing requests without asking."));
    parser.addOption(acceptOption);

    const QCommandLineOption listTrustedOption(
        QStringList{QStringLiteral("list-trusted")},
        QStringLiteral("Print paired devices and exit."));
    parser.addOption(listTrustedOption);

    parser.process(app);

    if (qEnvironmentVariableIsSet("KONNECT_DEBUG")) {
        konnect::enable_debug_logging();
    }
    konnect::install_file_logging(parser.value(logFileOption));

    std::unique_ptr<QSettings> settings;
    if (parser.isSet(configOption)) {
        settings = std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat);
    } else {
        settings = std::make_unique<QSettings>(QSettings::IniFormat, QSettings::UserScope,
                                               QStringLiteral("konnect"), QStringLiteral("konnectd"));
    }

    auto loaded = konnect::load_config(*settings);
    if (loaded.is_err()) {
        return report(loaded.unwrap_err(), "configuration");
    }
    konnect::Config config = std::move(loaded).unwrap();
    auto env = konnect::apply_environment(config);
    if (env.is_err()) {
        return report(env.unwrap_err(), "environment");
    }
    auto valid = config.validate();
    if (valid.is_err()) {
        return report(valid.unwrap_err(), "configuration");
    }
    if (config.data_dir.isEmpty()) {
        config.data_dir = konnect::default_data_dir();
    }
    if (!QDir().mkpath(config.data_dir)) {
        QTextStream(stderr) << "cannot create " << config.data_dir << QLatin1Char('\n');
        return 1;
    }

    if (parser.isSet(typeOption)) {
        settings->setValue(QStringLiteral("identity/device_type"), parser.value(typeOption));
    }
    auto identity_result = konnect::load_or_create_identity(*settings);
    if (identity_result.is_err()) {
        return report(identity_result.unwrap_err(), "identity");
    }
    konnect::Identity identity = std::move(identity_result).unwrap();
    if (parser.isSet(nameOption)) {
        auto renamed = konnect::rename_identity(*settings, identity, parser.value(nameOption));
        if (renamed.is_err()) {
            return report(renamed.unwrap_err(), "rename");
        }
        identity = std::move(renamed).unwrap();
    }

    auto store_result = konnect::storage::SqliteTrustStore::open(
        QDir(config.data_dir).filePath(QStringLiteral("trusted.db")));
    if (store_result.is_err()) {
        return report(store_result.unwrap_err(), "trust store");
    }
    auto store = std::move(store_result).unwrap();

    if (parser.isSet(listTrustedOption)) {
        QTextStream out(stdout);
        for (const auto& device : store->all()) {
            out << device.device_id << '\t' << device.device_name << '\t'
                << device.fingerprint << '\n';
        }
        return 0;
    }
    if (parser.isSet(unpairOption)) {
        const QString id = parser.value(unpairOption);
        if (!store->contains(id)) {
            QTextStream(stderr) << id << " is not paired\n";
            return 1;
        }
        auto removed = store->remove(id);
        if (removed.is_err()) {
            return report(removed.unwrap_err(), "unpair");
        }
        qCInfo(konnectDaemonLog) << "Forgot" << id;
        return 0;
    }

    auto certificate = konnect::crypto::load_or_create_certificate(config.data_dir, identity.device_id);
    if (certificate.is_err()) {
        return report(certificate.unwrap_err(), "certificate");
    }
    qCInfo(konnectDaemonLog) << "Device" << identity.device_id << "certificate"
                             << konnect::crypto::fingerprint(certificate.unwrap().certificate);

    konnect::network::DeviceManager manager(config, identity, std::move(certificate).unwrap(), *store);

    const bool auto_accept = parser.isSet(acceptOption);
    QObject::connect(&manager, &konnect::network::DeviceManager::pairingRequested, &manager,
                     [&manager, auto_accept](const QString& device_id, const QString& key) {
        qCInfo(konnectDaemonLog) << "Pairing requested by" << device_id << "verification key" << key;
        if (!auto_accept) {
            return;
        }
        auto accepted = manager.acceptPairing(device_id);
        if (accepted.is_err()) {
            qCWarning(konnectDaemonLog) << "Could not accept pairing:"
                                        << QString::fromStdString(accepted.unwrap_err().describe());
        }
    });
    QObject::connect(&manager, &konnect::network::DeviceManager::pairingStateChanged, &manager,
                     [](const QString& device_id, konnect::network::PairState state) {
        qCInfo(konnectDaemonLog) << device_id << "is now" << konnect::network::pair_state_name(state);
    });
    QObject::connect(&manager, &konnect::network::DeviceManager::pairingFailed, &manager,
                     [](const QString& device_id, const konnect::Error& error) {
        qCWarning(konnectDaemonLog) << "Pairing with" << device_id << "failed:"
                                    << QString::fromStdString(error.describe());
    });
    QObject::connect(&manager, &konnect::network::DeviceManager::trustViolation, &manager,
                     [](const QString& device_id, const QString& details) {
        qCCritical(konnectDaemonLog) << "SECURITY: device" << device_id
                                     << "presented an unexpected certificate:" << details;
    });

    const QString pair_with = parser.value(pairOption);
    if (!pair_with.isEmpty()) {
        QObject::connect(&manager, &konnect::network::DeviceManager::deviceConnected, &manager,
                         [&manager, pair_with](const QString& device_id) {
            if (device_id != pair_with) {
                return;
            }
            auto requested = manager.requestPairing(device_id);
            if (requested.is_err()) {
                qCWarning(konnectDaemonLog) << "Could not request pairing:"
                                            << QString::fromStdString(requested.unwrap_err().describe());
            }
        });
    }

    auto started = manager.start();
    if (started.is_err()) {
        return report(started.unwrap_err(), "start");
    }

    const int rc = app.exec();
    manager.stop();
    return rc;
}
