#include <QCoreApplication>
#include <QEventLoop>
#include <QHostAddress>
#include <QTimer>

#include <functional>

#include "core/config.hpp"
#include "core/identity.hpp"
#include "core/logging.hpp"
#include "crypto/certificate.hpp"
#include "network/device_manager.hpp"
#include "storage/trust_store.hpp"

namespace {

konnect::Identity makeIdentity(const QString &name) {
    konnect::Identity identity;
    identity.device_id = konnect::generate_device_id();
    identity.device_name = name;
    identity.device_type = konnect::DeviceType::Desktop;
    return identity;
}

bool waitFor(const std::function<bool()> &done, int timeoutMs) {
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(timeoutMs);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (done()) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();
    return done();
}

} // namespace

// Runs two daemons in one process over loopback: connect, pair, exchange a
// ping. Exit codes: 1 setup, 2 no session, 3 no pairing, 4 no ping.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    if (qEnvironmentVariableIsSet("KONNECT_DEBUG")) {
        konnect::enable_debug_logging();
    }

    konnect::Config config;
    config.discovery_enabled = false;
    config.tcp_port_min = 0;
    config.tcp_port_max = 0;
    config.payload_port_min = 0;
    config.payload_port_max = 0;
    config.connect_rate_limit = std::chrono::milliseconds(0);

    const auto identityA = makeIdentity(QStringLiteral("A"));
    const auto identityB = makeIdentity(QStringLiteral("B"));
    auto certA = konnect::crypto::generate_certificate(identityA.device_id);
    auto certB = konnect::crypto::generate_certificate(identityB.device_id);
    if (certA.is_err() || certB.is_err()) {
        qCritical().noquote() << "certificate generation failed";
        return 1;
    }

    konnect::storage::InMemoryTrustStore trustA;
    konnect::storage::InMemoryTrustStore trustB;
    konnect::network::DeviceManager a(config, identityA, std::move(certA).unwrap(), trustA);
    konnect::network::DeviceManager b(config, identityB, std::move(certB).unwrap(), trustB);

    const QString ping = QStringLiteral("kdeconnect.ping");
    bool pinged = false;
    b.registerHandler(ping, [&](const QString &, const konnect::Packet &) { pinged = true; });
    a.registerHandler(ping, [](const QString &, const konnect::Packet &) {});

    QObject::connect(&b, &konnect::network::DeviceManager::pairingRequested, &app,
                     [&](const QString &deviceId, const QString &key) {
        qInfo().noquote() << "B: pairing requested, key" << key;
        auto accepted = b.acceptPairing(deviceId);
        if (accepted.is_err()) {
            qCritical().noquote() << "B: accept failed:"
                                  << QString::fromStdString(accepted.unwrap_err().describe());
        }
    });

    for (auto *manager : {&a, &b}) {
        auto started = manager->start();
        if (started.is_err()) {
            qCritical().noquote() << "could not start:"
                                  << QString::fromStdString(started.unwrap_err().describe());
            return 1;
        }
    }

    const auto &peer = b.localIdentity();
    auto dialed = a.connectTo(peer, QHostAddress::LocalHost, peer.tcp_port);
    if (dialed.is_err()) {
        qCritical().noquote() << QString::fromStdString(dialed.unwrap_err().describe());
        return 1;
    }
    if (!waitFor([&] { return a.connectedDevices().contains(identityB.device_id) &&
                              b.connectedDevices().contains(identityA.device_id); }, 5000)) {
        return 2;
    }

    auto requested = a.requestPairing(identityB.device_id);
    if (requested.is_err() ||
        !waitFor([&] { return a.pairingState(identityB.device_id) == konnect::network::PairState::Paired; }, 5000)) {
        return 3;
    }

    auto packet = konnect::PacketBuilder(ping).build();
    if (packet.is_err() || a.sendPacket(identityB.device_id, packet.unwrap()).is_err() ||
        !waitFor([&] { return pinged; }, 5000)) {
        return 4;
    }
    qInfo().noquote() << "loopback ok";
    return 0;
}
