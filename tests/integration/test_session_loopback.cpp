#include <catch2/catch_test_macros.hpp>

#include "network/link_provider.hpp"
#include "network/session.hpp"
#include "storage/trust_store.hpp"
#include "test_support.hpp"

#include <QTcpSocket>

#include <memory>
#include <vector>

using namespace konnect;
using namespace konnect::network;
using konnect::test::makeCertificate;
using konnect::test::makeIdentity;
using konnect::test::spinUntil;

namespace {

Config loopback_config() {
    Config config;
    config.tcp_port_min = 0;
    config.tcp_port_max = 0;
    config.handshake_timeout = std::chrono::milliseconds(5000);
    config.connect_rate_limit = std::chrono::milliseconds(0);
    return config;
}

struct Endpoint {
    explicit Endpoint(const QString& id, Config config = loopback_config())
        : Endpoint(id, makeCertificate(id), std::move(config))
    {
    }

    Endpoint(const QString& id, crypto::LocalCertificate local, Config config = loopback_config())
        : identity(makeIdentity(id))
        , certificate(std::move(local))
        , links(std::make_unique<LinkProvider>(std::move(config), certificate, &trust))
    {
        QObject::connect(links.get(), &LinkProvider::sessionReady, links.get(),
                         [this](Session* session) { ready.push_back(session->peerDeviceId()); });
        QObject::connect(links.get(), &LinkProvider::sessionClosed, links.get(),
                         [this](const QString& device_id, const Error& error) {
                             closed.push_back(device_id);
                             close_codes.push_back(error.code);
                         });
        QObject::connect(links.get(), &LinkProvider::trustViolation, links.get(),
                         [this](const QString& device_id, const QString&) { violations.push_back(device_id); });
    }

    bool listen() {
        auto port = links->listen(identity);
        if (port.is_err()) {
            return false;
        }
        identity.tcp_port = port.unwrap();
        return true;
    }

    Identity identity;
    crypto::LocalCertificate certificate;
    storage::InMemoryTrustStore trust;
    std::unique_ptr<LinkProvider> links;
    std::vector<QString> ready;
    std::vector<QString> closed;
    std::vector<ErrorCode> close_codes;
    std::vector<QString> violations;
};

const QHostAddress kLoopback(QHostAddress::LocalHost);

void pin(Endpoint& on, const Endpoint& peer, const QByteArray& der) {
    storage::TrustedDevice device;
    device.device_id = peer.identity.device_id;
    device.device_name = peer.identity.device_name;
    device.certificate = der;
    device.fingerprint = crypto::fingerprint(der);
    device.paired_at = Timestamp::now();
    device.protocol_version = peer.identity.protocol_version;
    REQUIRE(on.trust.add(device).is_ok());
}

} // namespace

TEST_CASE("Session: handshake when the dialer is TLS client", "[session][integration]") {
    Endpoint a(QStringLiteral("a_9"));
    Endpoint b(QStringLiteral("b_1"));
    if (!a.listen() || !b.listen()) {
        SKIP("TCP listen not permitted in this environment");
    }

    REQUIRE(a.links->connectTo(b.identity, kLoopback, b.identity.tcp_port).is_ok());
    REQUIRE(spinUntil([&] { return a.links->hasSession("b_1") && b.links->hasSession("a_9"); }, 10000));

    Session* on_a = a.links->session("b_1");
    Session* on_b = b.links->session("a_9");
    REQUIRE(on_a->origin() == Session::Origin::Outgoing);
    REQUIRE(on_b->origin() == Session::Origin::Incoming);
    REQUIRE(on_a->tlsRole() == TlsRole::Client);
    REQUIRE(on_b->tlsRole() == TlsRole::Server);
    REQUIRE(on_a->isEncrypted());
    REQUIRE(on_b->isEncrypted());
    REQUIRE(on_a->peerIdentity().device_name == b.identity.device_name);
    REQUIRE(on_b->peerIdentity().tcp_port == a.identity.tcp_port);
    REQUIRE(on_a->peerCertificate() == b.certificate.certificate);
    REQUIRE(on_b->peerCertificate() == a.certificate.certificate);
    REQUIRE(a.ready == std::vector<QString>{"b_1"});
    REQUIRE(b.ready == std::vector<QString>{"a_9"});

    SECTION("Packets flow both ways in order") {
        std::vector<int64_t> got_on_b;
        QObject::connect(on_b, &Session::packetReceived, on_b,
                         [&](const Packet& packet) { got_on_b.push_back(packet.get_int("n")); });
        bool got_on_a = false;
        QObject::connect(on_a, &Session::packetReceived, on_a,
                         [&](const Packet& packet) { got_on_a = packet.type() == "kdeconnect.ping"; });

        for (int n = 0; n < 5; ++n) {
            auto packet = PacketBuilder(QStringLiteral("kdeconnect.ping")).set(QStringLiteral("n"), n).build();
            REQUIRE(on_a->sendPacket(packet.unwrap()).is_ok());
        }
        REQUIRE(on_b->sendPacket(PacketBuilder(QStringLiteral("kdeconnect.ping")).build().unwrap()).is_ok());

        REQUIRE(spinUntil([&] { return got_on_b.size() == 5 && got_on_a; }, 5000));
        REQUIRE(got_on_b == std::vector<int64_t>{0, 1, 2, 3, 4});
    }

    SECTION("Closing one side is reported on the other") {
        a.links->disconnectDevice("b_1");
        REQUIRE(spinUntil([&] { return !b.links->hasSession("a_9"); }, 5000));
        REQUIRE(a.closed == std::vector<QString>{"b_1"});
        REQUIRE(a.close_codes.front() == ErrorCode::None);
        REQUIRE(b.closed == std::vector<QString>{"a_9"});
    }

    SECTION("A second dial is refused while connected") {
        auto again = a.links->connectTo(b.identity, kLoopback, b.identity.tcp_port);
        REQUIRE(again.is_err());
        REQUIRE(again.unwrap_err().code == ErrorCode::InvalidState);
    }
}

TEST_CASE("Session: handshake when the dialer is TLS server", "[session][integration]") {
    Endpoint a(QStringLiteral("a_9"));
    Endpoint b(QStringLiteral("b_1"));
    if (!a.listen() || !b.listen()) {
        SKIP("TCP listen not permitted in this environment");
    }

    REQUIRE(b.links->connectTo(a.identity, kLoopback, a.identity.tcp_port).is_ok());
    REQUIRE(spinUntil([&] { return a.links->hasSession("b_1") && b.links->hasSession("a_9"); }, 10000));

    REQUIRE(b.links->session("a_9")->tlsRole() == TlsRole::Server);
    REQUIRE(a.links->session("b_1")->tlsRole() == TlsRole::Client);
    REQUIRE(a.links->session("b_1")->peerIdentity().device_id == "b_1");
}

TEST_CASE("Session: pinned certificate", "[session][integration]") {
    Endpoint a(QStringLiteral("a_9"));
    Endpoint b(QStringLiteral("b_1"));
    if (!a.listen() || !b.listen()) {
        SKIP("TCP listen not permitted in this environment");
    }

    SECTION("Matching certificate connects") {
        pin(a, b, b.certificate.certificate.toDer());
        REQUIRE(a.links->connectTo(b.identity, kLoopback, b.identity.tcp_port).is_ok());
        REQUIRE(spinUntil([&] { return a.links->hasSession("b_1"); }, 10000));
        REQUIRE(a.violations.empty());
    }

    SECTION("A different certificate is a trust violation") {
        auto impostor = makeCertificate(QStringLiteral("b_1"));
        pin(a, b, impostor.certificate.toDer());

        REQUIRE(a.links->connectTo(b.identity, kLoopback, b.identity.tcp_port).is_ok());
        REQUIRE(spinUntil([&] { return !a.violations.empty(); }, 10000));
        REQUIRE(a.violations.front() == "b_1");

        konnect::test::spinFor(200);
        REQUIRE(a.ready.empty());
        REQUIRE(b.ready.empty());
        REQUIRE_FALSE(a.links->hasSession("b_1"));
        REQUIRE(a.trust.find("b_1")->certificate == impostor.certificate.toDer());
    }

    SECTION("Protocol downgrade of a paired peer is refused") {
        pin(a, b, b.certificate.certificate.toDer());
        b.identity.protocol_version = MIN_PROTOCOL_VERSION;
        b.links->setLocalIdentity(b.identity);

        REQUIRE(b.links->connectTo(a.identity, kLoopback, a.identity.tcp_port).is_ok());
        konnect::test::spinFor(1000);
        REQUIRE(a.ready.empty());
        REQUIRE(a.violations.empty());
    }
}

TEST_CASE("Session: handshake failures", "[session][integration]") {
    Endpoint a(QStringLiteral("a_9"));
    Endpoint b(QStringLiteral("b_1"));
    if (!a.listen() || !b.listen()) {
        SKIP("TCP listen not permitted in this environment");
    }

    SECTION("Peer is not the expected device") {
        Identity wrong = b.identity;
        wrong.device_id = QStringLiteral("c_3");
        REQUIRE(a.links->connectTo(wrong, kLoopback, b.identity.tcp_port).is_ok());
        konnect::test::spinFor(1000);
        REQUIRE(a.ready.empty());
        REQUIRE(b.ready.empty());
        // The failed dial no longer blocks a new one.
        REQUIRE(a.links->connectTo(b.identity, kLoopback, b.identity.tcp_port).is_ok());
        REQUIRE(spinUntil([&] { return a.links->hasSession("b_1"); }, 10000));
    }

    SECTION("Dial without a port") {
        auto dialed = a.links->connectTo(b.identity, kLoopback, 0);
        REQUIRE(dialed.is_err());
        REQUIRE(dialed.unwrap_err().code == ErrorCode::InvalidArgument);
    }

    SECTION("Nobody listening") {
        const quint16 port = b.identity.tcp_port;
        b.links->stop();
        REQUIRE(a.links->connectTo(b.identity, kLoopback, port).is_ok());
        konnect::test::spinFor(500);
        REQUIRE(a.ready.empty());
        REQUIRE(a.closed.empty());
    }
}

TEST_CASE("Session: raw sockets see the plaintext identity first", "[session][integration]") {
    Endpoint b(QStringLiteral("b_1"));
    if (!b.listen()) {
        SKIP("TCP listen not permitted in this environment");
    }

    QTcpSocket raw;
    raw.connectToHost(kLoopback, b.identity.tcp_port);
    REQUIRE(spinUntil([&] { return raw.state() == QAbstractSocket::ConnectedState; }, 5000));

    SECTION("Garbage before TLS closes the connection") {
        raw.write("this is not json\n");
        REQUIRE(spinUntil([&] { return raw.state() == QAbstractSocket::UnconnectedState; }, 5000));
        REQUIRE(b.ready.empty());
    }

    SECTION("An identity for another device is refused") {
        auto identity = make_identity_packet(makeIdentity(QStringLiteral("a_9")),
                                             IdentityTarget{QStringLiteral("z_0"), PROTOCOL_VERSION});
        raw.write(encode_packet(identity.unwrap()));
        REQUIRE(spinUntil([&] { return raw.state() == QAbstractSocket::UnconnectedState; }, 5000));
    }

    SECTION("A TLS server peer gets the accepting side's identity in plaintext") {
        // b_1 sorts after a_0, so b_1 answers in plaintext and then waits for TLS.
        auto identity = make_identity_packet(makeIdentity(QStringLiteral("a_0")),
                                             IdentityTarget{QStringLiteral("b_1"), PROTOCOL_VERSION});
        raw.write(encode_packet(identity.unwrap()));
        REQUIRE(spinUntil([&] { return raw.canReadLine(); }, 5000));
        auto answer = decode_packet(raw.readLine());
        REQUIRE(answer.is_ok());
        auto parsed = parse_identity_packet(answer.unwrap());
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.unwrap().device_id == "b_1");
        REQUIRE(identity_target(answer.unwrap())->device_id == "a_0");
    }
}

TEST_CASE("Session: a peer that comes back replaces its stale session", "[session][integration]") {
    Config short_handshake = loopback_config();
    short_handshake.handshake_timeout = std::chrono::milliseconds(1000);

    Endpoint a(QStringLiteral("a_9"), short_handshake);
    Endpoint b(QStringLiteral("b_1"), short_handshake);
    if (!a.listen() || !b.listen()) {
        SKIP("TCP listen not permitted in this environment");
    }

    REQUIRE(a.links->connectTo(b.identity, kLoopback, b.identity.tcp_port).is_ok());
    REQUIRE(spinUntil([&] { return a.links->hasSession("b_1") && b.links->hasSession("a_9"); }, 10000));
    Session* stale = a.links->session("b_1");
    // Older than any crossed dial could be.
    konnect::test::spinFor(1200);

    SECTION("Same certificate from a restarted peer") {
        // b_1 restarted: same identity and key, while a_9 still holds the old link.
        Endpoint restarted(QStringLiteral("b_1"), b.certificate, short_handshake);
        REQUIRE(restarted.listen());
        REQUIRE(restarted.links->connectTo(a.identity, kLoopback, a.identity.tcp_port).is_ok());

        REQUIRE(spinUntil([&] { return a.ready.size() == 2 && restarted.links->hasSession("a_9"); }, 10000));
        Session* fresh = a.links->session("b_1");
        REQUIRE(fresh != nullptr);
        REQUIRE(fresh != stale);
        REQUIRE(fresh->origin() == Session::Origin::Incoming);
        REQUIRE(a.closed.empty());

        // The replaced link is closed, and the old process sees it go.
        REQUIRE(spinUntil([&] { return !b.links->hasSession("a_9"); }, 5000));

        bool delivered = false;
        QObject::connect(restarted.links->session("a_9"), &Session::packetReceived, restarted.links.get(),
                         [&](const Packet& packet) { delivered = packet.type() == "kdeconnect.ping"; });
        REQUIRE(fresh->sendPacket(PacketBuilder(QStringLiteral("kdeconnect.ping")).build().unwrap()).is_ok());
        REQUIRE(spinUntil([&] { return delivered; }, 5000));
    }

    SECTION("A different certificate leaves the session alone") {
        Endpoint impostor(QStringLiteral("b_1"), short_handshake);
        REQUIRE(impostor.listen());
        REQUIRE(impostor.links->connectTo(a.identity, kLoopback, a.identity.tcp_port).is_ok());

        konnect::test::spinFor(1000);
        REQUIRE_FALSE(impostor.links->hasSession("a_9"));
        REQUIRE(a.links->session("b_1") == stale);
        REQUIRE(a.ready.size() == 1);
        REQUIRE(b.links->hasSession("a_9"));
    }
}

TEST_CASE("Session: crossed dials settle on one link", "[session][integration]") {
    Endpoint a(QStringLiteral("a_9"));
    Endpoint b(QStringLiteral("b_1"));
    if (!a.listen() || !b.listen()) {
        SKIP("TCP listen not permitted in this environment");
    }

    REQUIRE(a.links->connectTo(b.identity, kLoopback, b.identity.tcp_port).is_ok());
    REQUIRE(b.links->connectTo(a.identity, kLoopback, a.identity.tcp_port).is_ok());

    REQUIRE(spinUntil([&] { return a.links->hasSession("b_1") && b.links->hasSession("a_9"); }, 10000));
    // Let the losing connection close on both ends.
    konnect::test::spinFor(500);
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    REQUIRE(a.links->hasSession("b_1"));
    REQUIRE(b.links->hasSession("a_9"));
    REQUIRE(a.links->findChildren<Session*>(Qt::FindDirectChildrenOnly).size() == 1);
    REQUIRE(b.links->findChildren<Session*>(Qt::FindDirectChildrenOnly).size() == 1);

    // Both kept the connection a_9 opened, since a_9 sorts first.
    Session* on_a = a.links->session("b_1");
    Session* on_b = b.links->session("a_9");
    REQUIRE(on_a->origin() == Session::Origin::Outgoing);
    REQUIRE(on_b->origin() == Session::Origin::Incoming);
    REQUIRE(on_a->initiatorDeviceId() == on_b->initiatorDeviceId());

    bool delivered = false;
    QObject::connect(on_b, &Session::packetReceived, on_b,
                     [&](const Packet& packet) { delivered = packet.type() == "kdeconnect.ping"; });
    REQUIRE(on_a->sendPacket(PacketBuilder(QStringLiteral("kdeconnect.ping")).build().unwrap()).is_ok());
    REQUIRE(spinUntil([&] { return delivered; }, 5000));
}
