#pragma once

#include "core/config.hpp"
#include "core/identity.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/certificate.hpp"
#include "network/session.hpp"

#include <QHostAddress>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QStringList>
#include <QTcpServer>

#include <map>
#include <memory>

namespace konnect::storage {
class TrustStore;
}

namespace konnect::network {

/**
 * TcpListener - hands out raw descriptors so each accepted connection can
 * be adopted by a QSslSocket.
 */
class TcpListener : public QTcpServer {
    Q_OBJECT

public:
    using QTcpServer::QTcpServer;

signals:
    void descriptorReady(qintptr descriptor);

protected:
    void incomingConnection(qintptr descriptor) override;
};

/**
 * LinkProvider - the TCP side of the LAN backend.
 *
 * Listens on the first free port of the configured range, accepts
 * incoming sessions and dials peers on request. Sessions that finish the
 * handshake are entered in a per-device registry holding one session per
 * device. A second ready session for a registered device is arbitrated:
 *  - a different certificate keeps the registered session;
 *  - two sessions ready within the handshake timeout of each other and
 *    opened from opposite ends are crossed dials, and both peers keep the
 *    one opened by the smaller device id;
 *  - otherwise the newer session replaces the registered one, which is
 *    closed without a sessionClosed() for the device.
 */
class LinkProvider : public QObject {
    Q_OBJECT

public:
    LinkProvider(Config config, crypto::LocalCertificate certificate,
                 const storage::TrustStore* trust, QObject* parent = nullptr);
    ~LinkProvider() override;

    /**
     * Start listening. Returns the bound port. A zero lower bound in the
     * config binds an ephemeral port.
     */
    [[nodiscard]] Res<quint16> listen(const Identity& local);
    void stop();

    [[nodiscard]] quint16 port() const;
    [[nodiscard]] bool isListening() const;

    /// Identity used by sessions created from now on.
    void setLocalIdentity(const Identity& local);
    [[nodiscard]] const Identity& localIdentity() const { return local_; }

    /**
     * Dial a peer. Refused (ErrorCode::InvalidState) when a session or a
     * pending dial to that device exists, and (ErrorCode::Network) when the
     * device or address was tried within the rate limit interval.
     */
    [[nodiscard]] Res<void> connectTo(const Identity& peer, const QHostAddress& address, quint16 port);

    /// Ready session for a device, or null.
    [[nodiscard]] Session* session(const QString& device_id) const;
    [[nodiscard]] bool hasSession(const QString& device_id) const;
    [[nodiscard]] QStringList connectedDevices() const;

    /// Close the ready session to a device, if any.
    void disconnectDevice(const QString& device_id);

signals:
    void sessionReady(konnect::network::Session* session);
    void sessionClosed(const QString& device_id, const konnect::Error& error);
    void trustViolation(const QString& device_id, const QString& details);

private slots:
    void onDescriptorReady(qintptr descriptor);

private:
    enum class Keep {
        Registered,
        Candidate,
    };

    Session* createSession();
    [[nodiscard]] Keep arbitrate(const Session* registered, const Session* candidate) const;
    void onSessionReady(Session* session);
    void onSessionClosed(Session* session, const Error& error);
    [[nodiscard]] bool rateLimited(const QString& device_id, const QHostAddress& address);

    Config config_;
    crypto::LocalCertificate certificate_;
    const storage::TrustStore* trust_;
    Identity local_;
    QSslConfiguration tls_;
    std::unique_ptr<TcpListener> server_;

    mutable QMutex registry_mutex_;
    std::map<QString, Session*> registry_;
    QSet<QString> dialing_;
    std::map<QString, Timestamp> last_dial_by_device_;
    std::map<QString, Timestamp> last_dial_by_address_;
};

} // namespace konnect::network
