#pragma once

#include "core/identity.hpp"
#include "core/packet.hpp"
#include "core/result.hpp"
#include "network/tls_role.hpp"

#include <QElapsedTimer>
#include <QHostAddress>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QSslCertificate>
#include <QSslConfiguration>
#include <QSslError>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

class QSslSocket;
class QTimer;

namespace konnect::storage {
class TrustStore;
}

namespace konnect::network {

/// Longest packet line accepted once the channel is encrypted.
inline constexpr qsizetype MAX_PACKET_LINE = 16 * 1024 * 1024;

/**
 * Session - one TCP/TLS link to one peer.
 *
 * Handshake, in order:
 *  1. The connecting side sends its identity in plaintext, addressed to the
 *     peer it expects (targetDeviceId).
 *  2. Both sides compute the TLS role from the two device ids. The side
 *     that will be TLS server sends the last plaintext line: when the
 *     connecting side is server it starts TLS right away; otherwise the
 *     accepting side answers with its own plaintext identity first.
 *  3. TLS. Certificates are requested but not CA-validated; the common
 *     name must equal the peer device id, and a trusted peer must present
 *     exactly the pinned certificate.
 *  4. Both sides resend their identity over TLS; it must match the
 *     plaintext one.
 *
 * After that the session is Ready and delivers decoded packets. A line
 * that fails to decode is dropped and the session continues.
 *
 * The object lives on one thread. sendPacket() may be called from any
 * thread: it enqueues and the write happens on the owner thread.
 */
class Session : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Connecting,
        IdentityExchange,
        Encrypting,
        SecureIdentity,
        Ready,
        Closed,
    };
    Q_ENUM(State)

    enum class Origin {
        Outgoing,
        Incoming,
    };

    struct Context {
        Identity local;
        QSslConfiguration tls;
        // Consulted for certificate pinning; may be null (nothing trusted).
        const storage::TrustStore* trust = nullptr;
        std::chrono::milliseconds handshake_timeout{10000};
        qsizetype max_identity_size = MAX_IDENTITY_PACKET_SIZE;
    };

    explicit Session(Context context, QObject* parent = nullptr);
    ~Session() override;

    /**
     * Dial a peer known from discovery or from an earlier session. The
     * expected identity decides the TLS role and is checked against what
     * the peer presents.
     */
    [[nodiscard]] Res<void> connectToPeer(const QHostAddress& address, quint16 port,
                                          const Identity& expected);

    /// Take over an accepted socket descriptor.
    [[nodiscard]] Res<void> acceptConnection(qintptr descriptor);

    /**
     * Queue a packet for the peer. Fails with ErrorCode::Send unless the
     * session is Ready. Thread-safe.
     */
    [[nodiscard]] Res<void> sendPacket(const Packet& packet);

    /// Close without error; emits closed() once.
    void close();

    [[nodiscard]] State state() const { return state_.load(); }
    [[nodiscard]] bool isReady() const { return state_.load() == State::Ready; }
    [[nodiscard]] Origin origin() const { return origin_; }
    [[nodiscard]] TlsRole tlsRole() const { return role_; }
    [[nodiscard]] bool isEncrypted() const;

    /// Device that opened the TCP connection: us for Outgoing, the peer otherwise.
    [[nodiscard]] QString initiatorDeviceId() const;
    /// Time since the session became Ready; zero before that.
    [[nodiscard]] std::chrono::milliseconds readyFor() const;

    /// Valid from the plaintext identity on; authoritative once Ready.
    [[nodiscard]] const Identity& peerIdentity() const { return peer_; }
    [[nodiscard]] QString peerDeviceId() const { return peer_.device_id; }
    [[nodiscard]] const QSslCertificate& peerCertificate() const { return peer_certificate_; }
    [[nodiscard]] QHostAddress peerAddress() const;
    [[nodiscard]] const Identity& localIdentity() const { return ctx_.local; }

signals:
    void stateChanged(konnect::network::Session::State state);
    void ready();
    void packetReceived(const konnect::Packet& packet);
    void trustViolation(const QString& device_id, const QString& details);
    /// Emitted exactly once; error.code is None for a local close.
    void closed(const konnect::Error& error);

private slots:
    void onConnected();
    void onEncrypted();
    void onReadyRead();
    void onDisconnected();
    void onSslErrors(const QList<QSslError>& errors);
    void onHandshakeTimeout();

private:
    void setState(State state);
    void closeWithError(const Error& error);
    void wireSocket();
    void startHandshakeTimer();

    [[nodiscard]] Res<void> writeLine(const QByteArray& line);
    [[nodiscard]] Res<void> sendIdentity(bool with_target);
    void flushSendQueue();

    void handlePlaintextLine(const QByteArray& line);
    void handleSecureIdentity(const QByteArray& line);
    void handlePacketLine(const QByteArray& line);
    void startEncryption();
    [[nodiscard]] Res<void> verifyPeerCertificate();

    Context ctx_;
    std::unique_ptr<QSslSocket> socket_;
    std::unique_ptr<QTimer> handshake_timer_;
    std::atomic<State> state_{State::Idle};
    Origin origin_ = Origin::Incoming;
    TlsRole role_ = TlsRole::Client;
    std::optional<Identity> expected_;
    Identity peer_;
    bool plaintext_seen_ = false;
    QSslCertificate peer_certificate_;
    LineBuffer buffer_;
    QElapsedTimer ready_since_;

    QMutex send_mutex_;
    QList<QByteArray> send_queue_;
    bool flush_scheduled_ = false;
};

[[nodiscard]] const char* session_state_name(Session::State state);

} // namespace konnect::network
