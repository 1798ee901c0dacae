#include "network/session.hpp"

#include "core/logging.hpp"
#include "crypto/certificate.hpp"
#include "network/tls.hpp"
#include "storage/trust_store.hpp"

#include <QMetaObject>
#include <QMutexLocker>
#include <QSslSocket>
#include <QTimer>

namespace konnect::network {

const char* session_state_name(Session::State state) {
    switch (state) {
        case Session::State::Idle: return "idle";
        case Session::State::Connecting: return "connecting";
        case Session::State::IdentityExchange: return "identity-exchange";
        case Session::State::Encrypting: return "encrypting";
        case Session::State::SecureIdentity: return "secure-identity";
        case Session::State::Ready: return "ready";
        case Session::State::Closed: return "closed";
    }
    return "unknown";
}

// ============================================================================
// Lifecycle
// ============================================================================

Session::Session(Context context, QObject* parent)
    : QObject(parent)
    , ctx_(std::move(context))
    , socket_(std::make_unique<QSslSocket>(this))
    , handshake_timer_(std::make_unique<QTimer>(this))
    , buffer_(ctx_.max_identity_size)
{
    socket_->setSslConfiguration(ctx_.tls);
    handshake_timer_->setSingleShot(true);
    connect(handshake_timer_.get(), &QTimer::timeout,
            this, &Session::onHandshakeTimeout);
    wireSocket();
}

Session::~Session() {
    QObject::disconnect(socket_.get(), nullptr, this, nullptr);
    if (state_.load() != State::Closed) {
        state_.store(State::Closed);
        socket_->abort();
    }
}

void Session::wireSocket() {
    connect(socket_.get(), &QSslSocket::connected,
            this, &Session::onConnected);
    connect(socket_.get(), &QSslSocket::encrypted,
            this, &Session::onEncrypted);
    connect(socket_.get(), &QSslSocket::readyRead,
            this, &Session::onReadyRead);
    connect(socket_.get(), &QSslSocket::disconnected,
            this, &Session::onDisconnected);
    connect(socket_.get(), &QSslSocket::sslErrors,
            this, &Session::onSslErrors);
    connect(socket_.get(), &QAbstractSocket::errorOccurred,
            this, [this](QAbstractSocket::SocketError err) {
        const State current = state_.load();
        if (current == State::Closed) {
            return;
        }
        const ErrorCode code = current == State::Connecting || current == State::Ready
                                   ? ErrorCode::Network
                                   : ErrorCode::Handshake;
        closeWithError(Error{socket_->errorString().toStdString(), code, static_cast<int>(err)});
    });
}

Res<void> Session::connectToPeer(const QHostAddress& address, quint16 port,
                                 const Identity& expected) {
    if (state_.load() != State::Idle) {
        return fail(ErrorCode::InvalidState, "session already used");
    }
    if (!is_valid_device_id(expected.device_id)) {
        return fail(ErrorCode::InvalidArgument, "invalid peer device id");
    }
    if (expected.device_id == ctx_.local.device_id) {
        return fail(ErrorCode::InvalidArgument, "refusing to connect to self");
    }

    origin_ = Origin::Outgoing;
    expected_ = expected;
    peer_ = expected;
    role_ = compute_tls_role(ctx_.local.device_id, expected.device_id);

    qCDebug(konnectTransportLog) << "Connecting to" << expected.device_id
                                 << address.toString() << port
                                 << "as TLS" << tls_role_name(role_);
    setState(State::Connecting);
    startHandshakeTimer();
    socket_->connectToHost(address, port);
    return Res<void>::ok();
}

Res<void> Session::acceptConnection(qintptr descriptor) {
    if (state_.load() != State::Idle) {
        return fail(ErrorCode::InvalidState, "session already used");
    }
    if (!socket_->setSocketDescriptor(descriptor)) {
        return fail(ErrorCode::Network,
                    "cannot adopt socket: " + socket_->errorString().toStdString());
    }
    origin_ = Origin::Incoming;
    socket_->setSocketOption(QAbstractSocket::KeepAliveOption, 1);
    setState(State::IdentityExchange);
    startHandshakeTimer();
    return Res<void>::ok();
}

void Session::close() {
    closeWithError(Error{"closed locally", ErrorCode::None});
}

void Session::closeWithError(const Error& error) {
    if (state_.load() == State::Closed) {
        return;
    }
    setState(State::Closed);
    handshake_timer_->stop();
    {
        QMutexLocker lock(&send_mutex_);
        send_queue_.clear();
    }

    if (error.code == ErrorCode::None) {
        qCDebug(konnectTransportLog) << "Session with" << peer_.device_id << "closed";
        socket_->disconnectFromHost();
    } else {
        qCInfo(konnectTransportLog) << "Session with"
                                    << (peer_.device_id.isEmpty() ? QStringLiteral("<unknown>")
                                                                  : peer_.device_id)
                                    << "closed:" << QString::fromStdString(error.describe());
        socket_->abort();
    }
    emit closed(error);
}

void Session::setState(State state) {
    if (state_.exchange(state) != state) {
        emit stateChanged(state);
    }
}

void Session::startHandshakeTimer() {
    handshake_timer_->start(static_cast<int>(ctx_.handshake_timeout.count()));
}

void Session::onHandshakeTimeout() {
    if (state_.load() != State::Ready) {
        closeWithError(Error{"handshake timed out", ErrorCode::Handshake});
    }
}

void Session::onDisconnected() {
    const State current = state_.load();
    if (current == State::Closed) {
        return;
    }
    closeWithError(Error{"connection closed by peer",
                         current == State::Ready ? ErrorCode::Network : ErrorCode::Handshake});
}

bool Session::isEncrypted() const {
    return socket_->isEncrypted();
}

QString Session::initiatorDeviceId() const {
    return origin_ == Origin::Outgoing ? ctx_.local.device_id : peer_.device_id;
}

std::chrono::milliseconds Session::readyFor() const {
    if (!ready_since_.isValid()) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(ready_since_.elapsed());
}

QHostAddress Session::peerAddress() const {
    return socket_->peerAddress();
}

// ============================================================================
// Handshake
// ============================================================================

Res<void> Session::writeLine(const QByteArray& line) {
    const qint64 written = socket_->write(line);
    if (written != line.size()) {
        return fail(ErrorCode::Send, "socket write failed: " + socket_->errorString().toStdString());
    }
    return Res<void>::ok();
}

Res<void> Session::sendIdentity(bool with_target) {
    std::optional<IdentityTarget> target;
    if (with_target) {
        target = IdentityTarget{peer_.device_id, peer_.protocol_version};
    }
    auto packet = make_identity_packet(ctx_.local, target);
    if (packet.is_err()) {
        return Res<void>::err(packet.unwrap_err());
    }
    return writeLine(encode_packet(packet.unwrap()));
}

void Session::onConnected() {
    socket_->setSocketOption(QAbstractSocket::KeepAliveOption, 1);
    setState(State::IdentityExchange);
    auto sent = sendIdentity(true);
    if (sent.is_err()) {
        closeWithError(Error{sent.unwrap_err().message, ErrorCode::Handshake});
        return;
    }
    // As TLS server we spoke last; otherwise wait for the peer's identity.
    if (role_ == TlsRole::Server) {
        startEncryption();
    }
}

void Session::handlePlaintextLine(const QByteArray& line) {
    if (buffer_.pending() > 0) {
        closeWithError(Error{"unexpected data after plaintext identity", ErrorCode::Handshake});
        return;
    }

    auto packet = decode_packet(line);
    if (packet.is_err()) {
        closeWithError(Error{"bad identity: " + packet.unwrap_err().message, ErrorCode::Handshake});
        return;
    }
    auto identity = parse_identity_packet(packet.unwrap());
    if (identity.is_err()) {
        closeWithError(Error{"bad identity: " + identity.unwrap_err().message, ErrorCode::Handshake});
        return;
    }
    Identity peer = std::move(identity).unwrap();
    plaintext_seen_ = true;
    if (peer.device_id == ctx_.local.device_id) {
        closeWithError(Error{"peer announced our own device id", ErrorCode::Handshake});
        return;
    }

    if (origin_ == Origin::Outgoing) {
        if (peer.device_id != expected_->device_id) {
            closeWithError(Error{"expected " + expected_->device_id.toStdString() +
                                     ", peer is " + peer.device_id.toStdString(),
                                 ErrorCode::Handshake});
            return;
        }
        peer_ = std::move(peer);
        startEncryption();
        return;
    }

    const auto target = identity_target(packet.unwrap());
    if (target && target->device_id != ctx_.local.device_id) {
        closeWithError(Error{"identity addressed to " + target->device_id.toStdString(),
                             ErrorCode::Handshake});
        return;
    }
    peer_ = std::move(peer);
    role_ = compute_tls_role(ctx_.local.device_id, peer_.device_id);
    if (role_ == TlsRole::Server) {
        auto sent = sendIdentity(true);
        if (sent.is_err()) {
            closeWithError(Error{sent.unwrap_err().message, ErrorCode::Handshake});
            return;
        }
    }
    startEncryption();
}

void Session::startEncryption() {
    qCDebug(konnectTransportLog) << "Starting TLS with" << peer_.device_id
                                 << "as" << tls_role_name(role_);
    setState(State::Encrypting);
    if (role_ == TlsRole::Server) {
        socket_->startServerEncryption();
    } else {
        socket_->startClientEncryption();
    }
}

void Session::onSslErrors(const QList<QSslError>& errors) {
    const auto ignorable = ignorable_ssl_errors(errors);
    if (ignorable.size() != errors.size()) {
        for (const auto& error : errors) {
            qCWarning(konnectTransportLog) << "TLS error with" << peer_.device_id
                                           << error.errorString();
        }
    }
    socket_->ignoreSslErrors(ignorable);
}

Res<void> Session::verifyPeerCertificate() {
    peer_certificate_ = socket_->peerCertificate();
    if (peer_certificate_.isNull()) {
        return fail(ErrorCode::Handshake, "peer presented no certificate");
    }
    const QString cn = crypto::common_name(peer_certificate_);
    if (cn != peer_.device_id) {
        return fail(ErrorCode::Handshake,
                    "certificate issued to " + cn.toStdString() +
                    ", peer is " + peer_.device_id.toStdString());
    }

    if (ctx_.trust == nullptr) {
        return Res<void>::ok();
    }
    const auto trusted = ctx_.trust->find(peer_.device_id);
    if (!trusted) {
        return Res<void>::ok();
    }
    if (!crypto::same_certificate(trusted->certificate, peer_certificate_.toDer())) {
        return fail(ErrorCode::TrustViolation,
                    "presented certificate " + crypto::fingerprint(peer_certificate_).toStdString() +
                    " differs from pinned " + trusted->fingerprint.toStdString());
    }
    if (peer_.protocol_version < trusted->protocol_version) {
        return fail(ErrorCode::Handshake,
                    "protocol downgrade from " + std::to_string(trusted->protocol_version) +
                    " to " + std::to_string(peer_.protocol_version));
    }
    return Res<void>::ok();
}

void Session::onEncrypted() {
    auto verified = verifyPeerCertificate();
    if (verified.is_err()) {
        const Error& error = verified.unwrap_err();
        if (error.code == ErrorCode::TrustViolation) {
            qCCritical(konnectTrustLog) << "Trust violation by" << peer_.device_id
                                        << QString::fromStdString(error.message);
            emit trustViolation(peer_.device_id, QString::fromStdString(error.message));
        }
        closeWithError(error);
        return;
    }

    buffer_.clear();
    setState(State::SecureIdentity);
    auto sent = sendIdentity(false);
    if (sent.is_err()) {
        closeWithError(Error{sent.unwrap_err().message, ErrorCode::Handshake});
        return;
    }
    if (socket_->bytesAvailable() > 0) {
        onReadyRead();
    }
}

void Session::handleSecureIdentity(const QByteArray& line) {
    auto packet = decode_packet(line);
    if (packet.is_err()) {
        closeWithError(Error{"bad secure identity: " + packet.unwrap_err().message,
                             ErrorCode::Handshake});
        return;
    }
    auto identity = parse_identity_packet(packet.unwrap());
    if (identity.is_err()) {
        closeWithError(Error{"bad secure identity: " + identity.unwrap_err().message,
                             ErrorCode::Handshake});
        return;
    }
    Identity secure = std::move(identity).unwrap();
    if (secure.device_id != peer_.device_id) {
        closeWithError(Error{"device id changed during handshake", ErrorCode::Handshake});
        return;
    }
    // An outgoing TLS server never saw the peer's plaintext identity.
    if (plaintext_seen_ && secure.protocol_version != peer_.protocol_version) {
        closeWithError(Error{"protocol version changed during handshake", ErrorCode::Handshake});
        return;
    }

    peer_ = std::move(secure);
    buffer_.set_max_line_length(MAX_PACKET_LINE);
    handshake_timer_->stop();
    ready_since_.start();
    setState(State::Ready);
    qCInfo(konnectTransportLog) << "Session with" << peer_.device_id << peerAddress().toString()
                                << "ready, TLS" << tls_role_name(role_);
    emit ready();
}

// ============================================================================
// Packet I/O
// ============================================================================

void Session::onReadyRead() {
    const auto reading = [this] {
        const State s = state_.load();
        return s == State::IdentityExchange || s == State::SecureIdentity || s == State::Ready;
    };
    if (!reading()) {
        return;
    }

    const auto overflow = [this] {
        closeWithError(Error{"line exceeds limit",
                             state_.load() == State::Ready ? ErrorCode::Codec : ErrorCode::Handshake});
    };
    buffer_.append(socket_->readAll());
    if (buffer_.overflowed()) {
        overflow();
        return;
    }

    while (reading()) {
        auto line = buffer_.take_line();
        if (!line) {
            if (buffer_.overflowed()) {
                overflow();
            }
            return;
        }
        switch (state_.load()) {
            case State::IdentityExchange:
                handlePlaintextLine(*line);
                break;
            case State::SecureIdentity:
                handleSecureIdentity(*line);
                break;
            case State::Ready:
                handlePacketLine(*line);
                break;
            default:
                return;
        }
    }
}

void Session::handlePacketLine(const QByteArray& line) {
    auto packet = decode_packet(line);
    if (packet.is_err()) {
        qCWarning(konnectTransportLog) << "Dropping malformed packet from" << peer_.device_id
                                       << QString::fromStdString(packet.unwrap_err().message);
        return;
    }
    emit packetReceived(packet.unwrap());
}

Res<void> Session::sendPacket(const Packet& packet) {
    if (state_.load() != State::Ready) {
        return fail(ErrorCode::Send, std::string("session is ") + session_state_name(state_.load()));
    }
    QByteArray line = encode_packet(packet);
    bool schedule = false;
    {
        QMutexLocker lock(&send_mutex_);
        send_queue_.append(std::move(line));
        if (!flush_scheduled_) {
            flush_scheduled_ = true;
            schedule = true;
        }
    }
    if (schedule) {
        QMetaObject::invokeMethod(this, [this] { flushSendQueue(); }, Qt::QueuedConnection);
    }
    return Res<void>::ok();
}

void Session::flushSendQueue() {
    QList<QByteArray> pending;
    {
        QMutexLocker lock(&send_mutex_);
        pending.swap(send_queue_);
        flush_scheduled_ = false;
    }
    if (state_.load() != State::Ready) {
        if (!pending.isEmpty()) {
            qCDebug(konnectTransportLog) << "Discarding" << pending.size()
                                         << "queued packets for closed session";
        }
        return;
    }
    for (const auto& line : pending) {
        auto written = writeLine(line);
        if (written.is_err()) {
            closeWithError(written.unwrap_err());
            return;
        }
    }
}

} // namespace konnect::network
