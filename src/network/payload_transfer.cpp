#include "network/payload_transfer.hpp"

#include "core/logging.hpp"
#include "core/packet.hpp"
#include "crypto/certificate.hpp"
#include "network/tls.hpp"

#include <QIODevice>
#include <QSslSocket>
#include <QTimer>

#include <algorithm>

namespace konnect::network {

namespace {

constexpr qint64 CHUNK_SIZE = 64 * 1024;

Res<void> check_certificate(const QSslSocket& socket, const QByteArray& pinned) {
    const QSslCertificate presented = socket.peerCertificate();
    if (presented.isNull()) {
        return fail(ErrorCode::Handshake, "peer presented no certificate");
    }
    if (!crypto::same_certificate(pinned, presented.toDer())) {
        return fail(ErrorCode::TrustViolation,
                    "payload peer presented " + crypto::fingerprint(presented).toStdString() +
                    " instead of the paired certificate");
    }
    return Res<void>::ok();
}

} // namespace

// ============================================================================
// PayloadSender
// ============================================================================

PayloadSender::PayloadSender(QSslConfiguration tls, QByteArray peer_certificate,
                             std::unique_ptr<QIODevice> source, qint64 size,
                             Settings settings, QObject* parent)
    : QObject(parent)
    , tls_(std::move(tls))
    , peer_certificate_(std::move(peer_certificate))
    , source_(std::move(source))
    , size_(size)
    , settings_(settings)
    , server_(std::make_unique<TcpListener>(this))
    , accept_timer_(std::make_unique<QTimer>(this))
{
    accept_timer_->setSingleShot(true);
    connect(accept_timer_.get(), &QTimer::timeout, this, &PayloadSender::onAcceptTimeout);
    connect(server_.get(), &TcpListener::descriptorReady,
            this, &PayloadSender::onDescriptorReady);
}

PayloadSender::~PayloadSender() {
    if (socket_) {
        QObject::disconnect(socket_.get(), nullptr, this, nullptr);
        socket_->abort();
    }
}

Res<quint16> PayloadSender::listen() {
    if (!source_ || !source_->isOpen() || !source_->isReadable()) {
        return fail<quint16>(ErrorCode::InvalidArgument, "payload source is not readable");
    }
    bool bound = false;
    if (settings_.port_min == 0) {
        bound = server_->listen(QHostAddress::Any, 0);
    } else {
        for (quint32 port = settings_.port_min; port <= settings_.port_max && !bound; ++port) {
            bound = server_->listen(QHostAddress::Any, static_cast<quint16>(port));
        }
    }
    if (!bound) {
        return fail<quint16>(ErrorCode::Network, "no free payload port");
    }
    accept_timer_->start(static_cast<int>(settings_.accept_timeout.count()));
    qCDebug(konnectPayloadLog) << "Serving" << size_ << "bytes on port" << server_->serverPort();
    return Res<quint16>::ok(server_->serverPort());
}

void PayloadSender::onDescriptorReady(qintptr descriptor) {
    if (socket_ || done_) {
        // One transfer per sender; later connections are dropped.
        QTcpSocket extra;
        if (extra.setSocketDescriptor(descriptor)) {
            extra.abort();
        }
        return;
    }
    accept_timer_->stop();
    server_->close();

    socket_ = std::make_unique<QSslSocket>(this);
    socket_->setSslConfiguration(tls_);
    connect(socket_.get(), &QSslSocket::encrypted, this, &PayloadSender::onEncrypted);
    connect(socket_.get(), &QSslSocket::bytesWritten, this, &PayloadSender::onBytesWritten);
    connect(socket_.get(), &QSslSocket::sslErrors, this, [this](const QList<QSslError>& errors) {
        socket_->ignoreSslErrors(ignorable_ssl_errors(errors));
    });
    connect(socket_.get(), &QAbstractSocket::errorOccurred, this, [this](QAbstractSocket::SocketError err) {
        if (err == QAbstractSocket::RemoteHostClosedError && sent_ == size_) {
            finish();
            return;
        }
        abortWith(Error{socket_->errorString().toStdString(), ErrorCode::Network, static_cast<int>(err)});
    });
    if (!socket_->setSocketDescriptor(descriptor)) {
        abortWith(Error{"cannot adopt payload socket", ErrorCode::Network});
        return;
    }
    socket_->startServerEncryption();
}

void PayloadSender::onEncrypted() {
    auto verified = check_certificate(*socket_, peer_certificate_);
    if (verified.is_err()) {
        qCWarning(konnectPayloadLog) << QString::fromStdString(verified.unwrap_err().message);
        abortWith(verified.unwrap_err());
        return;
    }
    writeChunk();
}

void PayloadSender::onBytesWritten(qint64) {
    if (done_) {
        return;
    }
    emit progress(sent_, size_);
    if (socket_->bytesToWrite() == 0) {
        writeChunk();
    }
}

void PayloadSender::writeChunk() {
    if (done_) {
        return;
    }
    const bool bounded = size_ != PAYLOAD_SIZE_UNKNOWN;
    if ((bounded && sent_ >= size_) || (!bounded && source_->atEnd())) {
        if (socket_->bytesToWrite() == 0) {
            finish();
        }
        return;
    }
    const qint64 want = bounded ? std::min(CHUNK_SIZE, size_ - sent_) : CHUNK_SIZE;
    const QByteArray chunk = source_->read(want);
    if (chunk.isEmpty()) {
        if (bounded) {
            abortWith(Error{"payload source ended after " + std::to_string(sent_) + " bytes",
                            ErrorCode::InvalidState});
        } else {
            finish();
        }
        return;
    }
    if (socket_->write(chunk) != chunk.size()) {
        abortWith(Error{"payload write failed", ErrorCode::Send});
        return;
    }
    sent_ += chunk.size();
}

void PayloadSender::finish() {
    if (done_) {
        return;
    }
    done_ = true;
    qCDebug(konnectPayloadLog) << "Payload of" << sent_ << "bytes delivered";
    socket_->disconnectFromHost();
    emit finished();
}

void PayloadSender::onAcceptTimeout() {
    abortWith(Error{"peer did not fetch the payload in time", ErrorCode::Network});
}

void PayloadSender::abortWith(const Error& error) {
    if (done_) {
        return;
    }
    done_ = true;
    accept_timer_->stop();
    server_->close();
    if (socket_) {
        socket_->abort();
    }
    emit failed(error);
}

// ============================================================================
// PayloadReceiver
// ============================================================================

PayloadReceiver::PayloadReceiver(QSslConfiguration tls, QByteArray peer_certificate,
                                 QHostAddress address, quint16 port, qint64 size,
                                 QIODevice* sink, std::chrono::milliseconds connect_timeout,
                                 QObject* parent)
    : QObject(parent)
    , tls_(std::move(tls))
    , peer_certificate_(std::move(peer_certificate))
    , address_(std::move(address))
    , port_(port)
    , size_(size)
    , sink_(sink)
    , connect_timeout_(connect_timeout)
    , socket_(std::make_unique<QSslSocket>(this))
    , timer_(std::make_unique<QTimer>(this))
{
    socket_->setSslConfiguration(tls_);
    timer_->setSingleShot(true);
    connect(timer_.get(), &QTimer::timeout, this, &PayloadReceiver::onTimeout);
    connect(socket_.get(), &QSslSocket::connected, this, &PayloadReceiver::onConnected);
    connect(socket_.get(), &QSslSocket::encrypted, this, &PayloadReceiver::onEncrypted);
    connect(socket_.get(), &QSslSocket::readyRead, this, &PayloadReceiver::onReadyRead);
    connect(socket_.get(), &QSslSocket::disconnected, this, &PayloadReceiver::onDisconnected);
    connect(socket_.get(), &QSslSocket::sslErrors, this, [this](const QList<QSslError>& errors) {
        socket_->ignoreSslErrors(ignorable_ssl_errors(errors));
    });
    connect(socket_.get(), &QAbstractSocket::errorOccurred, this, [this](QAbstractSocket::SocketError err) {
        if (err == QAbstractSocket::RemoteHostClosedError) {
            // onDisconnected decides whether the payload is complete.
            return;
        }
        abortWith(Error{socket_->errorString().toStdString(), ErrorCode::Network, static_cast<int>(err)});
    });
}

PayloadReceiver::~PayloadReceiver() {
    QObject::disconnect(socket_.get(), nullptr, this, nullptr);
    socket_->abort();
}

void PayloadReceiver::start() {
    if (sink_ == nullptr || !sink_->isWritable()) {
        abortWith(Error{"payload sink is not writable", ErrorCode::InvalidArgument});
        return;
    }
    if (size_ == 0) {
        finish();
        return;
    }
    timer_->start(static_cast<int>(connect_timeout_.count()));
    socket_->connectToHost(address_, port_);
}

void PayloadReceiver::onConnected() {
    socket_->startClientEncryption();
}

void PayloadReceiver::onEncrypted() {
    timer_->stop();
    auto verified = check_certificate(*socket_, peer_certificate_);
    if (verified.is_err()) {
        qCWarning(konnectPayloadLog) << QString::fromStdString(verified.unwrap_err().message);
        abortWith(verified.unwrap_err());
        return;
    }
    verified_ = true;
    onReadyRead();
}

void PayloadReceiver::onReadyRead() {
    if (!verified_ || done_) {
        return;
    }
    while (socket_->bytesAvailable() > 0) {
        qint64 want = socket_->bytesAvailable();
        if (size_ != PAYLOAD_SIZE_UNKNOWN) {
            want = std::min(want, size_ - received_);
        }
        if (want <= 0) {
            break;
        }
        const QByteArray chunk = socket_->read(want);
        if (sink_->write(chunk) != chunk.size()) {
            abortWith(Error{"payload sink write failed: " + sink_->errorString().toStdString(),
                            ErrorCode::Storage});
            return;
        }
        received_ += chunk.size();
    }
    emit progress(received_, size_);
    if (size_ != PAYLOAD_SIZE_UNKNOWN && received_ >= size_) {
        finish();
    }
}

void PayloadReceiver::onDisconnected() {
    if (done_) {
        return;
    }
    if (verified_) {
        onReadyRead();
    }
    if (done_) {
        return;
    }
    if (size_ == PAYLOAD_SIZE_UNKNOWN && verified_) {
        finish();
        return;
    }
    abortWith(Error{"payload truncated at " + std::to_string(received_) + " of " +
                        std::to_string(size_) + " bytes",
                    ErrorCode::Network});
}

void PayloadReceiver::onTimeout() {
    abortWith(Error{"payload connection timed out", ErrorCode::Network});
}

void PayloadReceiver::finish() {
    if (done_) {
        return;
    }
    done_ = true;
    timer_->stop();
    qCDebug(konnectPayloadLog) << "Received payload of" << received_ << "bytes";
    socket_->disconnectFromHost();
    emit finished();
}

void PayloadReceiver::abortWith(const Error& error) {
    if (done_) {
        return;
    }
    done_ = true;
    timer_->stop();
    socket_->abort();
    emit failed(error);
}

} // namespace konnect::network
