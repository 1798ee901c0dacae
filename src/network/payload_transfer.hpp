#pragma once

#include "core/result.hpp"
#include "network/link_provider.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QObject>
#include <QSslConfiguration>
#include <QSslError>

#include <chrono>
#include <memory>

class QIODevice;
class QSslSocket;
class QTimer;

namespace konnect::network {

/**
 * PayloadSender - serves one payload on a side-channel port.
 *
 * Listens on the first free port of the payload range, accepts a single
 * connection as TLS server, checks that the client presents the pinned
 * certificate of the paired peer, then streams the source and closes.
 */
class PayloadSender : public QObject {
    Q_OBJECT

public:
    struct Settings {
        quint16 port_min = 1739;
        quint16 port_max = 1764;
        std::chrono::milliseconds accept_timeout{10000};
    };

    PayloadSender(QSslConfiguration tls, QByteArray peer_certificate,
                  std::unique_ptr<QIODevice> source, qint64 size,
                  Settings settings, QObject* parent = nullptr);
    ~PayloadSender() override;

    /// Bind and start the accept timer. Returns the port to advertise.
    [[nodiscard]] Res<quint16> listen();

    [[nodiscard]] qint64 size() const { return size_; }
    [[nodiscard]] qint64 sent() const { return sent_; }

signals:
    void progress(qint64 sent, qint64 total);
    void finished();
    void failed(const konnect::Error& error);

private slots:
    void onDescriptorReady(qintptr descriptor);
    void onEncrypted();
    void onBytesWritten(qint64 bytes);
    void onAcceptTimeout();

private:
    void writeChunk();
    void finish();
    void abortWith(const Error& error);

    QSslConfiguration tls_;
    QByteArray peer_certificate_;
    std::unique_ptr<QIODevice> source_;
    qint64 size_;
    Settings settings_;
    std::unique_ptr<TcpListener> server_;
    std::unique_ptr<QSslSocket> socket_;
    std::unique_ptr<QTimer> accept_timer_;
    qint64 sent_ = 0;
    bool done_ = false;
};

/**
 * PayloadReceiver - fetches one payload announced by a paired peer.
 *
 * Connects to the advertised port as TLS client, checks the server
 * certificate against the pinned one and copies exactly size bytes into
 * the sink (until the peer closes when the size is unknown). The sink is
 * not owned and must outlive the receiver.
 */
class PayloadReceiver : public QObject {
    Q_OBJECT

public:
    PayloadReceiver(QSslConfiguration tls, QByteArray peer_certificate,
                    QHostAddress address, quint16 port, qint64 size,
                    QIODevice* sink, std::chrono::milliseconds connect_timeout,
                    QObject* parent = nullptr);
    ~PayloadReceiver() override;

    void start();

    [[nodiscard]] qint64 size() const { return size_; }
    [[nodiscard]] qint64 received() const { return received_; }

signals:
    void progress(qint64 received, qint64 total);
    void finished();
    void failed(const konnect::Error& error);

private slots:
    void onConnected();
    void onEncrypted();
    void onReadyRead();
    void onDisconnected();
    void onTimeout();

private:
    void finish();
    void abortWith(const Error& error);

    QSslConfiguration tls_;
    QByteArray peer_certificate_;
    QHostAddress address_;
    quint16 port_;
    qint64 size_;
    QIODevice* sink_;
    std::chrono::milliseconds connect_timeout_;
    std::unique_ptr<QSslSocket> socket_;
    std::unique_ptr<QTimer> timer_;
    qint64 received_ = 0;
    bool verified_ = false;
    bool done_ = false;
};

} // namespace konnect::network
