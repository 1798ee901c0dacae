#pragma once

#include "core/identity.hpp"
#include "core/packet.hpp"
#include "core/result.hpp"
#include "network/pairing.hpp"

#include <QHostAddress>
#include <QObject>
#include <QPointer>
#include <QSslCertificate>

#include <memory>

namespace konnect::storage {
class TrustStore;
}

namespace konnect::network {

class Session;

/**
 * Device - a peer we have had a session with.
 *
 * Owns the peer's PairingHandler and gates traffic on it: inbound
 * application packets are delivered only while Paired and only for types
 * the local identity accepts; outbound ones only while Paired and only for
 * types the peer accepts. Pair packets bypass both filters.
 */
class Device : public QObject {
    Q_OBJECT

public:
    Device(const Identity& local, const Identity& peer, storage::TrustStore& trust,
           QSslCertificate local_certificate, PairingHandler::Settings settings,
           QObject* parent = nullptr);
    ~Device() override;

    [[nodiscard]] QString id() const { return peer_.device_id; }
    [[nodiscard]] const Identity& identity() const { return peer_; }
    [[nodiscard]] QHostAddress lastAddress() const { return last_address_; }
    [[nodiscard]] bool isConnected() const { return !session_.isNull(); }
    [[nodiscard]] Session* session() const { return session_.data(); }
    [[nodiscard]] PairingHandler& pairing() { return *pairing_; }
    [[nodiscard]] const PairingHandler& pairing() const { return *pairing_; }

    /// Bind a ready session; its identity and certificate become current.
    void attachSession(Session* session);
    void detachSession();

    /// The local identity changed (rename); affects the inbound filter.
    void setLocalIdentity(const Identity& local) { local_ = local; }

    /**
     * Filter and enqueue a packet. ErrorCode::Send when not connected, not
     * paired, or the peer never advertised the type as incoming.
     */
    [[nodiscard]] Res<void> sendPacket(const Packet& packet);

signals:
    /// An inbound packet that passed the pairing gate and capability filter.
    void packetReceived(const QString& device_id, const konnect::Packet& packet);

private slots:
    void onSessionPacket(const konnect::Packet& packet);

private:
    Identity local_;
    Identity peer_;
    QHostAddress last_address_;
    QPointer<Session> session_;
    std::unique_ptr<PairingHandler> pairing_;
};

} // namespace konnect::network
