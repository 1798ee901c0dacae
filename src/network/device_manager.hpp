#pragma once

#include "core/config.hpp"
#include "core/identity.hpp"
#include "core/packet.hpp"
#include "core/result.hpp"
#include "crypto/certificate.hpp"
#include "network/device.hpp"
#include "network/discovery.hpp"
#include "network/link_provider.hpp"
#include "network/packet_dispatcher.hpp"
#include "network/pairing.hpp"
#include "network/payload_transfer.hpp"
#include "storage/trust_store.hpp"

#include <QHostAddress>
#include <QMutex>
#include <QObject>
#include <QStringList>

#include <functional>
#include <map>
#include <memory>
#include <vector>

class QIODevice;

namespace konnect::network {

/**
 * DeviceManager - the surface plugins and the UI talk to.
 *
 * Wires discovery, the link provider and one Device per peer together:
 * announcements and reconnect requests become dials, ready sessions become
 * connected devices, and inbound packets that pass the pairing gate reach
 * per-device subscribers and the type dispatch table.
 *
 * The local identity's incoming capabilities are the configured ones plus
 * every type with a registered handler at start().
 */
class DeviceManager : public QObject {
    Q_OBJECT

public:
    using Subscriber = std::function<void(const Packet& packet)>;
    using SubscriptionId = uint64_t;

    DeviceManager(Config config, Identity local, crypto::LocalCertificate certificate,
                  storage::TrustStore& trust, QObject* parent = nullptr);
    ~DeviceManager() override;

    /// Listen for sessions, then start discovery with the bound port.
    [[nodiscard]] Res<void> start();
    void stop();
    [[nodiscard]] bool isRunning() const { return running_; }

    [[nodiscard]] const Identity& localIdentity() const { return local_; }
    /// Apply a renamed identity to discovery and future sessions.
    void setLocalIdentity(const Identity& local);

    // Plugin interface ---------------------------------------------------

    [[nodiscard]] Res<void> sendPacket(const QString& device_id, const Packet& packet);

    /**
     * Send a packet whose payload is served on a side-channel port. The
     * returned sender reports progress and completion; it is owned by the
     * manager and deleted once done.
     */
    [[nodiscard]] Res<PayloadSender*> sendPacketWithPayload(const QString& device_id,
                                                            const Packet& packet,
                                                            std::unique_ptr<QIODevice> source,
                                                            qint64 size);

    /**
     * Fetch the payload a paired device announced in packet into sink.
     * The receiver is already started and is deleted once done.
     */
    [[nodiscard]] Res<PayloadReceiver*> fetchPayload(const QString& device_id,
                                                     const Packet& packet,
                                                     QIODevice* sink);

    SubscriptionId subscribe(const QString& device_id, Subscriber subscriber);
    void unsubscribe(SubscriptionId id);

    PacketDispatcher::HandlerId registerHandler(const QString& type, PacketDispatcher::Handler handler);
    void unregisterHandler(PacketDispatcher::HandlerId id);

    // Pairing ------------------------------------------------------------

    [[nodiscard]] Res<void> requestPairing(const QString& device_id);
    [[nodiscard]] Res<void> acceptPairing(const QString& device_id);
    [[nodiscard]] Res<void> rejectPairing(const QString& device_id);
    [[nodiscard]] Res<void> cancelPairing(const QString& device_id);
    /// Works offline too: the pinned certificate is deleted either way.
    [[nodiscard]] Res<void> unpair(const QString& device_id);
    [[nodiscard]] PairState pairingState(const QString& device_id) const;
    [[nodiscard]] QString verificationKey(const QString& device_id) const;

    // Queries ------------------------------------------------------------

    [[nodiscard]] QStringList connectedDevices() const;
    [[nodiscard]] std::vector<PeerRecord> peers() const;
    [[nodiscard]] std::vector<storage::TrustedDevice> trustedDevices() const;
    [[nodiscard]] Device* device(const QString& device_id) const;

    [[nodiscard]] DiscoveryEngine& discovery() { return *discovery_; }
    [[nodiscard]] LinkProvider& links() { return *links_; }

    /// Dial a peer directly (custom host without broadcast, tests).
    [[nodiscard]] Res<void> connectTo(const Identity& peer, const QHostAddress& address, quint16 port);

signals:
    void peerDiscovered(const konnect::network::PeerRecord& record);
    void peerLost(const QString& device_id);
    void deviceConnected(const QString& device_id);
    void deviceDisconnected(const QString& device_id);
    void pairingStateChanged(const QString& device_id, konnect::network::PairState state);
    void pairingRequested(const QString& device_id, const QString& verification_key);
    void pairingFailed(const QString& device_id, const konnect::Error& error);
    void trustViolation(const QString& device_id, const QString& details);

private slots:
    void onPeerAnnounced(const konnect::network::PeerRecord& record);
    void onReconnectRequested(const konnect::Identity& peer, const QHostAddress& address, quint16 port);
    void onSessionReady(konnect::network::Session* session);
    void onSessionClosed(const QString& device_id, const konnect::Error& error);
    void onDevicePacket(const QString& device_id, const konnect::Packet& packet);

private:
    struct Subscription {
        QString device_id;
        Subscriber subscriber;
    };

    Device* ensureDevice(const Identity& peer);
    void dial(const Identity& peer, const QHostAddress& address, quint16 port);
    [[nodiscard]] Res<Device*> pairedDevice(const QString& device_id) const;

    Config config_;
    Identity local_;
    crypto::LocalCertificate certificate_;
    storage::TrustStore& trust_;
    bool running_ = false;

    std::unique_ptr<DiscoveryEngine> discovery_;
    std::unique_ptr<LinkProvider> links_;
    std::map<QString, std::unique_ptr<Device>> devices_;
    PacketDispatcher dispatcher_;

    mutable QMutex subscribers_mutex_;
    std::map<SubscriptionId, Subscription> subscribers_;
    SubscriptionId next_subscription_ = 1;
};

} // namespace konnect::network
