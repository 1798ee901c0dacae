#include "network/device_manager.hpp"

#include "core/logging.hpp"
#include "network/session.hpp"
#include "network/tls.hpp"

#include <QIODevice>
#include <QJsonObject>
#include <QMetaObject>
#include <QMutexLocker>

namespace konnect::network {

DeviceManager::DeviceManager(Config config, Identity local, crypto::LocalCertificate certificate,
                             storage::TrustStore& trust, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , local_(std::move(local))
    , certificate_(std::move(certificate))
    , trust_(trust)
    , discovery_(std::make_unique<DiscoveryEngine>(config_, this))
    , links_(std::make_unique<LinkProvider>(config_, certificate_, &trust_, this))
{
    local_.incoming_capabilities.unite(config_.incoming_capabilities);
    local_.outgoing_capabilities.unite(config_.outgoing_capabilities);

    connect(discovery_.get(), &DiscoveryEngine::peerDiscovered,
            this, &DeviceManager::peerDiscovered);
    connect(discovery_.get(), &DiscoveryEngine::peerLost,
            this, &DeviceManager::peerLost);
    connect(discovery_.get(), &DiscoveryEngine::peerAnnounced,
            this, &DeviceManager::onPeerAnnounced);
    connect(discovery_.get(), &DiscoveryEngine::reconnectRequested,
            this, &DeviceManager::onReconnectRequested);

    connect(links_.get(), &LinkProvider::sessionReady,
            this, &DeviceManager::onSessionReady);
    connect(links_.get(), &LinkProvider::sessionClosed,
            this, &DeviceManager::onSessionClosed);
    connect(links_.get(), &LinkProvider::trustViolation,
            this, &DeviceManager::trustViolation);
}

DeviceManager::~DeviceManager() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

Res<void> DeviceManager::start() {
    if (running_) {
        return Res<void>::ok();
    }
    local_.incoming_capabilities.unite(dispatcher_.types());

    auto port = links_->listen(local_);
    if (port.is_err()) {
        return Res<void>::err(port.unwrap_err());
    }
    local_.tcp_port = port.unwrap();
    links_->setLocalIdentity(local_);

    auto discovering = discovery_->start(local_);
    if (discovering.is_err()) {
        links_->stop();
        return discovering;
    }
    for (auto& [id, device] : devices_) {
        device->setLocalIdentity(local_);
    }
    running_ = true;
    qCInfo(konnectDaemonLog) << "Device" << local_.device_id << "(" << local_.device_name
                             << ") listening on" << local_.tcp_port;
    return Res<void>::ok();
}

void DeviceManager::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    discovery_->stop();
    links_->stop();
}

void DeviceManager::setLocalIdentity(const Identity& local) {
    const uint16_t port = local_.tcp_port;
    const auto incoming = local_.incoming_capabilities;
    const auto outgoing = local_.outgoing_capabilities;
    local_ = local;
    local_.tcp_port = port;
    local_.incoming_capabilities.unite(incoming);
    local_.outgoing_capabilities.unite(outgoing);

    links_->setLocalIdentity(local_);
    discovery_->setLocalIdentity(local_);
    for (auto& [id, device] : devices_) {
        device->setLocalIdentity(local_);
    }
}

// ============================================================================
// Discovery and sessions
// ============================================================================

void DeviceManager::dial(const Identity& peer, const QHostAddress& address, quint16 port) {
    if (links_->hasSession(peer.device_id)) {
        return;
    }
    auto dialed = links_->connectTo(peer, address, port);
    if (dialed.is_err() && dialed.unwrap_err().code != ErrorCode::InvalidState) {
        qCDebug(konnectTransportLog) << "Not dialing" << peer.device_id << ":"
                                     << QString::fromStdString(dialed.unwrap_err().message);
    }
}

Res<void> DeviceManager::connectTo(const Identity& peer, const QHostAddress& address, quint16 port) {
    return links_->connectTo(peer, address, port);
}

void DeviceManager::onPeerAnnounced(const PeerRecord& record) {
    dial(record.identity, record.last_seen_address, record.identity.tcp_port);
}

void DeviceManager::onReconnectRequested(const Identity& peer, const QHostAddress& address, quint16 port) {
    qCDebug(konnectDiscoveryLog) << "Reconnecting directly to" << peer.device_id << address.toString();
    dial(peer, address, port);
}

Device* DeviceManager::ensureDevice(const Identity& peer) {
    auto it = devices_.find(peer.device_id);
    if (it != devices_.end()) {
        return it->second.get();
    }
    PairingHandler::Settings settings;
    settings.timeout = config_.pairing_timeout;
    settings.timestamp_skew = config_.pair_timestamp_skew;

    auto device = std::make_unique<Device>(local_, peer, trust_, certificate_.certificate, settings, this);
    auto* raw = device.get();
    connect(raw, &Device::packetReceived, this, &DeviceManager::onDevicePacket);
    connect(&raw->pairing(), &PairingHandler::stateChanged,
            this, &DeviceManager::pairingStateChanged);
    connect(&raw->pairing(), &PairingHandler::stateChanged,
            this, [this](const QString& device_id, PairState state) {
                if (state == PairState::Unpaired) {
                    discovery_->forgetEndpoint(device_id);
                }
            });
    connect(&raw->pairing(), &PairingHandler::pairingRequested,
            this, &DeviceManager::pairingRequested);
    connect(&raw->pairing(), &PairingHandler::pairingFailed,
            this, &DeviceManager::pairingFailed);
    devices_.emplace(peer.device_id, std::move(device));
    return raw;
}

void DeviceManager::onSessionReady(Session* session) {
    const Identity& peer = session->peerIdentity();
    Device* device = ensureDevice(peer);
    device->attachSession(session);
    discovery_->sessionEstablished(peer, session->peerAddress());
    qCInfo(konnectDaemonLog) << "Connected to" << peer.device_id << "(" << peer.device_name << ")"
                             << pair_state_name(device->pairing().state());
    emit deviceConnected(peer.device_id);
}

void DeviceManager::onSessionClosed(const QString& device_id, const Error& error) {
    const auto it = devices_.find(device_id);
    if (it != devices_.end()) {
        it->second->detachSession();
    }
    discovery_->sessionEnded(device_id);
    qCInfo(konnectDaemonLog) << "Disconnected from" << device_id
                             << QString::fromStdString(error.describe());
    emit deviceDisconnected(device_id);
}

void DeviceManager::onDevicePacket(const QString& device_id, const Packet& packet) {
    std::vector<Subscriber> targets;
    {
        QMutexLocker lock(&subscribers_mutex_);
        for (const auto& [id, subscription] : subscribers_) {
            if (subscription.device_id == device_id) {
                targets.push_back(subscription.subscriber);
            }
        }
    }
    for (const auto& subscriber : targets) {
        subscriber(packet);
    }
    const int handled = dispatcher_.dispatch(device_id, packet);
    if (targets.empty() && handled == 0) {
        qCDebug(konnectTransportLog) << "No consumer for" << packet.type() << "from" << device_id;
    }
}

// ============================================================================
// Plugin interface
// ============================================================================

Device* DeviceManager::device(const QString& device_id) const {
    const auto it = devices_.find(device_id);
    return it == devices_.end() ? nullptr : it->second.get();
}

Res<void> DeviceManager::sendPacket(const QString& device_id, const Packet& packet) {
    Device* target = device(device_id);
    if (target == nullptr) {
        return fail(ErrorCode::Send, "unknown device " + device_id.toStdString());
    }
    return target->sendPacket(packet);
}

Res<Device*> DeviceManager::pairedDevice(const QString& device_id) const {
    Device* target = device(device_id);
    if (target == nullptr || !target->isConnected()) {
        return fail<Device*>(ErrorCode::Send, "device " + device_id.toStdString() + " is not connected");
    }
    if (!target->pairing().isPaired()) {
        return fail<Device*>(ErrorCode::Send, "device " + device_id.toStdString() + " is not paired");
    }
    return Res<Device*>::ok(target);
}

Res<PayloadSender*> DeviceManager::sendPacketWithPayload(const QString& device_id,
                                                         const Packet& packet,
                                                         std::unique_ptr<QIODevice> source,
                                                         qint64 size) {
    auto target = pairedDevice(device_id);
    if (target.is_err()) {
        return Res<PayloadSender*>::err(target.unwrap_err());
    }
    const auto trusted = trust_.find(device_id);
    if (!trusted) {
        return fail<PayloadSender*>(ErrorCode::InvalidState, "no pinned certificate");
    }

    PayloadSender::Settings settings;
    settings.port_min = config_.payload_port_min;
    settings.port_max = config_.payload_port_max;
    settings.accept_timeout = config_.payload_accept_timeout;
    auto* sender = new PayloadSender(make_tls_configuration(certificate_), trusted->certificate,
                                     std::move(source), size, settings, this);
    // Owned by this manager until it finishes; every exit hands it to deleteLater.
    const auto discard = [sender](const Error& error) {
        sender->deleteLater();
        return Res<PayloadSender*>::err(error);
    };
    auto port = sender->listen();
    if (port.is_err()) {
        return discard(port.unwrap_err());
    }

    QJsonObject info;
    info.insert(QStringLiteral("port"), static_cast<int>(port.unwrap()));
    auto announced = PacketBuilder::from(packet)
                         .set_payload_size(size)
                         .set_payload_transfer_info(info)
                         .build();
    if (announced.is_err()) {
        return discard(announced.unwrap_err());
    }
    auto sent = target.unwrap()->sendPacket(announced.unwrap());
    if (sent.is_err()) {
        return discard(sent.unwrap_err());
    }
    connect(sender, &PayloadSender::finished, sender, &QObject::deleteLater);
    connect(sender, &PayloadSender::failed, sender, [sender, device_id](const Error& error) {
        qCWarning(konnectPayloadLog) << "Payload to" << device_id << "failed:"
                                     << QString::fromStdString(error.describe());
        sender->deleteLater();
    });
    return Res<PayloadSender*>::ok(sender);
}

Res<PayloadReceiver*> DeviceManager::fetchPayload(const QString& device_id, const Packet& packet,
                                                  QIODevice* sink) {
    auto target = pairedDevice(device_id);
    if (target.is_err()) {
        return Res<PayloadReceiver*>::err(target.unwrap_err());
    }
    const auto port = packet.payload_port();
    if (!packet.has_payload() || !port) {
        return fail<PayloadReceiver*>(ErrorCode::InvalidArgument, "packet announces no payload");
    }
    const auto trusted = trust_.find(device_id);
    if (!trusted) {
        return fail<PayloadReceiver*>(ErrorCode::InvalidState, "no pinned certificate");
    }

    auto* receiver = new PayloadReceiver(make_tls_configuration(certificate_), trusted->certificate,
                                         target.unwrap()->lastAddress(), *port,
                                         *packet.payload_size(), sink,
                                         config_.payload_accept_timeout, this);
    connect(receiver, &PayloadReceiver::finished, receiver, &QObject::deleteLater);
    connect(receiver, &PayloadReceiver::failed, receiver, [receiver, device_id](const Error& error) {
        qCWarning(konnectPayloadLog) << "Payload from" << device_id << "failed:"
                                     << QString::fromStdString(error.describe());
        receiver->deleteLater();
    });
    // Started from the event loop so callers can connect to its signals first.
    QMetaObject::invokeMethod(receiver, &PayloadReceiver::start, Qt::QueuedConnection);
    return Res<PayloadReceiver*>::ok(receiver);
}

DeviceManager::SubscriptionId DeviceManager::subscribe(const QString& device_id, Subscriber subscriber) {
    QMutexLocker lock(&subscribers_mutex_);
    const SubscriptionId id = next_subscription_++;
    subscribers_.emplace(id, Subscription{device_id, std::move(subscriber)});
    return id;
}

void DeviceManager::unsubscribe(SubscriptionId id) {
    QMutexLocker lock(&subscribers_mutex_);
    subscribers_.erase(id);
}

PacketDispatcher::HandlerId DeviceManager::registerHandler(const QString& type,
                                                           PacketDispatcher::Handler handler) {
    return dispatcher_.registerHandler(type, std::move(handler));
}

void DeviceManager::unregisterHandler(PacketDispatcher::HandlerId id) {
    dispatcher_.unregisterHandler(id);
}

// ============================================================================
// Pairing
// ============================================================================

Res<void> DeviceManager::requestPairing(const QString& device_id) {
    Device* target = device(device_id);
    if (target == nullptr || !target->isConnected()) {
        return fail(ErrorCode::Send, "device " + device_id.toStdString() + " is not connected");
    }
    return target->pairing().requestPairing();
}

Res<void> DeviceManager::acceptPairing(const QString& device_id) {
    Device* target = device(device_id);
    if (target == nullptr) {
        return fail(ErrorCode::InvalidState, "no pairing request from " + device_id.toStdString());
    }
    return target->pairing().acceptPairing();
}

Res<void> DeviceManager::rejectPairing(const QString& device_id) {
    Device* target = device(device_id);
    if (target == nullptr) {
        return fail(ErrorCode::InvalidState, "no pairing request from " + device_id.toStdString());
    }
    return target->pairing().rejectPairing();
}

Res<void> DeviceManager::cancelPairing(const QString& device_id) {
    Device* target = device(device_id);
    if (target == nullptr) {
        return fail(ErrorCode::InvalidState, "no pairing request to " + device_id.toStdString());
    }
    return target->pairing().cancelPairing();
}

Res<void> DeviceManager::unpair(const QString& device_id) {
    Device* target = device(device_id);
    if (target != nullptr && target->pairing().isPaired()) {
        return target->pairing().unpair();
    }
    if (!trust_.contains(device_id)) {
        return fail(ErrorCode::InvalidState, "device " + device_id.toStdString() + " is not paired");
    }
    auto removed = trust_.remove(device_id);
    if (removed.is_err()) {
        return removed;
    }
    qCInfo(konnectPairingLog) << "Forgot offline device" << device_id;
    discovery_->forgetEndpoint(device_id);
    emit pairingStateChanged(device_id, PairState::Unpaired);
    return Res<void>::ok();
}

PairState DeviceManager::pairingState(const QString& device_id) const {
    if (Device* target = device(device_id)) {
        return target->pairing().state();
    }
    return trust_.contains(device_id) ? PairState::Paired : PairState::Unpaired;
}

QString DeviceManager::verificationKey(const QString& device_id) const {
    Device* target = device(device_id);
    return target == nullptr ? QString() : target->pairing().verificationKey();
}

// ============================================================================
// Queries
// ============================================================================

QStringList DeviceManager::connectedDevices() const {
    return links_->connectedDevices();
}

std::vector<PeerRecord> DeviceManager::peers() const {
    return discovery_->peers();
}

std::vector<storage::TrustedDevice> DeviceManager::trustedDevices() const {
    return trust_.all();
}

} // namespace konnect::network
