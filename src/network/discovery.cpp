#include "network/discovery.hpp"

#include "core/logging.hpp"
#include "network/discovery_datagram.hpp"

#include <QNetworkDatagram>
#include <QRandomGenerator>
#include <QTimer>
#include <QUdpSocket>

namespace konnect::network {

DiscoveryEngine::DiscoveryEngine(Config config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , broadcast_timer_(std::make_unique<QTimer>(this))
    , prune_timer_(std::make_unique<QTimer>(this))
    , redial_timer_(std::make_unique<QTimer>(this))
{
    broadcast_timer_->setInterval(config_.broadcast_interval);
    prune_timer_->setInterval(config_.prune_interval);
    redial_timer_->setInterval(config_.broadcast_interval);

    connect(broadcast_timer_.get(), &QTimer::timeout, this, &DiscoveryEngine::onBroadcastTick);
    connect(prune_timer_.get(), &QTimer::timeout, this, &DiscoveryEngine::onPruneTick);
    connect(redial_timer_.get(), &QTimer::timeout, this, &DiscoveryEngine::onRedialTick);
}

DiscoveryEngine::~DiscoveryEngine() {
    broadcast_timer_->stop();
    prune_timer_->stop();
    redial_timer_->stop();
    socket_.reset();
}

Res<void> DiscoveryEngine::start(const Identity& local) {
    if (running_) {
        return fail(ErrorCode::InvalidState, "discovery already running");
    }
    local_ = local;

    if (config_.discovery_enabled) {
        socket_ = std::make_unique<QUdpSocket>(this);
        if (!socket_->bind(QHostAddress::AnyIPv4,
                           config_.discovery_port,
                           QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
            auto msg = socket_->errorString().toStdString();
            socket_.reset();
            return fail(ErrorCode::Network, "cannot bind discovery port " +
                                                std::to_string(config_.discovery_port) + ": " + msg);
        }
        connect(socket_.get(), &QUdpSocket::readyRead, this, &DiscoveryEngine::onReadyRead);
        broadcast_timer_->start();
    } else {
        qCInfo(konnectDiscoveryLog) << "UDP discovery disabled; only direct reconnection is active";
    }

    prune_timer_->start();
    redial_timer_->start();
    running_ = true;
    announce();
    // Endpoints survive stop(); a restart redials them right away.
    reconnectKnownPeers();
    return Res<void>::ok();
}

void DiscoveryEngine::stop() {
    if (!running_) return;
    running_ = false;
    broadcast_timer_->stop();
    prune_timer_->stop();
    redial_timer_->stop();
    socket_.reset();

    const auto records = std::move(peers_);
    peers_.clear();
    for (const auto& [id, record] : records) {
        emit peerLost(id);
    }
}

void DiscoveryEngine::setLocalIdentity(const Identity& local) {
    local_ = local;
    announce();
}

void DiscoveryEngine::announce() {
    if (!socket_) return;
    sendDatagram(QHostAddress(QHostAddress::Broadcast));
    for (const auto& host : config_.custom_hosts) {
        const QHostAddress address(host.trimmed());
        if (address.isNull()) {
            qCWarning(konnectDiscoveryLog) << "ignoring custom host that is not an IP address:" << host;
            continue;
        }
        sendDatagram(address);
    }
}

void DiscoveryEngine::announceTo(const QHostAddress& address) {
    if (!socket_) return;
    sendDatagram(address);
}

void DiscoveryEngine::sendDatagram(const QHostAddress& address) {
    auto bytes = encode_discovery_datagram(local_);
    if (bytes.is_err()) {
        qCWarning(konnectDiscoveryLog) << "not announcing:" << bytes.unwrap_err().message.c_str();
        return;
    }
    if (socket_->writeDatagram(bytes.unwrap(), address, config_.discovery_port) < 0) {
        qCDebug(konnectDiscoveryLog) << "announcement to" << address << "failed:" << socket_->errorString();
    }
}

std::optional<QString> DiscoveryEngine::handleDatagram(const QByteArray& datagram,
                                                       const QHostAddress& sender) {
    auto decoded = decode_discovery_datagram(datagram, config_.max_identity_size);
    if (decoded.is_err()) {
        qCDebug(konnectDiscoveryLog) << "ignoring datagram from" << sender << ":"
                                     << decoded.unwrap_err().message.c_str();
        return std::nullopt;
    }

    const auto identity = std::move(decoded).unwrap();
    if (identity.device_id == local_.device_id) {
        return std::nullopt;
    }

    upsert(identity, sender, true);
    return identity.device_id;
}

void DiscoveryEngine::upsert(const Identity& identity, const QHostAddress& address, bool announced) {
    const auto now = Timestamp::now();
    auto it = peers_.find(identity.device_id);
    if (it == peers_.end()) {
        PeerRecord record{identity, address, now, true};
        peers_.emplace(identity.device_id, record);
        qCInfo(konnectDiscoveryLog).noquote() << "discovered" << identity.device_name
                                              << "(" << identity.device_id << ") at"
                                              << address.toString();
        emit peerDiscovered(record);
        if (announced) emit peerAnnounced(record);
        return;
    }

    auto& record = it->second;
    const bool changed = record.identity != identity ||
                         record.last_seen_address != address ||
                         !record.reachable;
    record.identity = identity;
    record.last_seen_address = address;
    record.last_seen_at = now;
    record.reachable = true;

    // Slots may re-enter the engine; emit copies.
    const PeerRecord snapshot = record;
    if (changed) emit peerUpdated(snapshot);
    if (announced) emit peerAnnounced(snapshot);
}

void DiscoveryEngine::sessionEstablished(const Identity& peer, const QHostAddress& address) {
    active_sessions_.insert(peer.device_id);
    known_endpoints_[peer.device_id] = KnownEndpoint{peer, address, Timestamp::now()};
    if (known_endpoints_.size() > MAX_KNOWN_ENDPOINTS) {
        auto oldest = known_endpoints_.end();
        for (auto it = known_endpoints_.begin(); it != known_endpoints_.end(); ++it) {
            if (active_sessions_.contains(it->first)) continue;
            if (oldest == known_endpoints_.end() || it->second.last_session_at < oldest->second.last_session_at) {
                oldest = it;
            }
        }
        if (oldest != known_endpoints_.end()) {
            known_endpoints_.erase(oldest);
        }
    }
    upsert(peer, address, false);
}

void DiscoveryEngine::sessionEnded(const QString& device_id) {
    active_sessions_.remove(device_id);
    auto ended = known_endpoints_.find(device_id);
    if (ended == known_endpoints_.end()) return;
    ended->second.last_session_at = Timestamp::now();
    if (!running_) return;

    // Both ends lose the session at once; jitter keeps their redials apart.
    const auto base = config_.reconnect_delay.count();
    const auto jitter = QRandomGenerator::global()->bounded(static_cast<int>(base / 2) + 1);
    QTimer::singleShot(std::chrono::milliseconds(base + jitter), this, [this, device_id] {
        if (!running_ || active_sessions_.contains(device_id)) return;
        auto it = known_endpoints_.find(device_id);
        if (it == known_endpoints_.end()) return;
        qCDebug(konnectDiscoveryLog) << "direct reconnect to" << device_id << "at" << it->second.address;
        emit reconnectRequested(it->second.identity, it->second.address, it->second.identity.tcp_port);
    });
}

void DiscoveryEngine::reconnectKnownPeers() {
    if (!running_) return;
    const auto endpoints = known_endpoints_;
    for (const auto& [id, endpoint] : endpoints) {
        if (active_sessions_.contains(id) || endpoint.identity.tcp_port == 0) continue;
        emit reconnectRequested(endpoint.identity, endpoint.address, endpoint.identity.tcp_port);
    }
}

void DiscoveryEngine::forgetEndpoint(const QString& device_id) {
    if (known_endpoints_.erase(device_id) > 0) {
        qCDebug(konnectDiscoveryLog) << "forgot endpoint of" << device_id;
    }
}

void DiscoveryEngine::pruneStale(Timestamp now) {
    std::vector<QString> lost;
    std::vector<PeerRecord> unreachable;

    for (auto& [id, record] : peers_) {
        if (active_sessions_.contains(id)) continue;
        const auto silence = now - record.last_seen_at;
        if (silence > config_.liveness_timeout) {
            lost.push_back(id);
        } else if (record.reachable && silence > config_.liveness_timeout / 2) {
            record.reachable = false;
            unreachable.push_back(record);
        }
    }

    for (auto it = known_endpoints_.begin(); it != known_endpoints_.end();) {
        if (!active_sessions_.contains(it->first) && now - it->second.last_session_at > KNOWN_ENDPOINT_TTL) {
            it = known_endpoints_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& record : unreachable) {
        emit peerUpdated(record);
    }
    for (const auto& id : lost) {
        peers_.erase(id);
        qCInfo(konnectDiscoveryLog) << "lost" << id;
        emit peerLost(id);
    }
}

std::vector<PeerRecord> DiscoveryEngine::peers() const {
    std::vector<PeerRecord> out;
    out.reserve(peers_.size());
    for (const auto& [id, record] : peers_) {
        out.push_back(record);
    }
    return out;
}

std::optional<PeerRecord> DiscoveryEngine::peer(const QString& device_id) const {
    auto it = peers_.find(device_id);
    if (it == peers_.end()) return std::nullopt;
    return it->second;
}

quint16 DiscoveryEngine::boundPort() const {
    return socket_ ? socket_->localPort() : 0;
}

void DiscoveryEngine::onReadyRead() {
    if (!socket_) return;
    while (socket_->hasPendingDatagrams()) {
        const QNetworkDatagram datagram = socket_->receiveDatagram();
        if (!datagram.isValid()) continue;
        handleDatagram(datagram.data(), datagram.senderAddress());
    }
}

void DiscoveryEngine::onBroadcastTick() {
    announce();
}

void DiscoveryEngine::onPruneTick() {
    pruneStale(Timestamp::now());
}

void DiscoveryEngine::onRedialTick() {
    reconnectKnownPeers();
}

} // namespace konnect::network
