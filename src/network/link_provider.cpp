#include "network/link_provider.hpp"

#include "core/logging.hpp"
#include "network/tls.hpp"

#include <QMutexLocker>

namespace konnect::network {

void TcpListener::incomingConnection(qintptr descriptor) {
    emit descriptorReady(descriptor);
}

// ============================================================================
// LinkProvider
// ============================================================================

LinkProvider::LinkProvider(Config config, crypto::LocalCertificate certificate,
                           const storage::TrustStore* trust, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , certificate_(std::move(certificate))
    , trust_(trust)
    , tls_(make_tls_configuration(certificate_))
    , server_(std::make_unique<TcpListener>(this))
{
    connect(server_.get(), &TcpListener::descriptorReady,
            this, &LinkProvider::onDescriptorReady);
}

LinkProvider::~LinkProvider() {
    stop();
}

Res<quint16> LinkProvider::listen(const Identity& local) {
    local_ = local;
    if (server_->isListening()) {
        return Res<quint16>::ok(server_->serverPort());
    }
    if (config_.tcp_port_min == 0) {
        if (server_->listen(QHostAddress::Any, 0)) {
            local_.tcp_port = server_->serverPort();
            return Res<quint16>::ok(server_->serverPort());
        }
        return fail<quint16>(ErrorCode::Network, server_->errorString().toStdString());
    }
    for (quint32 port = config_.tcp_port_min; port <= config_.tcp_port_max; ++port) {
        if (server_->listen(QHostAddress::Any, static_cast<quint16>(port))) {
            local_.tcp_port = static_cast<uint16_t>(port);
            qCInfo(konnectTransportLog) << "Listening for sessions on port" << port;
            return Res<quint16>::ok(static_cast<quint16>(port));
        }
    }
    return fail<quint16>(ErrorCode::Network,
                         "no free TCP port in " + std::to_string(config_.tcp_port_min) + "-" +
                         std::to_string(config_.tcp_port_max));
}

void LinkProvider::stop() {
    server_->close();
    // Registered and handshaking sessions alike are direct children.
    const auto sessions = findChildren<Session*>(Qt::FindDirectChildrenOnly);
    for (auto* session : sessions) {
        session->close();
    }
}

quint16 LinkProvider::port() const {
    return server_->serverPort();
}

bool LinkProvider::isListening() const {
    return server_->isListening();
}

void LinkProvider::setLocalIdentity(const Identity& local) {
    const uint16_t port = local_.tcp_port;
    local_ = local;
    if (server_->isListening()) {
        local_.tcp_port = port;
    }
}

Session* LinkProvider::createSession() {
    Session::Context context;
    context.local = local_;
    context.tls = tls_;
    context.trust = trust_;
    context.handshake_timeout = config_.handshake_timeout;
    context.max_identity_size = config_.max_identity_size;

    auto* session = new Session(std::move(context), this);
    connect(session, &Session::ready, this, [this, session] {
        onSessionReady(session);
    });
    connect(session, &Session::closed, this, [this, session](const Error& error) {
        onSessionClosed(session, error);
    });
    connect(session, &Session::trustViolation, this, &LinkProvider::trustViolation);
    return session;
}

void LinkProvider::onDescriptorReady(qintptr descriptor) {
    auto* session = createSession();
    auto accepted = session->acceptConnection(descriptor);
    if (accepted.is_err()) {
        qCWarning(konnectTransportLog) << "Dropping incoming connection:"
                                       << QString::fromStdString(accepted.unwrap_err().message);
        session->deleteLater();
    }
}

bool LinkProvider::rateLimited(const QString& device_id, const QHostAddress& address) {
    const Timestamp now = Timestamp::now();
    const QString host = address.toString();

    const auto recent = [&](const std::map<QString, Timestamp>& table, const QString& key) {
        const auto it = table.find(key);
        return it != table.end() && now - it->second < config_.connect_rate_limit;
    };
    if (recent(last_dial_by_device_, device_id) || recent(last_dial_by_address_, host)) {
        return true;
    }
    last_dial_by_device_[device_id] = now;
    last_dial_by_address_[host] = now;
    return false;
}

Res<void> LinkProvider::connectTo(const Identity& peer, const QHostAddress& address, quint16 port) {
    {
        QMutexLocker lock(&registry_mutex_);
        if (registry_.count(peer.device_id) > 0 || dialing_.contains(peer.device_id)) {
            return fail(ErrorCode::InvalidState, "already connected or connecting");
        }
    }
    if (port == 0) {
        return fail(ErrorCode::InvalidArgument, "peer did not announce a TCP port");
    }
    if (rateLimited(peer.device_id, address)) {
        return fail(ErrorCode::Network, "connection attempt rate limited");
    }

    auto* session = createSession();
    auto started = session->connectToPeer(address, port, peer);
    if (started.is_err()) {
        session->deleteLater();
        return started;
    }
    QMutexLocker lock(&registry_mutex_);
    dialing_.insert(peer.device_id);
    return Res<void>::ok();
}

LinkProvider::Keep LinkProvider::arbitrate(const Session* registered, const Session* candidate) const {
    // A certificate change is never a reconnect of the same device.
    if (!crypto::same_certificate(registered->peerCertificate().toDer(),
                                  candidate->peerCertificate().toDer())) {
        return Keep::Registered;
    }
    // Both ends see the same two connections when dials cross; the one
    // opened by the smaller device id survives on both.
    const bool concurrent = registered->readyFor() < config_.handshake_timeout;
    const QString registered_by = registered->initiatorDeviceId();
    const QString candidate_by = candidate->initiatorDeviceId();
    if (concurrent && registered_by != candidate_by) {
        return registered_by < candidate_by ? Keep::Registered : Keep::Candidate;
    }
    // The peer came back while the old link was still up; it is stale.
    return Keep::Candidate;
}

void LinkProvider::onSessionReady(Session* session) {
    const QString id = session->peerDeviceId();
    Session* loser = nullptr;
    {
        QMutexLocker lock(&registry_mutex_);
        if (session->origin() == Session::Origin::Outgoing) {
            dialing_.remove(id);
        }
        const auto it = registry_.find(id);
        if (it == registry_.end()) {
            registry_.emplace(id, session);
        } else if (arbitrate(it->second, session) == Keep::Candidate) {
            loser = it->second;
            it->second = session;
        } else {
            loser = session;
        }
    }
    if (loser == session) {
        qCInfo(konnectTransportLog) << "Closing duplicate session with" << id;
        session->close();
        return;
    }
    if (loser) {
        // No longer registered, so its close is not reported as a disconnect.
        qCInfo(konnectTransportLog) << "Replacing session with" << id;
        loser->close();
    }
    emit sessionReady(session);
}

void LinkProvider::onSessionClosed(Session* session, const Error& error) {
    const QString id = session->peerDeviceId();
    bool was_registered = false;
    {
        QMutexLocker lock(&registry_mutex_);
        if (session->origin() == Session::Origin::Outgoing) {
            dialing_.remove(id);
        }
        const auto it = registry_.find(id);
        if (it != registry_.end() && it->second == session) {
            registry_.erase(it);
            was_registered = true;
        }
    }
    session->deleteLater();
    if (was_registered) {
        emit sessionClosed(id, error);
    }
}

Session* LinkProvider::session(const QString& device_id) const {
    QMutexLocker lock(&registry_mutex_);
    const auto it = registry_.find(device_id);
    return it == registry_.end() ? nullptr : it->second;
}

bool LinkProvider::hasSession(const QString& device_id) const {
    return session(device_id) != nullptr;
}

QStringList LinkProvider::connectedDevices() const {
    QMutexLocker lock(&registry_mutex_);
    QStringList ids;
    for (const auto& [id, session] : registry_) {
        ids.append(id);
    }
    return ids;
}

void LinkProvider::disconnectDevice(const QString& device_id) {
    if (auto* s = session(device_id)) {
        s->close();
    }
}

} // namespace konnect::network
