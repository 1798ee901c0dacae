#include "network/device.hpp"

#include "core/logging.hpp"
#include "network/session.hpp"

namespace konnect::network {

Device::Device(const Identity& local, const Identity& peer, storage::TrustStore& trust,
               QSslCertificate local_certificate, PairingHandler::Settings settings,
               QObject* parent)
    : QObject(parent)
    , local_(local)
    , peer_(peer)
    , pairing_(std::make_unique<PairingHandler>(
          trust,
          PairingHandler::Peer{peer.device_id, peer.device_name, QSslCertificate{}, peer.protocol_version},
          std::move(local_certificate), settings, this))
{
}

Device::~Device() {
    pairing_->setSender({});
}

void Device::attachSession(Session* session) {
    if (session_ && session_ != session) {
        QObject::disconnect(session_, nullptr, this, nullptr);
    }
    session_ = session;
    peer_ = session->peerIdentity();
    last_address_ = session->peerAddress();

    pairing_->setPeer(PairingHandler::Peer{peer_.device_id, peer_.device_name,
                                           session->peerCertificate(), peer_.protocol_version});
    QPointer<Session> guarded(session);
    pairing_->setSender([guarded](const Packet& packet) -> Res<void> {
        if (guarded.isNull()) {
            return fail(ErrorCode::Send, "session is gone");
        }
        return guarded->sendPacket(packet);
    });
    connect(session, &Session::packetReceived, this, &Device::onSessionPacket);
}

void Device::detachSession() {
    if (session_) {
        QObject::disconnect(session_, nullptr, this, nullptr);
    }
    session_.clear();
    pairing_->setSender({});
}

Res<void> Device::sendPacket(const Packet& packet) {
    if (session_.isNull()) {
        return fail(ErrorCode::Send, "device " + peer_.device_id.toStdString() + " is not connected");
    }
    if (packet.type() != packet_type::PAIR) {
        if (!pairing_->isPaired()) {
            return fail(ErrorCode::Send, "device " + peer_.device_id.toStdString() + " is not paired");
        }
        if (!peer_.accepts(packet.type())) {
            qCDebug(konnectTransportLog) << "Not sending" << packet.type() << "to" << peer_.device_id
                                         << "(not an incoming capability)";
            return fail(ErrorCode::Send,
                        "device does not accept " + packet.type().toStdString());
        }
    }
    return session_->sendPacket(packet);
}

void Device::onSessionPacket(const Packet& packet) {
    if (packet.type() == packet_type::PAIR) {
        pairing_->handlePairPacket(packet);
        return;
    }
    if (packet.type() == packet_type::IDENTITY) {
        qCDebug(konnectTransportLog) << "Ignoring identity packet from" << peer_.device_id
                                     << "on an established session";
        return;
    }
    if (!pairing_->isPaired()) {
        qCWarning(konnectPairingLog) << "Dropping" << packet.type() << "from unpaired device"
                                     << peer_.device_id;
        return;
    }
    if (!local_.accepts(packet.type())) {
        qCDebug(konnectTransportLog) << "Dropping" << packet.type() << "from" << peer_.device_id
                                     << "(not an incoming capability)";
        return;
    }
    emit packetReceived(peer_.device_id, packet);
}

} // namespace konnect::network
