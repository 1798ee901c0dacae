#include "network/pairing.hpp"

#include "core/logging.hpp"
#include "crypto/certificate.hpp"
#include "storage/trust_store.hpp"

#include <QMutexLocker>
#include <QTimer>

#include <cstdlib>

namespace konnect::network {

const char* pair_state_name(PairState state) {
    switch (state) {
        case PairState::Unpaired: return "unpaired";
        case PairState::RequestSent: return "request-sent";
        case PairState::RequestReceived: return "request-received";
        case PairState::Paired: return "paired";
        case PairState::Rejected: return "rejected";
        case PairState::TimedOut: return "timed-out";
    }
    return "unknown";
}

Res<Packet> make_pair_packet(bool pair, std::optional<int64_t> timestamp) {
    PacketBuilder builder(packet_type::PAIR);
    builder.set(QStringLiteral("pair"), pair);
    if (timestamp) {
        builder.set(QStringLiteral("timestamp"), QVariant::fromValue<qlonglong>(*timestamp));
    }
    return builder.build();
}

PairingHandler::PairingHandler(storage::TrustStore& trust, Peer peer,
                               QSslCertificate local_certificate, Settings settings,
                               QObject* parent)
    : QObject(parent)
    , trust_(trust)
    , peer_(std::move(peer))
    , local_certificate_(std::move(local_certificate))
    , settings_(settings)
    , timer_(std::make_unique<QTimer>(this))
{
    timer_->setSingleShot(true);
    connect(timer_.get(), &QTimer::timeout, this, &PairingHandler::onTimeout);
    if (trust_.contains(peer_.device_id)) {
        state_ = PairState::Paired;
    }
}

PairingHandler::~PairingHandler() = default;

void PairingHandler::setSender(Sender sender) {
    QMutexLocker lock(&mu_);
    sender_ = std::move(sender);
}

void PairingHandler::setPeer(Peer peer) {
    QMutexLocker lock(&mu_);
    peer_ = std::move(peer);
}

PairState PairingHandler::state() const {
    QMutexLocker lock(&mu_);
    return state_;
}

QString PairingHandler::verificationKey() const {
    QMutexLocker lock(&mu_);
    return verificationKeyLocked();
}

QString PairingHandler::verificationKeyLocked() const {
    if (state_ != PairState::RequestSent && state_ != PairState::RequestReceived) {
        return {};
    }
    if (peer_.certificate.isNull() || local_certificate_.isNull()) {
        return {};
    }
    return crypto::verification_key(local_certificate_, peer_.certificate, request_timestamp_);
}

// ============================================================================
// Helpers (called with mu_ held)
// ============================================================================

void PairingHandler::setStateLocked(PairState state, Effects& effects) {
    state_ = state;
    effects.states.push_back(state);
}

Res<void> PairingHandler::sendLocked(bool pair, std::optional<int64_t> timestamp) {
    if (!sender_) {
        return fail(ErrorCode::Send, "device is not connected");
    }
    auto packet = make_pair_packet(pair, timestamp);
    if (packet.is_err()) {
        return Res<void>::err(packet.unwrap_err());
    }
    return sender_(packet.unwrap());
}

void PairingHandler::answerLocked(bool pair) {
    auto sent = sendLocked(pair);
    if (sent.is_err()) {
        qCDebug(konnectPairingLog) << "pair=" << pair << "not sent to" << peer_.device_id << ":"
                                   << QString::fromStdString(sent.unwrap_err().message);
    }
}

Res<void> PairingHandler::persistLocked() {
    if (peer_.certificate.isNull()) {
        return fail(ErrorCode::Handshake, "no peer certificate to pin");
    }
    storage::TrustedDevice device;
    device.device_id = peer_.device_id;
    device.device_name = peer_.device_name;
    device.certificate = peer_.certificate.toDer();
    device.fingerprint = crypto::fingerprint(peer_.certificate);
    device.paired_at = Timestamp::now();
    device.protocol_version = peer_.protocol_version;
    return trust_.add(device);
}

void PairingHandler::publish(const Effects& effects) {
    for (const auto state : effects.states) {
        emit stateChanged(peer_.device_id, state);
    }
    if (effects.requested) {
        emit pairingRequested(peer_.device_id, verificationKey());
    }
    if (effects.failure) {
        emit pairingFailed(peer_.device_id, *effects.failure);
    }
}

// ============================================================================
// Local actions
// ============================================================================

Res<void> PairingHandler::requestPairing() {
    Effects effects;
    {
        QMutexLocker lock(&mu_);
        if (state_ == PairState::Paired || state_ == PairState::RequestSent) {
            return Res<void>::ok();
        }
        if (state_ == PairState::RequestReceived) {
            return fail(ErrorCode::InvalidState, "peer already requested pairing; accept or reject it");
        }
        const int64_t now = Timestamp::now().seconds();
        auto sent = sendLocked(true, now);
        if (sent.is_err()) {
            return sent;
        }
        request_timestamp_ = now;
        setStateLocked(PairState::RequestSent, effects);
        timer_->start(static_cast<int>(settings_.timeout.count()));
        qCInfo(konnectPairingLog) << "Pairing requested with" << peer_.device_id;
    }
    publish(effects);
    return Res<void>::ok();
}

Res<void> PairingHandler::acceptPairing() {
    Effects effects;
    Res<void> result = Res<void>::ok();
    {
        QMutexLocker lock(&mu_);
        if (state_ != PairState::RequestReceived) {
            return fail(ErrorCode::InvalidState,
                        std::string("no pairing request to accept (") + pair_state_name(state_) + ")");
        }
        timer_->stop();
        auto stored = persistLocked();
        if (stored.is_err()) {
            qCWarning(konnectPairingLog) << "Could not store pairing with" << peer_.device_id
                                         << QString::fromStdString(stored.unwrap_err().message);
            answerLocked(false);
            setStateLocked(PairState::Unpaired, effects);
            effects.failure = stored.unwrap_err();
            result = stored;
        } else {
            setStateLocked(PairState::Paired, effects);
            auto answered = sendLocked(true);
            if (answered.is_err()) {
                // Stay paired; the peer times out and can ask again.
                qCWarning(konnectPairingLog) << "Paired with" << peer_.device_id
                                             << "but pair=true not sent:"
                                             << QString::fromStdString(answered.unwrap_err().message);
            }
            qCInfo(konnectPairingLog) << "Paired with" << peer_.device_id;
        }
    }
    publish(effects);
    return result;
}

Res<void> PairingHandler::rejectPairing() {
    Effects effects;
    {
        QMutexLocker lock(&mu_);
        if (state_ != PairState::RequestReceived) {
            return fail(ErrorCode::InvalidState, "no pairing request to reject");
        }
        timer_->stop();
        answerLocked(false);
        setStateLocked(PairState::Rejected, effects);
        setStateLocked(PairState::Unpaired, effects);
        qCInfo(konnectPairingLog) << "Rejected pairing with" << peer_.device_id;
    }
    publish(effects);
    return Res<void>::ok();
}

Res<void> PairingHandler::cancelPairing() {
    Effects effects;
    {
        QMutexLocker lock(&mu_);
        if (state_ != PairState::RequestSent) {
            return fail(ErrorCode::InvalidState, "no outgoing pairing request");
        }
        timer_->stop();
        answerLocked(false);
        setStateLocked(PairState::Unpaired, effects);
    }
    publish(effects);
    return Res<void>::ok();
}

Res<void> PairingHandler::unpair() {
    Effects effects;
    {
        QMutexLocker lock(&mu_);
        if (state_ != PairState::Paired) {
            return fail(ErrorCode::InvalidState, "device is not paired");
        }
        auto removed = trust_.remove(peer_.device_id);
        if (removed.is_err()) {
            return removed;
        }
        answerLocked(false);
        setStateLocked(PairState::Unpaired, effects);
        qCInfo(konnectPairingLog) << "Unpaired" << peer_.device_id;
    }
    publish(effects);
    return Res<void>::ok();
}

// ============================================================================
// Peer packets
// ============================================================================

void PairingHandler::receiveRequestLocked(const Packet& packet, Effects& effects) {
    const bool has_timestamp = packet.has(QStringLiteral("timestamp"));
    const int64_t now = Timestamp::now().seconds();
    int64_t timestamp = now;

    if (has_timestamp) {
        timestamp = packet.get_int(QStringLiteral("timestamp"));
        if (std::llabs(now - timestamp) > settings_.timestamp_skew.count()) {
            qCWarning(konnectPairingLog) << "Refusing pair request from" << peer_.device_id
                                         << "with clock skew of" << (now - timestamp) << "s";
            answerLocked(false);
            return;
        }
    } else if (peer_.protocol_version >= 8) {
        qCWarning(konnectPairingLog) << "Refusing pair request without timestamp from"
                                     << peer_.device_id;
        answerLocked(false);
        return;
    }

    request_timestamp_ = timestamp;
    setStateLocked(PairState::RequestReceived, effects);
    effects.requested = true;
    timer_->start(static_cast<int>(settings_.timeout.count()));
    qCInfo(konnectPairingLog) << "Pairing requested by" << peer_.device_id;
}

void PairingHandler::handlePairPacket(const Packet& packet) {
    if (packet.type() != packet_type::PAIR) {
        return;
    }
    if (!packet.body().value(QStringLiteral("pair")).isBool()) {
        qCWarning(konnectPairingLog) << "Ignoring pair packet without a boolean 'pair' from"
                                     << peer_.device_id;
        return;
    }
    const bool pair = packet.get_bool(QStringLiteral("pair"));

    Effects effects;
    {
        QMutexLocker lock(&mu_);
        switch (state_) {
            case PairState::Unpaired:
                if (pair) {
                    receiveRequestLocked(packet, effects);
                }
                break;

            case PairState::RequestSent:
                timer_->stop();
                if (pair) {
                    auto stored = persistLocked();
                    if (stored.is_err()) {
                        qCWarning(konnectPairingLog) << "Could not store pairing with"
                                                     << peer_.device_id
                                                     << QString::fromStdString(stored.unwrap_err().message);
                        answerLocked(false);
                        setStateLocked(PairState::Unpaired, effects);
                        effects.failure = stored.unwrap_err();
                    } else {
                        setStateLocked(PairState::Paired, effects);
                        qCInfo(konnectPairingLog) << "Paired with" << peer_.device_id;
                    }
                } else {
                    setStateLocked(PairState::Rejected, effects);
                    setStateLocked(PairState::Unpaired, effects);
                    effects.failure = Error{"peer rejected the pairing request",
                                            ErrorCode::PairingRejected};
                    qCInfo(konnectPairingLog) << peer_.device_id << "rejected pairing";
                }
                break;

            case PairState::RequestReceived:
                if (!pair) {
                    timer_->stop();
                    setStateLocked(PairState::Unpaired, effects);
                    qCInfo(konnectPairingLog) << peer_.device_id << "canceled its pairing request";
                }
                break;

            case PairState::Paired:
                if (!pair) {
                    auto removed = trust_.remove(peer_.device_id);
                    if (removed.is_err()) {
                        qCCritical(konnectPairingLog) << "Could not forget" << peer_.device_id
                                                      << QString::fromStdString(removed.unwrap_err().message);
                        effects.failure = removed.unwrap_err();
                    }
                    setStateLocked(PairState::Unpaired, effects);
                    qCInfo(konnectPairingLog) << peer_.device_id << "unpaired us";
                }
                break;

            case PairState::Rejected:
            case PairState::TimedOut:
                break;
        }
    }
    publish(effects);
}

void PairingHandler::onTimeout() {
    Effects effects;
    {
        QMutexLocker lock(&mu_);
        if (state_ != PairState::RequestSent && state_ != PairState::RequestReceived) {
            return;
        }
        answerLocked(false);
        setStateLocked(PairState::TimedOut, effects);
        setStateLocked(PairState::Unpaired, effects);
        effects.failure = Error{"pairing request timed out", ErrorCode::PairingTimeout};
        qCInfo(konnectPairingLog) << "Pairing with" << peer_.device_id << "timed out";
    }
    publish(effects);
}

} // namespace konnect::network
