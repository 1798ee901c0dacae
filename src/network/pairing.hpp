#pragma once

#include "core/packet.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QMutex>
#include <QObject>
#include <QSslCertificate>
#include <QString>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

class QTimer;

namespace konnect::storage {
class TrustStore;
}

namespace konnect::network {

/**
 * Pairing state of one peer. Rejected and TimedOut are transient: they are
 * reported and immediately followed by Unpaired.
 */
enum class PairState {
    Unpaired,
    RequestSent,
    RequestReceived,
    Paired,
    Rejected,
    TimedOut,
};

[[nodiscard]] const char* pair_state_name(PairState state);

/// kdeconnect.pair packet; requests carry the sender's clock in seconds.
[[nodiscard]] Res<Packet> make_pair_packet(bool pair, std::optional<int64_t> timestamp = std::nullopt);

/**
 * PairingHandler - trust state machine for one peer.
 *
 * The peer certificate is the one presented in the current session; it is
 * what gets pinned in the TrustStore when pairing completes. Persisting
 * happens before the state becomes Paired, so a failed write never leaves
 * a peer looking paired.
 *
 * Transitions are serialized by a mutex. Outgoing pair packets are handed
 * to the sender under that mutex; signals are emitted after it is
 * released, so slots may call back into the handler. The sender must not
 * deliver synchronously to another handler (Session::sendPacket only
 * enqueues).
 */
class PairingHandler : public QObject {
    Q_OBJECT

public:
    using Sender = std::function<Res<void>(const Packet&)>;

    struct Peer {
        QString device_id;
        QString device_name;
        QSslCertificate certificate;
        int protocol_version{0};
    };

    struct Settings {
        std::chrono::milliseconds timeout{30000};
        std::chrono::seconds timestamp_skew{1800};
    };

    PairingHandler(storage::TrustStore& trust, Peer peer,
                   QSslCertificate local_certificate, Settings settings,
                   QObject* parent = nullptr);
    ~PairingHandler() override;

    /// Attach the current session's send function; an empty one detaches.
    void setSender(Sender sender);

    /// A new session to the same device; refreshes the presented certificate.
    void setPeer(Peer peer);

    [[nodiscard]] PairState state() const;
    [[nodiscard]] bool isPaired() const { return state() == PairState::Paired; }
    [[nodiscard]] QString deviceId() const { return peer_.device_id; }

    /// Unpaired -> RequestSent. No-op when already requested or paired.
    [[nodiscard]] Res<void> requestPairing();

    /// RequestReceived -> Paired (persist, then answer pair=true).
    [[nodiscard]] Res<void> acceptPairing();

    /// RequestReceived -> Rejected -> Unpaired (answer pair=false).
    [[nodiscard]] Res<void> rejectPairing();

    /// RequestSent -> Unpaired (tell the peer pair=false).
    [[nodiscard]] Res<void> cancelPairing();

    /// Paired -> Unpaired: tell the peer and delete the pinned certificate.
    [[nodiscard]] Res<void> unpair();

    /// Feed one kdeconnect.pair packet from the peer.
    void handlePairPacket(const Packet& packet);

    /**
     * Code shown to the user while a request is pending, identical on both
     * devices. Empty outside RequestSent/RequestReceived.
     */
    [[nodiscard]] QString verificationKey() const;

signals:
    void stateChanged(const QString& device_id, konnect::network::PairState state);
    void pairingRequested(const QString& device_id, const QString& verification_key);
    void pairingFailed(const QString& device_id, const konnect::Error& error);

private slots:
    void onTimeout();

private:
    struct Effects {
        std::vector<PairState> states;
        std::optional<Error> failure;
        bool requested = false;
    };

    void publish(const Effects& effects);
    void setStateLocked(PairState state, Effects& effects);
    [[nodiscard]] Res<void> sendLocked(bool pair, std::optional<int64_t> timestamp = std::nullopt);
    // Best effort: failures are logged, the transition stands.
    void answerLocked(bool pair);
    [[nodiscard]] Res<void> persistLocked();
    [[nodiscard]] QString verificationKeyLocked() const;
    void receiveRequestLocked(const Packet& packet, Effects& effects);

    storage::TrustStore& trust_;
    Peer peer_;
    QSslCertificate local_certificate_;
    Settings settings_;
    Sender sender_;
    std::unique_ptr<QTimer> timer_;

    mutable QMutex mu_;
    PairState state_ = PairState::Unpaired;
    int64_t request_timestamp_ = 0;
};

} // namespace konnect::network
