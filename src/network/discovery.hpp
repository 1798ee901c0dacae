#pragma once

#include "core/config.hpp"
#include "core/identity.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QHostAddress>
#include <QObject>
#include <QSet>
#include <QString>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <vector>

class QTimer;
class QUdpSocket;

namespace konnect::network {

/// Remembered endpoints of peers without a session expire after this long.
inline constexpr std::chrono::hours KNOWN_ENDPOINT_TTL{24 * 7};
inline constexpr size_t MAX_KNOWN_ENDPOINTS = 128;

/**
 * PeerRecord - what discovery knows about one remote host.
 */
struct PeerRecord {
    Identity identity;
    QHostAddress last_seen_address;
    Timestamp last_seen_at;
    bool reachable = true;
};

/**
 * DiscoveryEngine - UDP identity broadcast and the live peer map.
 *
 * Broadcasts the local identity every broadcast_interval to the broadcast
 * address (and unicast to configured custom hosts) and listens on the same
 * port. Records are refreshed by announcements and by established
 * sessions, marked unreachable after half the liveness timeout of silence
 * and dropped after the full timeout unless a session is active. Session
 * loss itself never touches a record.
 *
 * Endpoints of peers that had a session are remembered beyond pruning so
 * a lost session is retried directly (reconnectRequested) before waiting
 * for the next broadcast. They are redialed on start and every
 * broadcast_interval, even with broadcasting disabled, and forgotten on
 * unpair or after KNOWN_ENDPOINT_TTL without a session.
 */
class DiscoveryEngine : public QObject {
    Q_OBJECT

public:
    explicit DiscoveryEngine(Config config, QObject* parent = nullptr);
    ~DiscoveryEngine() override;

    /**
     * Bind the discovery port and start broadcasting. With broadcasting
     * disabled in the config only the peer map and direct reconnection
     * are active.
     */
    [[nodiscard]] Res<void> start(const Identity& local);
    void stop();
    [[nodiscard]] bool isRunning() const { return running_; }

    /// Replace the announced identity (rename, new tcp port) and announce it.
    void setLocalIdentity(const Identity& local);

    /// Broadcast now, plus unicast to every custom host.
    void announce();
    void announceTo(const QHostAddress& address);

    /**
     * Process one received datagram. Returns the device id it refreshed,
     * or nothing when the datagram was ignored.
     */
    std::optional<QString> handleDatagram(const QByteArray& datagram, const QHostAddress& sender);

    /// A session to this peer was established from/to address.
    void sessionEstablished(const Identity& peer, const QHostAddress& address);
    /// The session ended; schedules a direct reconnect attempt.
    void sessionEnded(const QString& device_id);

    /// Ask for a direct connection to every remembered endpoint without a session.
    void reconnectKnownPeers();

    /// Drop the remembered endpoint of a device; it is no longer redialed.
    void forgetEndpoint(const QString& device_id);
    [[nodiscard]] size_t knownEndpointCount() const { return known_endpoints_.size(); }

    /// Apply liveness rules as of now. Called by the prune timer.
    void pruneStale(Timestamp now);

    [[nodiscard]] std::vector<PeerRecord> peers() const;
    [[nodiscard]] std::optional<PeerRecord> peer(const QString& device_id) const;
    [[nodiscard]] quint16 boundPort() const;

signals:
    void peerDiscovered(const konnect::network::PeerRecord& record);
    void peerUpdated(const konnect::network::PeerRecord& record);
    void peerLost(const QString& device_id);

    /// Every accepted announcement, including heartbeats of known peers.
    void peerAnnounced(const konnect::network::PeerRecord& record);

    /// Try a direct TCP connection to a peer that had a session before.
    void reconnectRequested(const konnect::Identity& peer, const QHostAddress& address, quint16 port);

private slots:
    void onReadyRead();
    void onBroadcastTick();
    void onPruneTick();
    void onRedialTick();

private:
    struct KnownEndpoint {
        Identity identity;
        QHostAddress address;
        Timestamp last_session_at;
    };

    void upsert(const Identity& identity, const QHostAddress& address, bool announced);
    void sendDatagram(const QHostAddress& address);

    Config config_;
    Identity local_;
    bool running_ = false;

    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> broadcast_timer_;
    std::unique_ptr<QTimer> prune_timer_;
    std::unique_ptr<QTimer> redial_timer_;

    std::map<QString, PeerRecord> peers_;
    std::map<QString, KnownEndpoint> known_endpoints_;
    QSet<QString> active_sessions_;
};

} // namespace konnect::network

Q_DECLARE_METATYPE(konnect::network::PeerRecord)
