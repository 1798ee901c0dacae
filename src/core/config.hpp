#pragma once

#include "core/packet.hpp"
#include "core/result.hpp"

#include <QSet>
#include <QString>
#include <QStringList>

#include <chrono>
#include <cstdint>

class QSettings;

namespace konnect {

/// Upper bound for every configured duration; QTimer takes int milliseconds.
inline constexpr std::chrono::hours MAX_CONFIG_DURATION{24};

/**
 * Config - policy constants of the LAN backend.
 *
 * Defaults match what KDE Connect peers expect on the wire (ports) and
 * conservative values for the local policies (timeouts, rate limits).
 */
struct Config {
    uint16_t discovery_port = 1716;
    uint16_t tcp_port_min = 1716;
    uint16_t tcp_port_max = 1764;
    uint16_t payload_port_min = 1739;
    uint16_t payload_port_max = 1764;

    std::chrono::milliseconds broadcast_interval{5000};
    std::chrono::milliseconds liveness_timeout{60000};
    std::chrono::milliseconds prune_interval{1000};
    std::chrono::milliseconds reconnect_delay{2000};
    std::chrono::milliseconds connect_rate_limit{1000};

    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds payload_accept_timeout{10000};

    std::chrono::milliseconds pairing_timeout{30000};
    std::chrono::seconds pair_timestamp_skew{1800};

    qsizetype max_identity_size = MAX_IDENTITY_PACKET_SIZE;
    bool discovery_enabled = true;
    QStringList custom_hosts;

    // Directory holding certificate.pem, privateKey.pem and trusted.db.
    QString data_dir;

    QSet<QString> incoming_capabilities;
    QSet<QString> outgoing_capabilities;

    [[nodiscard]] Res<void> validate() const;
};

/**
 * Read discovery/*, transport/*, pairing/* and plugins/* keys on top of the
 * defaults. Missing keys keep their defaults.
 */
[[nodiscard]] Res<Config> load_config(QSettings& settings);

/**
 * Apply KONNECT_* environment overrides (KONNECT_DISABLE_DISCOVERY,
 * KONNECT_DISCOVERY_PORT, KONNECT_PAIRING_TIMEOUT_MS,
 * KONNECT_LIVENESS_TIMEOUT_MS, KONNECT_CUSTOM_HOSTS, KONNECT_DATA_DIR).
 */
[[nodiscard]] Res<void> apply_environment(Config& config);

/// AppDataLocation, used when data_dir is not configured.
[[nodiscard]] QString default_data_dir();

} // namespace konnect
