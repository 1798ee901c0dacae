#pragma once

#include "core/packet.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QSet>
#include <QString>

#include <cstdint>
#include <optional>

class QSettings;

namespace konnect {

inline constexpr int PROTOCOL_VERSION = 8;
inline constexpr int MIN_PROTOCOL_VERSION = 7;
inline constexpr qsizetype MAX_DEVICE_NAME_LENGTH = 32;
inline constexpr qsizetype MAX_DEVICE_ID_LENGTH = 38;

/**
 * Identity - self-description a host announces over UDP and exchanges at
 * the start of every TCP session.
 */
struct Identity {
    QString device_id;
    QString device_name;
    DeviceType device_type{DeviceType::Desktop};
    int protocol_version{PROTOCOL_VERSION};
    uint16_t tcp_port{0};
    QSet<QString> incoming_capabilities;
    QSet<QString> outgoing_capabilities;

    [[nodiscard]] bool accepts(const QString& packet_type) const {
        return incoming_capabilities.contains(packet_type);
    }
    [[nodiscard]] bool sends(const QString& packet_type) const {
        return outgoing_capabilities.contains(packet_type);
    }

    bool operator==(const Identity&) const = default;
};

/**
 * Target fields added when a TCP client announces itself to a peer it
 * already knows from discovery.
 */
struct IdentityTarget {
    QString device_id;
    int protocol_version{PROTOCOL_VERSION};
};

/// 1-38 characters from [A-Za-z0-9_-].
[[nodiscard]] bool is_valid_device_id(const QString& device_id);

/// Strip characters peers refuse and truncate to MAX_DEVICE_NAME_LENGTH.
[[nodiscard]] QString filter_device_name(const QString& name);

/// Random UUID with '-' replaced by '_'.
[[nodiscard]] QString generate_device_id();

[[nodiscard]] Res<Packet> make_identity_packet(const Identity& identity,
                                               const std::optional<IdentityTarget>& target = std::nullopt);

/**
 * Validate and extract an identity. Rejects wrong packet type, invalid
 * device ids, empty names, protocol versions below MIN_PROTOCOL_VERSION
 * and out-of-range ports.
 */
[[nodiscard]] Res<Identity> parse_identity_packet(const Packet& packet);

/// targetDeviceId/targetProtocolVersion, when the packet carries them.
[[nodiscard]] std::optional<IdentityTarget> identity_target(const Packet& packet);

/**
 * Read the persisted local identity from settings (identity/* keys),
 * creating and storing a fresh device id and default name on first run.
 */
[[nodiscard]] Res<Identity> load_or_create_identity(QSettings& settings);

/// Persist a new display name; the returned identity carries it.
[[nodiscard]] Res<Identity> rename_identity(QSettings& settings, const Identity& identity,
                                            const QString& new_name);

} // namespace konnect
