#pragma once

#include "core/identity.hpp"
#include "core/result.hpp"

#include <QByteArray>

namespace konnect::network {

// UDP discovery message helpers used by DiscoveryEngine.
// Kept separate so encode/decode can be tested without sockets.

/// One identity packet followed by '\n'. The identity must carry a tcpPort.
[[nodiscard]] Res<QByteArray> encode_discovery_datagram(const Identity& local);

/**
 * Decode an announcement. Oversized datagrams, packets that are not
 * identities and identities without a tcpPort are refused.
 */
[[nodiscard]] Res<Identity> decode_discovery_datagram(const QByteArray& datagram,
                                                      qsizetype max_size = MAX_IDENTITY_PACKET_SIZE);

} // namespace konnect::network
