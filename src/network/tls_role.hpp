#pragma once

#include <QString>

namespace konnect::network {

enum class TlsRole {
    Client,
    Server,
};

/**
 * The peer whose device id sorts lexicographically greater is the TLS
 * server, whichever side opened the TCP connection. Both ends evaluate
 * this on the same two strings, so the results are always complementary.
 * Identical ids never reach here (sessions to self are refused).
 */
[[nodiscard]] inline TlsRole compute_tls_role(const QString& local_device_id,
                                              const QString& peer_device_id) {
    return QString::compare(local_device_id, peer_device_id, Qt::CaseSensitive) > 0
               ? TlsRole::Server
               : TlsRole::Client;
}

[[nodiscard]] inline const char* tls_role_name(TlsRole role) {
    return role == TlsRole::Server ? "server" : "client";
}

} // namespace konnect::network
