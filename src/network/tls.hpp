#pragma once

#include "crypto/certificate.hpp"

#include <QList>
#include <QSslConfiguration>
#include <QSslError>

namespace konnect::network {

/**
 * TLS settings shared by sessions and payload transfers: our certificate
 * and key, TLS 1.2 or later, and QueryPeer so the peer certificate is
 * requested but never validated against a CA. Trust is decided afterwards
 * by comparing the presented certificate with the pinned one.
 */
[[nodiscard]] QSslConfiguration make_tls_configuration(const crypto::LocalCertificate& local);

/// The subset of errors expected from self-signed peers; safe to ignore.
[[nodiscard]] QList<QSslError> ignorable_ssl_errors(const QList<QSslError>& errors);

} // namespace konnect::network
