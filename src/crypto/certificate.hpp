#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QSslCertificate>
#include <QSslKey>
#include <QString>

#include <cstdint>

namespace konnect::crypto {

/**
 * LocalCertificate - this host's self-signed TLS certificate and key.
 *
 * The certificate common name is the device id; peers pin the DER bytes
 * when pairing.
 */
struct LocalCertificate {
    QSslCertificate certificate;
    QSslKey private_key;

    [[nodiscard]] bool is_null() const {
        return certificate.isNull() || private_key.isNull();
    }
};

inline constexpr const char* CERTIFICATE_FILE = "certificate.pem";
inline constexpr const char* PRIVATE_KEY_FILE = "privateKey.pem";

/**
 * Generate an EC P-256 key and a self-signed certificate with
 * CN=<device_id>, O=KDE, OU=KDE Connect, valid from one year ago to ten
 * years ahead.
 */
[[nodiscard]] Res<LocalCertificate> generate_certificate(const QString& device_id);

/**
 * Load certificate.pem/privateKey.pem from dir, regenerating both when they
 * are missing, unreadable, expired or issued for another device id.
 */
[[nodiscard]] Res<LocalCertificate> load_or_create_certificate(const QString& dir,
                                                                const QString& device_id);

[[nodiscard]] QString common_name(const QSslCertificate& certificate);

/// SHA-256 of the DER encoding, upper-case hex bytes separated by ':'.
[[nodiscard]] QString fingerprint(const QByteArray& der);
[[nodiscard]] QString fingerprint(const QSslCertificate& certificate);

/// Constant-time byte comparison of two DER encodings.
[[nodiscard]] bool same_certificate(const QByteArray& a_der, const QByteArray& b_der);

/**
 * Short code both users compare before accepting a pairing: the first
 * eight hex digits of SHA-256(larger public key DER || smaller public key
 * DER || decimal timestamp). Identical on both ends.
 */
[[nodiscard]] QString verification_key(const QSslCertificate& local,
                                       const QSslCertificate& peer,
                                       int64_t timestamp_seconds);

} // namespace konnect::crypto
