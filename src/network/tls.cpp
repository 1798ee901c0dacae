#include "network/tls.hpp"

#include <QSslSocket>

namespace konnect::network {

QSslConfiguration make_tls_configuration(const crypto::LocalCertificate& local) {
    QSslConfiguration config = QSslConfiguration::defaultConfiguration();
    config.setLocalCertificate(local.certificate);
    config.setPrivateKey(local.private_key);
    config.setPeerVerifyMode(QSslSocket::QueryPeer);
    config.setProtocol(QSsl::TlsV1_2OrLater);
    return config;
}

QList<QSslError> ignorable_ssl_errors(const QList<QSslError>& errors) {
    QList<QSslError> ignorable;
    for (const auto& error : errors) {
        switch (error.error()) {
            case QSslError::SelfSignedCertificate:
            case QSslError::SelfSignedCertificateInChain:
            case QSslError::CertificateUntrusted:
            case QSslError::HostNameMismatch:
            case QSslError::UnableToGetLocalIssuerCertificate:
            case QSslError::UnableToVerifyFirstCertificate:
            case QSslError::NoPeerCertificate:
                ignorable.append(error);
                break;
            default:
                break;
        }
    }
    return ignorable;
}

} // namespace konnect::network
