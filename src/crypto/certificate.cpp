#include "crypto/certificate.hpp"
#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QSaveFile>

#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <sodium.h>

#include <array>
#include <memory>

namespace konnect::crypto {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct X509Deleter {
    void operator()(X509* p) const { X509_free(p); }
};
struct BioDeleter {
    void operator()(BIO* p) const { BIO_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

constexpr long kOneYearSeconds = 365L * 24 * 60 * 60;
constexpr long kSerialNumber = 10;

template<typename T = void>
Res<T> openssl_error(const std::string& what) {
    const unsigned long code = ERR_get_error();
    std::array<char, 256> buf{};
    if (code != 0) {
        ERR_error_string_n(code, buf.data(), buf.size());
    }
    ERR_clear_error();
    return fail<T>(ErrorCode::Crypto, what + (code != 0 ? std::string(": ") + buf.data() : ""),
                   static_cast<int>(code & 0x7fffffff));
}

Res<PkeyPtr> generate_ec_key() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
    if (!ctx) return openssl_error<PkeyPtr>("EVP_PKEY_CTX_new_id failed");
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return openssl_error<PkeyPtr>("EVP_PKEY_keygen_init failed");
    }
    if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0) {
        return openssl_error<PkeyPtr>("setting curve P-256 failed");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0 || !raw) {
        return openssl_error<PkeyPtr>("EVP_PKEY_keygen failed");
    }
    return Res<PkeyPtr>::ok(PkeyPtr(raw));
}

bool add_name_entry(X509_NAME* name, const char* field, const QByteArray& value) {
    return X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                      reinterpret_cast<const unsigned char*>(value.constData()),
                                      static_cast<int>(value.size()), -1, 0) == 1;
}

QByteArray bio_contents(BIO* bio) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) return {};
    return QByteArray(data, static_cast<qsizetype>(len));
}

bool ensure_sodium() {
    static const bool ready = sodium_init() >= 0;
    return ready;
}

QByteArray sha256(const QByteArray& data) {
    QByteArray out(crypto_hash_sha256_BYTES, '\0');
    crypto_hash_sha256(reinterpret_cast<unsigned char*>(out.data()),
                       reinterpret_cast<const unsigned char*>(data.constData()),
                       static_cast<unsigned long long>(data.size()));
    return out;
}

Res<void> write_file(const QString& path, const QByteArray& contents, bool owner_only) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(ErrorCode::Storage, "cannot write " + path.toStdString() + ": " +
                                            file.errorString().toStdString());
    }
    if (owner_only) {
        file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    }
    if (file.write(contents) != contents.size() || !file.commit()) {
        return fail(ErrorCode::Storage, "cannot commit " + path.toStdString() + ": " +
                                            file.errorString().toStdString());
    }
    return Res<void>::ok();
}

// Reason the stored pair is unusable, or an empty string when it is fine.
QString validate_loaded(const LocalCertificate& loaded, const QString& device_id) {
    if (loaded.is_null()) return QStringLiteral("unreadable");
    if (common_name(loaded.certificate) != device_id) return QStringLiteral("issued for another device id");
    const auto now = QDateTime::currentDateTimeUtc();
    if (loaded.certificate.expiryDate() <= now) return QStringLiteral("expired");
    if (loaded.certificate.effectiveDate() > now) return QStringLiteral("not yet valid");
    return {};
}

} // namespace

Res<LocalCertificate> generate_certificate(const QString& device_id) {
    if (device_id.isEmpty()) {
        return fail<LocalCertificate>(ErrorCode::InvalidArgument, "device id is empty");
    }

    auto key_result = generate_ec_key();
    if (key_result.is_err()) return Res<LocalCertificate>::err(key_result.unwrap_err());
    PkeyPtr key = std::move(key_result).unwrap();

    X509Ptr cert(X509_new());
    if (!cert) return openssl_error<LocalCertificate>("X509_new failed");

    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), kSerialNumber);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -kOneYearSeconds);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 10 * kOneYearSeconds);
    if (X509_set_pubkey(cert.get(), key.get()) != 1) {
        return openssl_error<LocalCertificate>("X509_set_pubkey failed");
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    if (!add_name_entry(name, "O", QByteArrayLiteral("KDE")) ||
        !add_name_entry(name, "OU", QByteArrayLiteral("KDE Connect")) ||
        !add_name_entry(name, "CN", device_id.toUtf8())) {
        return openssl_error<LocalCertificate>("building subject name failed");
    }
    if (X509_set_issuer_name(cert.get(), name) != 1) {
        return openssl_error<LocalCertificate>("X509_set_issuer_name failed");
    }
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
        return openssl_error<LocalCertificate>("X509_sign failed");
    }

    BioPtr cert_bio(BIO_new(BIO_s_mem()));
    BioPtr key_bio(BIO_new(BIO_s_mem()));
    if (!cert_bio || !key_bio) return openssl_error<LocalCertificate>("BIO_new failed");
    if (PEM_write_bio_X509(cert_bio.get(), cert.get()) != 1) {
        return openssl_error<LocalCertificate>("PEM_write_bio_X509 failed");
    }
    if (PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return openssl_error<LocalCertificate>("PEM_write_bio_PrivateKey failed");
    }

    LocalCertificate out;
    out.certificate = QSslCertificate(bio_contents(cert_bio.get()), QSsl::Pem);
    out.private_key = QSslKey(bio_contents(key_bio.get()), QSsl::Ec, QSsl::Pem, QSsl::PrivateKey);
    if (out.is_null()) {
        return fail<LocalCertificate>(ErrorCode::Crypto, "Qt could not load the generated certificate");
    }
    return Res<LocalCertificate>::ok(std::move(out));
}

Res<LocalCertificate> load_or_create_certificate(const QString& dir, const QString& device_id) {
    QDir directory(dir);
    if (!directory.mkpath(QStringLiteral("."))) {
        return fail<LocalCertificate>(ErrorCode::Storage, "cannot create " + dir.toStdString());
    }
    const auto cert_path = directory.filePath(QString::fromLatin1(CERTIFICATE_FILE));
    const auto key_path = directory.filePath(QString::fromLatin1(PRIVATE_KEY_FILE));

    QString reason = QStringLiteral("missing");
    QFile cert_file(cert_path);
    QFile key_file(key_path);
    if (cert_file.exists() && key_file.exists()) {
        if (cert_file.open(QIODevice::ReadOnly) && key_file.open(QIODevice::ReadOnly)) {
            LocalCertificate loaded;
            loaded.certificate = QSslCertificate(cert_file.readAll(), QSsl::Pem);
            loaded.private_key = QSslKey(key_file.readAll(), QSsl::Ec, QSsl::Pem, QSsl::PrivateKey);
            reason = validate_loaded(loaded, device_id);
            if (reason.isEmpty()) {
                return Res<LocalCertificate>::ok(std::move(loaded));
            }
        } else {
            reason = QStringLiteral("unreadable");
        }
    }

    qCWarning(konnectTrustLog).noquote() << "generating new certificate for" << device_id
                                         << "(stored one is" << reason << ")";
    auto generated = generate_certificate(device_id);
    if (generated.is_err()) return generated;

    const auto& local = generated.unwrap();
    auto wrote_key = write_file(key_path, local.private_key.toPem(), true);
    if (wrote_key.is_err()) return Res<LocalCertificate>::err(wrote_key.unwrap_err());
    auto wrote_cert = write_file(cert_path, local.certificate.toPem(), false);
    if (wrote_cert.is_err()) return Res<LocalCertificate>::err(wrote_cert.unwrap_err());
    return generated;
}

QString common_name(const QSslCertificate& certificate) {
    const auto names = certificate.subjectInfo(QSslCertificate::CommonName);
    return names.isEmpty() ? QString{} : names.first();
}

QString fingerprint(const QByteArray& der) {
    if (!ensure_sodium()) return {};
    return QString::fromLatin1(sha256(der).toHex(':').toUpper());
}

QString fingerprint(const QSslCertificate& certificate) {
    return fingerprint(certificate.toDer());
}

bool same_certificate(const QByteArray& a_der, const QByteArray& b_der) {
    if (a_der.size() != b_der.size() || a_der.isEmpty()) return false;
    if (!ensure_sodium()) return a_der == b_der;
    return sodium_memcmp(a_der.constData(), b_der.constData(),
                         static_cast<size_t>(a_der.size())) == 0;
}

QString verification_key(const QSslCertificate& local,
                         const QSslCertificate& peer,
                         int64_t timestamp_seconds) {
    if (!ensure_sodium()) return {};
    QByteArray a = local.publicKey().toDer();
    QByteArray b = peer.publicKey().toDer();
    if (a < b) std::swap(a, b);

    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    const QByteArray ts = QByteArray::number(static_cast<qlonglong>(timestamp_seconds));
    const auto update = [&state](const QByteArray& part) {
        crypto_hash_sha256_update(&state, reinterpret_cast<const unsigned char*>(part.constData()),
                                  static_cast<unsigned long long>(part.size()));
    };
    update(a);
    update(b);
    update(ts);
    std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256_final(&state, digest.data());

    const QByteArray raw(reinterpret_cast<const char*>(digest.data()), static_cast<qsizetype>(digest.size()));
    return QString::fromLatin1(raw.toHex().left(8).toUpper());
}

} // namespace konnect::crypto
