#include <catch2/catch_test_macros.hpp>

#include "network/payload_transfer.hpp"
#include "network/tls.hpp"
#include "test_support.hpp"

#include <QBuffer>

#include <memory>
#include <optional>

using namespace konnect;
using namespace konnect::network;
using konnect::test::makeCertificate;
using konnect::test::spinUntil;

namespace {

QByteArray pattern(qsizetype size) {
    QByteArray data(size, Qt::Uninitialized);
    for (qsizetype i = 0; i < size; ++i) {
        data[i] = static_cast<char>(i * 31 % 251);
    }
    return data;
}

std::unique_ptr<QIODevice> readable(const QByteArray& data) {
    auto buffer = std::make_unique<QBuffer>();
    buffer->setData(data);
    buffer->open(QIODevice::ReadOnly);
    return buffer;
}

PayloadSender::Settings ephemeral() {
    PayloadSender::Settings settings;
    settings.port_min = 0;
    settings.port_max = 0;
    settings.accept_timeout = std::chrono::milliseconds(5000);
    return settings;
}

struct Outcome {
    bool finished = false;
    std::optional<Error> failure;

    [[nodiscard]] bool done() const { return finished || failure.has_value(); }
};

template<typename T>
void track(T& transfer, Outcome& outcome) {
    QObject::connect(&transfer, &T::finished, &transfer, [&outcome] { outcome.finished = true; });
    QObject::connect(&transfer, &T::failed, &transfer,
                     [&outcome](const Error& error) { outcome.failure = error; });
}

} // namespace

TEST_CASE("Payload: transfer between paired certificates", "[payload][integration]") {
    const auto sender_cert = makeCertificate(QStringLiteral("a_9"));
    const auto receiver_cert = makeCertificate(QStringLiteral("b_1"));

    SECTION("Known size") {
        const QByteArray data = pattern(300 * 1024 + 17);
        PayloadSender sender(make_tls_configuration(sender_cert), receiver_cert.certificate.toDer(),
                             readable(data), data.size(), ephemeral());
        auto port = sender.listen();
        if (port.is_err()) {
            SKIP("TCP listen not permitted in this environment");
        }

        QBuffer sink;
        sink.open(QIODevice::WriteOnly);
        PayloadReceiver receiver(make_tls_configuration(receiver_cert), sender_cert.certificate.toDer(),
                                 QHostAddress(QHostAddress::LocalHost), port.unwrap(), data.size(),
                                 &sink, std::chrono::milliseconds(5000));

        Outcome sent;
        Outcome received;
        track(sender, sent);
        track(receiver, received);
        qint64 last_progress = 0;
        QObject::connect(&receiver, &PayloadReceiver::progress, &receiver,
                         [&](qint64 done, qint64 total) {
                             REQUIRE(total == data.size());
                             REQUIRE(done >= last_progress);
                             last_progress = done;
                         });

        receiver.start();
        REQUIRE(spinUntil([&] { return sent.done() && received.done(); }, 10000));
        REQUIRE(sent.finished);
        REQUIRE(received.finished);
        REQUIRE(sink.data() == data);
        REQUIRE(receiver.received() == data.size());
        REQUIRE(sender.sent() == data.size());
    }

    SECTION("Unknown size streams until the sender closes") {
        const QByteArray data = pattern(90 * 1024);
        PayloadSender sender(make_tls_configuration(sender_cert), receiver_cert.certificate.toDer(),
                             readable(data), PAYLOAD_SIZE_UNKNOWN, ephemeral());
        auto port = sender.listen();
        if (port.is_err()) {
            SKIP("TCP listen not permitted in this environment");
        }

        QBuffer sink;
        sink.open(QIODevice::WriteOnly);
        PayloadReceiver receiver(make_tls_configuration(receiver_cert), sender_cert.certificate.toDer(),
                                 QHostAddress(QHostAddress::LocalHost), port.unwrap(),
                                 PAYLOAD_SIZE_UNKNOWN, &sink, std::chrono::milliseconds(5000));
        Outcome received;
        track(receiver, received);

        receiver.start();
        REQUIRE(spinUntil([&] { return received.done(); }, 10000));
        REQUIRE(received.finished);
        REQUIRE(sink.data() == data);
    }

    SECTION("An unexpected certificate aborts the transfer") {
        const auto stranger = makeCertificate(QStringLiteral("b_1"));
        const QByteArray data = pattern(1024);
        PayloadSender sender(make_tls_configuration(sender_cert), receiver_cert.certificate.toDer(),
                             readable(data), data.size(), ephemeral());
        auto port = sender.listen();
        if (port.is_err()) {
            SKIP("TCP listen not permitted in this environment");
        }

        QBuffer sink;
        sink.open(QIODevice::WriteOnly);
        PayloadReceiver receiver(make_tls_configuration(stranger), sender_cert.certificate.toDer(),
                                 QHostAddress(QHostAddress::LocalHost), port.unwrap(), data.size(),
                                 &sink, std::chrono::milliseconds(5000));
        Outcome sent;
        Outcome received;
        track(sender, sent);
        track(receiver, received);

        receiver.start();
        REQUIRE(spinUntil([&] { return sent.done() && received.done(); }, 10000));
        REQUIRE(sent.failure.has_value());
        REQUIRE(sent.failure->code == ErrorCode::TrustViolation);
        REQUIRE(received.failure.has_value());
        REQUIRE(sink.data().isEmpty());
    }
}

TEST_CASE("Payload: misuse", "[payload]") {
    const auto cert = makeCertificate(QStringLiteral("a_9"));

    SECTION("Unreadable source") {
        auto closed = std::make_unique<QBuffer>();
        PayloadSender sender(make_tls_configuration(cert), cert.certificate.toDer(),
                             std::move(closed), 10, ephemeral());
        auto port = sender.listen();
        REQUIRE(port.is_err());
        REQUIRE(port.unwrap_err().code == ErrorCode::InvalidArgument);
    }

    SECTION("Unwritable sink") {
        QBuffer sink;
        PayloadReceiver receiver(make_tls_configuration(cert), cert.certificate.toDer(),
                                 QHostAddress(QHostAddress::LocalHost), 1, 10, &sink,
                                 std::chrono::milliseconds(100));
        Outcome received;
        track(receiver, received);
        receiver.start();
        REQUIRE(received.failure.has_value());
        REQUIRE(received.failure->code == ErrorCode::InvalidArgument);
    }

    SECTION("Nobody fetches in time") {
        auto settings = ephemeral();
        settings.accept_timeout = std::chrono::milliseconds(50);
        PayloadSender sender(make_tls_configuration(cert), cert.certificate.toDer(),
                             readable("abc"), 3, settings);
        if (sender.listen().is_err()) {
            SKIP("TCP listen not permitted in this environment");
        }
        Outcome sent;
        track(sender, sent);
        REQUIRE(spinUntil([&] { return sent.done(); }, 2000));
        REQUIRE(sent.failure.has_value());
        REQUIRE(sent.failure->code == ErrorCode::Network);
    }
}
