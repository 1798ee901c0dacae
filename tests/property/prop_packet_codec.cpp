#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/identity.hpp"
#include "core/packet.hpp"

#include <QJsonObject>

#include <cstdint>
#include <string>
#include <vector>

using namespace konnect;

namespace {

// Printable ASCII plus a few multi-byte code points; JSON escaping of
// quotes, backslashes and control characters is exercised too.
rc::Gen<QString> genText() {
    return rc::gen::map(
        rc::gen::container<std::vector<uint32_t>>(
            rc::gen::oneOf(rc::gen::inRange<uint32_t>(0x01, 0x7F),
                           rc::gen::element<uint32_t>(0x0A, 0x22, 0x5C, 0xE9, 0x4E2D, 0x1F600))),
        [](const std::vector<uint32_t>& chars) {
            std::u32string text;
            for (const uint32_t c : chars) {
                text.push_back(static_cast<char32_t>(c));
            }
            return QString::fromStdU32String(text);
        });
}

rc::Gen<QString> genType() {
    return rc::gen::map(
        rc::gen::nonEmpty(rc::gen::container<std::string>(
            rc::gen::elementOf(std::string("abcdefghijklmnopqrstuvwxyz.")))),
        [](const std::string& suffix) { return QStringLiteral("kdeconnect.") + QString::fromStdString(suffix); });
}

} // namespace

TEST_CASE("Property: decode(encode(p)) == p", "[property][packet]") {
    rc::check("packets survive the wire format unchanged",
        []() {
            const QString type = *genType();
            const int64_t id = *rc::gen::inRange<int64_t>(0, int64_t{1} << 52);
            const auto keys = *rc::gen::container<std::vector<std::string>>(
                rc::gen::nonEmpty(rc::gen::container<std::string>(rc::gen::inRange('a', 'z'))));

            PacketBuilder builder(type);
            builder.set_id(id);
            for (const auto& key : keys) {
                const QString name = QString::fromStdString(key);
                switch (*rc::gen::inRange(0, 4)) {
                    case 0: builder.set_json(name, *genText()); break;
                    case 1: builder.set_json(name, static_cast<qint64>(*rc::gen::inRange<int>(-100000, 100000))); break;
                    case 2: builder.set_json(name, *rc::gen::arbitrary<bool>()); break;
                    default: builder.set_json(name, QJsonValue::Null); break;
                }
            }
            const bool with_payload = *rc::gen::arbitrary<bool>();
            if (with_payload) {
                builder.set_payload_size(*rc::gen::inRange<int64_t>(-1, int64_t{1} << 40));
                builder.set_payload_transfer_info(QJsonObject{{QStringLiteral("port"), *rc::gen::inRange(1739, 1765)}});
            }

            const Packet packet = builder.build().unwrap();
            const QByteArray frame = encode_packet(packet);
            RC_ASSERT(frame.endsWith('\n'));
            RC_ASSERT(frame.count('\n') == 1);

            auto decoded = decode_packet(frame);
            RC_ASSERT(decoded.is_ok());
            RC_ASSERT(decoded.unwrap() == packet);
            RC_ASSERT(decoded.unwrap().has_payload() == with_payload);
        });
}

TEST_CASE("Property: LineBuffer reassembles any chunking", "[property][packet]") {
    rc::check("splitting a stream at arbitrary points yields the same frames",
        []() {
            const auto count = *rc::gen::inRange(1, 6);
            std::vector<QByteArray> frames;
            QByteArray stream;
            for (int i = 0; i < count; ++i) {
                const Packet packet = PacketBuilder(*genType())
                                          .set_json(QStringLiteral("text"), *genText())
                                          .set_id(i)
                                          .build()
                                          .unwrap();
                frames.push_back(encode_packet(packet));
                stream += frames.back();
            }

            LineBuffer buffer;
            std::vector<QByteArray> lines;
            qsizetype offset = 0;
            while (offset < stream.size()) {
                const auto step = *rc::gen::inRange<qsizetype>(1, stream.size() - offset + 1);
                buffer.append(stream.mid(offset, step));
                offset += step;
                while (auto line = buffer.take_line()) {
                    lines.push_back(*line);
                }
            }

            RC_ASSERT(!buffer.overflowed());
            RC_ASSERT(buffer.pending() == 0);
            RC_ASSERT(lines == frames);
        });
}

TEST_CASE("Property: device names are filtered idempotently", "[property][identity]") {
    rc::check("filter(filter(name)) == filter(name)",
        []() {
            const QString name = *genText();
            const QString once = filter_device_name(name);
            RC_ASSERT(filter_device_name(once) == once);
            RC_ASSERT(once.size() <= name.size());
        });
}
