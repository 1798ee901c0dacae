#include "core/packet.hpp"
#include "core/types.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <cmath>
#include <limits>

namespace konnect {

namespace {

Error codec_error(const QString& message) {
    return Error{message.toStdString(), ErrorCode::Codec};
}

bool is_representable(const QJsonValue& value) {
    switch (value.type()) {
        case QJsonValue::Undefined:
            return false;
        case QJsonValue::Double:
            return std::isfinite(value.toDouble());
        case QJsonValue::Array: {
            const auto array = value.toArray();
            for (const auto& item : array) {
                if (!is_representable(item)) return false;
            }
            return true;
        }
        case QJsonValue::Object: {
            const auto object = value.toObject();
            for (auto it = object.begin(); it != object.end(); ++it) {
                if (!is_representable(it.value())) return false;
            }
            return true;
        }
        default:
            return true;
    }
}

std::optional<int64_t> integral_value(const QJsonValue& value) {
    if (!value.isDouble()) return std::nullopt;
    const double d = value.toDouble();
    if (!std::isfinite(d) || std::floor(d) != d) return std::nullopt;
    return value.toInteger();
}

} // namespace

// ============================================================================
// Packet
// ============================================================================

QString Packet::get_string(const QString& key, const QString& fallback) const {
    const auto value = body_.value(key);
    return value.isString() ? value.toString() : fallback;
}

bool Packet::get_bool(const QString& key, bool fallback) const {
    const auto value = body_.value(key);
    return value.isBool() ? value.toBool() : fallback;
}

int64_t Packet::get_int(const QString& key, int64_t fallback) const {
    return integral_value(body_.value(key)).value_or(fallback);
}

QStringList Packet::get_string_list(const QString& key) const {
    QStringList out;
    const auto array = body_.value(key).toArray();
    for (const auto& item : array) {
        if (item.isString()) out.append(item.toString());
    }
    return out;
}

std::optional<uint16_t> Packet::payload_port() const {
    if (!payload_transfer_info_) return std::nullopt;
    const auto port = integral_value(payload_transfer_info_->value(QStringLiteral("port")));
    if (!port || *port <= 0 || *port > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(*port);
}

// ============================================================================
// PacketBuilder
// ============================================================================

PacketBuilder::PacketBuilder(QString type) : type_(std::move(type)) {}

PacketBuilder PacketBuilder::from(const Packet& packet) {
    PacketBuilder builder(packet.type());
    builder.body_ = packet.body();
    builder.id_ = packet.id();
    builder.payload_size_ = packet.payload_size();
    builder.payload_transfer_info_ = packet.payload_transfer_info();
    return builder;
}

PacketBuilder& PacketBuilder::set(const QString& key, const QVariant& value) {
    auto json = to_json_value(value);
    if (json.is_err()) {
        if (!error_) {
            error_ = Error{"body field '" + key.toStdString() + "': " + json.unwrap_err().message,
                           ErrorCode::Codec};
        }
        return *this;
    }
    body_.insert(key, json.unwrap());
    return *this;
}

PacketBuilder& PacketBuilder::set_json(const QString& key, const QJsonValue& value) {
    if (!is_representable(value)) {
        if (!error_) {
            error_ = Error{"body field '" + key.toStdString() + "' is not JSON-representable",
                           ErrorCode::Codec};
        }
        return *this;
    }
    body_.insert(key, value);
    return *this;
}

PacketBuilder& PacketBuilder::remove(const QString& key) {
    body_.remove(key);
    return *this;
}

PacketBuilder& PacketBuilder::set_id(int64_t id) {
    id_ = id;
    return *this;
}

PacketBuilder& PacketBuilder::set_payload_size(int64_t size) {
    payload_size_ = size;
    return *this;
}

PacketBuilder& PacketBuilder::set_payload_transfer_info(const QJsonObject& info) {
    payload_transfer_info_ = info;
    return *this;
}

PacketBuilder& PacketBuilder::clear_payload() {
    payload_size_.reset();
    payload_transfer_info_.reset();
    return *this;
}

Res<Packet> PacketBuilder::build() const {
    if (error_) {
        return Res<Packet>::err(*error_);
    }
    if (type_.trimmed().isEmpty()) {
        return Res<Packet>::err(codec_error(QStringLiteral("packet type must not be empty")));
    }
    if (payload_size_ && *payload_size_ < PAYLOAD_SIZE_UNKNOWN) {
        return Res<Packet>::err(codec_error(QStringLiteral("negative payloadSize")));
    }
    if (payload_transfer_info_ && !payload_size_) {
        return Res<Packet>::err(
            codec_error(QStringLiteral("payloadTransferInfo requires payloadSize")));
    }
    if (payload_transfer_info_ && !is_representable(QJsonValue(*payload_transfer_info_))) {
        return Res<Packet>::err(
            codec_error(QStringLiteral("payloadTransferInfo is not JSON-representable")));
    }

    Packet packet;
    packet.id_ = id_.value_or(Timestamp::now().millis());
    packet.type_ = type_;
    packet.body_ = body_;
    packet.payload_size_ = payload_size_;
    packet.payload_transfer_info_ = payload_transfer_info_;
    return Res<Packet>::ok(std::move(packet));
}

// ============================================================================
// Conversion
// ============================================================================

Res<QJsonValue> to_json_value(const QVariant& value) {
    switch (value.typeId()) {
        case QMetaType::UnknownType:
            return fail<QJsonValue>(ErrorCode::Codec, "value is unset");
        case QMetaType::Nullptr:
            return Res<QJsonValue>::ok(QJsonValue(QJsonValue::Null));
        case QMetaType::Bool:
            return Res<QJsonValue>::ok(QJsonValue(value.toBool()));
        case QMetaType::Short:
        case QMetaType::UShort:
        case QMetaType::Int:
        case QMetaType::UInt:
        case QMetaType::Long:
        case QMetaType::LongLong:
            return Res<QJsonValue>::ok(QJsonValue(value.toLongLong()));
        case QMetaType::ULong:
        case QMetaType::ULongLong: {
            const auto v = value.toULongLong();
            if (v > static_cast<qulonglong>(std::numeric_limits<qint64>::max())) {
                return fail<QJsonValue>(ErrorCode::Codec, "integer out of range");
            }
            return Res<QJsonValue>::ok(QJsonValue(static_cast<qint64>(v)));
        }
        case QMetaType::Float:
        case QMetaType::Double: {
            const double d = value.toDouble();
            if (!std::isfinite(d)) {
                return fail<QJsonValue>(ErrorCode::Codec, "non-finite number");
            }
            return Res<QJsonValue>::ok(QJsonValue(d));
        }
        case QMetaType::QString:
            return Res<QJsonValue>::ok(QJsonValue(value.toString()));
        case QMetaType::QStringList:
            return Res<QJsonValue>::ok(QJsonValue(QJsonArray::fromStringList(value.toStringList())));
        case QMetaType::QVariantList: {
            QJsonArray array;
            const auto list = value.toList();
            for (const auto& item : list) {
                auto converted = to_json_value(item);
                if (converted.is_err()) return converted;
                array.append(converted.unwrap());
            }
            return Res<QJsonValue>::ok(QJsonValue(array));
        }
        case QMetaType::QVariantMap:
        case QMetaType::QVariantHash: {
            QJsonObject object;
            const auto map = value.toMap();
            for (auto it = map.cbegin(); it != map.cend(); ++it) {
                auto converted = to_json_value(it.value());
                if (converted.is_err()) return converted;
                object.insert(it.key(), converted.unwrap());
            }
            return Res<QJsonValue>::ok(QJsonValue(object));
        }
        case QMetaType::QJsonValue:
        case QMetaType::QJsonObject:
        case QMetaType::QJsonArray: {
            const auto json = value.toJsonValue();
            if (!is_representable(json)) {
                return fail<QJsonValue>(ErrorCode::Codec, "json value is not representable");
            }
            return Res<QJsonValue>::ok(json);
        }
        default:
            return fail<QJsonValue>(ErrorCode::Codec,
                                    std::string("unsupported value type ") + value.typeName());
    }
}

// ============================================================================
// Codec
// ============================================================================

QByteArray encode_packet(const Packet& packet) {
    QJsonObject root;
    root.insert(QStringLiteral("id"), QJsonValue(static_cast<qint64>(packet.id())));
    root.insert(QStringLiteral("type"), packet.type());
    root.insert(QStringLiteral("body"), packet.body());
    if (packet.payload_size()) {
        root.insert(QStringLiteral("payloadSize"),
                    QJsonValue(static_cast<qint64>(*packet.payload_size())));
    }
    if (packet.payload_transfer_info()) {
        root.insert(QStringLiteral("payloadTransferInfo"), *packet.payload_transfer_info());
    }

    QByteArray out = QJsonDocument(root).toJson(QJsonDocument::Compact);
    out.append('\n');
    return out;
}

Res<Packet> decode_packet(const QByteArray& frame) {
    if (frame.isEmpty()) {
        return Res<Packet>::err(codec_error(QStringLiteral("empty frame")));
    }
    if (!frame.endsWith('\n')) {
        return Res<Packet>::err(codec_error(QStringLiteral("truncated frame: missing line terminator")));
    }

    const QByteArray line = frame.chopped(1);
    if (line.endsWith('\r')) {
        return Res<Packet>::err(codec_error(QStringLiteral("CRLF line terminator")));
    }
    if (line.contains('\n')) {
        return Res<Packet>::err(codec_error(QStringLiteral("frame holds more than one line")));
    }

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(line, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Res<Packet>::err(codec_error(QStringLiteral("malformed json at offset %1: %2")
                                                .arg(parse_error.offset)
                                                .arg(parse_error.errorString())));
    }
    if (!doc.isObject()) {
        return Res<Packet>::err(codec_error(QStringLiteral("frame is not a json object")));
    }
    const auto root = doc.object();

    const auto type = root.value(QStringLiteral("type"));
    if (!type.isString() || type.toString().trimmed().isEmpty()) {
        return Res<Packet>::err(codec_error(QStringLiteral("missing type")));
    }

    // Some peers send the id as a decimal string.
    const auto id_value = root.value(QStringLiteral("id"));
    std::optional<int64_t> id = integral_value(id_value);
    if (!id && id_value.isString()) {
        bool ok = false;
        const auto parsed = id_value.toString().toLongLong(&ok);
        if (ok) id = parsed;
    }
    if (!id) {
        return Res<Packet>::err(codec_error(QStringLiteral("missing or invalid id")));
    }

    const auto body = root.value(QStringLiteral("body"));
    if (!body.isObject()) {
        return Res<Packet>::err(codec_error(QStringLiteral("missing body")));
    }

    Packet packet;
    packet.id_ = *id;
    packet.type_ = type.toString();
    packet.body_ = body.toObject();

    if (root.contains(QStringLiteral("payloadSize"))) {
        const auto size = integral_value(root.value(QStringLiteral("payloadSize")));
        if (!size || *size < PAYLOAD_SIZE_UNKNOWN) {
            return Res<Packet>::err(codec_error(QStringLiteral("invalid payloadSize")));
        }
        packet.payload_size_ = *size;
    }
    if (root.contains(QStringLiteral("payloadTransferInfo"))) {
        const auto info = root.value(QStringLiteral("payloadTransferInfo"));
        if (!info.isObject()) {
            return Res<Packet>::err(codec_error(QStringLiteral("invalid payloadTransferInfo")));
        }
        packet.payload_transfer_info_ = info.toObject();
    }

    return Res<Packet>::ok(std::move(packet));
}

// ============================================================================
// LineBuffer
// ============================================================================

void LineBuffer::append(const QByteArray& bytes) {
    if (overflowed_) return;
    buffer_.append(bytes);

    const auto last_newline = buffer_.lastIndexOf('\n');
    const auto unterminated = buffer_.size() - (last_newline + 1);
    if (unterminated > max_line_length_) {
        overflowed_ = true;
        buffer_.clear();
    }
}

std::optional<QByteArray> LineBuffer::take_line() {
    while (!overflowed_) {
        const auto idx = buffer_.indexOf('\n');
        if (idx < 0) return std::nullopt;
        // A whole line can arrive in one read; the limit applies to it too.
        if (idx > max_line_length_) {
            overflowed_ = true;
            buffer_.clear();
            return std::nullopt;
        }

        QByteArray line = buffer_.left(idx + 1);
        buffer_.remove(0, idx + 1);
        if (line.trimmed().isEmpty()) continue;
        return line;
    }
    return std::nullopt;
}

void LineBuffer::clear() {
    buffer_.clear();
    overflowed_ = false;
}

} // namespace konnect
