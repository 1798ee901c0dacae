#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QVariant>

#include <cstdint>
#include <optional>

namespace konnect {

namespace packet_type {
inline const QString IDENTITY = QStringLiteral("kdeconnect.identity");
inline const QString PAIR = QStringLiteral("kdeconnect.pair");
} // namespace packet_type

/// Largest line accepted before the TLS upgrade, and largest UDP identity.
inline constexpr qsizetype MAX_IDENTITY_PACKET_SIZE = 512 * 1024;

/// payloadSize value meaning "stream of unknown length".
inline constexpr int64_t PAYLOAD_SIZE_UNKNOWN = -1;

/**
 * Packet - one wire message.
 *
 * Immutable; instances come only from PacketBuilder::build() or
 * decode_packet(), so every Packet in memory has a non-blank type and a
 * JSON-representable body.
 */
class Packet {
public:
    [[nodiscard]] int64_t id() const noexcept { return id_; }
    [[nodiscard]] const QString& type() const noexcept { return type_; }
    [[nodiscard]] const QJsonObject& body() const noexcept { return body_; }
    [[nodiscard]] const std::optional<int64_t>& payload_size() const noexcept { return payload_size_; }
    [[nodiscard]] const std::optional<QJsonObject>& payload_transfer_info() const noexcept {
        return payload_transfer_info_;
    }

    [[nodiscard]] bool has(const QString& key) const { return body_.contains(key); }
    [[nodiscard]] QString get_string(const QString& key, const QString& fallback = {}) const;
    [[nodiscard]] bool get_bool(const QString& key, bool fallback = false) const;
    [[nodiscard]] int64_t get_int(const QString& key, int64_t fallback = 0) const;
    [[nodiscard]] QStringList get_string_list(const QString& key) const;

    /// True when the packet announces a payload on the side channel.
    [[nodiscard]] bool has_payload() const noexcept {
        return payload_size_.has_value() && payload_transfer_info_.has_value();
    }

    /// Port from payloadTransferInfo, if present and in range.
    [[nodiscard]] std::optional<uint16_t> payload_port() const;

    bool operator==(const Packet&) const = default;

private:
    friend class PacketBuilder;
    friend Res<Packet> decode_packet(const QByteArray& frame);

    Packet() = default;

    int64_t id_{0};
    QString type_;
    QJsonObject body_;
    std::optional<int64_t> payload_size_;
    std::optional<QJsonObject> payload_transfer_info_;
};

/**
 * PacketBuilder - accumulates fields, validates, and finalizes once.
 *
 * Invalid values are recorded on the builder and reported by build(), so a
 * chain of set() calls never needs intermediate checks.
 */
class PacketBuilder {
public:
    explicit PacketBuilder(QString type);

    /// Start from an existing packet (same id, type, body and payload fields).
    [[nodiscard]] static PacketBuilder from(const Packet& packet);

    PacketBuilder& set(const QString& key, const QVariant& value);
    PacketBuilder& set(const QString& key, const char* value) {
        return set_json(key, QJsonValue(QString::fromUtf8(value)));
    }
    PacketBuilder& set_json(const QString& key, const QJsonValue& value);
    PacketBuilder& remove(const QString& key);
    PacketBuilder& set_id(int64_t id);
    PacketBuilder& set_payload_size(int64_t size);
    PacketBuilder& set_payload_transfer_info(const QJsonObject& info);
    PacketBuilder& clear_payload();

    /**
     * Validate and produce the packet. Errors carry ErrorCode::Codec.
     * The id defaults to the current time in milliseconds.
     */
    [[nodiscard]] Res<Packet> build() const;

private:
    QString type_;
    QJsonObject body_;
    std::optional<int64_t> id_;
    std::optional<int64_t> payload_size_;
    std::optional<QJsonObject> payload_transfer_info_;
    std::optional<Error> error_;
};

/**
 * Convert a QVariant into a JSON value, rejecting anything that has no
 * faithful JSON form (binary data, NaN/infinity, unknown types).
 */
[[nodiscard]] Res<QJsonValue> to_json_value(const QVariant& value);

/**
 * Serialize a packet: compact UTF-8 JSON followed by exactly one '\n'.
 */
[[nodiscard]] QByteArray encode_packet(const Packet& packet);

/**
 * Parse one frame. The frame must be a single JSON object terminated by a
 * single '\n'. Every failure is an ErrorCode::Codec error; no default
 * packet is ever returned.
 */
[[nodiscard]] Res<Packet> decode_packet(const QByteArray& frame);

/**
 * LineBuffer - incremental framer for a byte stream.
 *
 * Bytes are appended as they arrive; take_line() returns each complete
 * line including its terminator. Blank lines are skipped. A line longer
 * than max_line_length bytes, terminated or not, marks the buffer
 * overflowed; it then drops what it holds and stops accepting data.
 */
class LineBuffer {
public:
    explicit LineBuffer(qsizetype max_line_length = MAX_IDENTITY_PACKET_SIZE)
        : max_line_length_(max_line_length) {}

    void append(const QByteArray& bytes);
    [[nodiscard]] std::optional<QByteArray> take_line();

    [[nodiscard]] bool overflowed() const noexcept { return overflowed_; }
    [[nodiscard]] qsizetype pending() const noexcept { return buffer_.size(); }
    void set_max_line_length(qsizetype length) noexcept { max_line_length_ = length; }
    void clear();

private:
    QByteArray buffer_;
    qsizetype max_line_length_;
    bool overflowed_ = false;
};

} // namespace konnect
