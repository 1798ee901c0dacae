#include "core/identity.hpp"

#include <QJsonArray>
#include <QRegularExpression>
#include <QSettings>
#include <QSysInfo>
#include <QUuid>

#include <algorithm>
#include <limits>

namespace konnect {

namespace {

const QString kIdKey = QStringLiteral("identity/device_id");
const QString kNameKey = QStringLiteral("identity/device_name");
const QString kTypeKey = QStringLiteral("identity/device_type");

QJsonArray sorted_array(const QSet<QString>& values) {
    QStringList list(values.begin(), values.end());
    std::sort(list.begin(), list.end());
    return QJsonArray::fromStringList(list);
}

QSet<QString> to_set(const QStringList& list) {
    return QSet<QString>(list.begin(), list.end());
}

QString type_string(DeviceType type) {
    const auto sv = device_type_to_string(type);
    return QString::fromLatin1(sv.data(), static_cast<qsizetype>(sv.size()));
}

Res<void> sync_settings(QSettings& settings) {
    settings.sync();
    if (settings.status() != QSettings::NoError) {
        return fail(ErrorCode::Config,
                    "could not write settings file " + settings.fileName().toStdString());
    }
    return Res<void>::ok();
}

} // namespace

bool is_valid_device_id(const QString& device_id) {
    static const QRegularExpression pattern(QStringLiteral("^[A-Za-z0-9_-]{1,38}$"));
    return pattern.match(device_id).hasMatch();
}

QString filter_device_name(const QString& name) {
    static const QRegularExpression forbidden(QStringLiteral("[\"',;:.!?()\\[\\]<>]"));
    QString filtered = name;
    filtered.remove(forbidden);
    filtered = filtered.trimmed();
    if (filtered.size() > MAX_DEVICE_NAME_LENGTH) {
        filtered.truncate(MAX_DEVICE_NAME_LENGTH);
        filtered = filtered.trimmed();
    }
    return filtered;
}

QString generate_device_id() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).replace(QLatin1Char('-'),
                                                                     QLatin1Char('_'));
}

Res<Packet> make_identity_packet(const Identity& identity,
                                 const std::optional<IdentityTarget>& target) {
    PacketBuilder builder(packet_type::IDENTITY);
    builder.set(QStringLiteral("deviceId"), identity.device_id)
        .set(QStringLiteral("deviceName"), identity.device_name)
        .set(QStringLiteral("deviceType"), type_string(identity.device_type))
        .set(QStringLiteral("protocolVersion"), identity.protocol_version)
        .set_json(QStringLiteral("incomingCapabilities"), sorted_array(identity.incoming_capabilities))
        .set_json(QStringLiteral("outgoingCapabilities"), sorted_array(identity.outgoing_capabilities));
    if (identity.tcp_port != 0) {
        builder.set(QStringLiteral("tcpPort"), static_cast<int>(identity.tcp_port));
    }
    if (target) {
        builder.set(QStringLiteral("targetDeviceId"), target->device_id)
            .set(QStringLiteral("targetProtocolVersion"), target->protocol_version);
    }
    return builder.build();
}

Res<Identity> parse_identity_packet(const Packet& packet) {
    if (packet.type() != packet_type::IDENTITY) {
        return fail<Identity>(ErrorCode::Codec,
                              "expected identity packet, got " + packet.type().toStdString());
    }

    Identity identity;
    identity.device_id = packet.get_string(QStringLiteral("deviceId"));
    if (!is_valid_device_id(identity.device_id)) {
        return fail<Identity>(ErrorCode::Codec,
                              "invalid deviceId '" + identity.device_id.toStdString() + "'");
    }

    identity.device_name = filter_device_name(packet.get_string(QStringLiteral("deviceName")));
    if (identity.device_name.isEmpty()) {
        return fail<Identity>(ErrorCode::Codec, "empty deviceName");
    }

    identity.device_type = device_type_from_string(
        packet.get_string(QStringLiteral("deviceType")).toStdString());

    const auto version = packet.get_int(QStringLiteral("protocolVersion"), -1);
    if (version < MIN_PROTOCOL_VERSION || version > std::numeric_limits<int>::max()) {
        return fail<Identity>(ErrorCode::Codec,
                              "unsupported protocolVersion " + std::to_string(version));
    }
    identity.protocol_version = static_cast<int>(version);

    const auto port = packet.get_int(QStringLiteral("tcpPort"), 0);
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        return fail<Identity>(ErrorCode::Codec, "tcpPort out of range");
    }
    identity.tcp_port = static_cast<uint16_t>(port);

    identity.incoming_capabilities = to_set(packet.get_string_list(QStringLiteral("incomingCapabilities")));
    identity.outgoing_capabilities = to_set(packet.get_string_list(QStringLiteral("outgoingCapabilities")));
    return Res<Identity>::ok(std::move(identity));
}

std::optional<IdentityTarget> identity_target(const Packet& packet) {
    if (!packet.has(QStringLiteral("targetDeviceId"))) return std::nullopt;
    IdentityTarget target;
    target.device_id = packet.get_string(QStringLiteral("targetDeviceId"));
    target.protocol_version = static_cast<int>(
        packet.get_int(QStringLiteral("targetProtocolVersion"), PROTOCOL_VERSION));
    return target;
}

Res<Identity> load_or_create_identity(QSettings& settings) {
    Identity identity;
    identity.device_id = settings.value(kIdKey).toString();
    bool dirty = false;

    if (identity.device_id.isEmpty()) {
        identity.device_id = generate_device_id();
        settings.setValue(kIdKey, identity.device_id);
        dirty = true;
    } else if (!is_valid_device_id(identity.device_id)) {
        return fail<Identity>(ErrorCode::Config,
                              "stored device id is invalid: " + identity.device_id.toStdString());
    }

    identity.device_name = filter_device_name(settings.value(kNameKey).toString());
    if (identity.device_name.isEmpty()) {
        identity.device_name = filter_device_name(QSysInfo::machineHostName());
        if (identity.device_name.isEmpty()) identity.device_name = QStringLiteral("konnect");
        settings.setValue(kNameKey, identity.device_name);
        dirty = true;
    }

    identity.device_type = device_type_from_string(
        settings.value(kTypeKey, QStringLiteral("desktop")).toString().toStdString());

    if (dirty) {
        auto synced = sync_settings(settings);
        if (synced.is_err()) return Res<Identity>::err(synced.unwrap_err());
    }
    return Res<Identity>::ok(std::move(identity));
}

Res<Identity> rename_identity(QSettings& settings, const Identity& identity,
                              const QString& new_name) {
    const auto filtered = filter_device_name(new_name);
    if (filtered.isEmpty()) {
        return fail<Identity>(ErrorCode::InvalidArgument, "device name is empty after filtering");
    }
    settings.setValue(kNameKey, filtered);
    auto synced = sync_settings(settings);
    if (synced.is_err()) return Res<Identity>::err(synced.unwrap_err());

    Identity renamed = identity;
    renamed.device_name = filtered;
    return Res<Identity>::ok(std::move(renamed));
}

} // namespace konnect
