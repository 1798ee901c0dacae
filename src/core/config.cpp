#include "core/config.hpp"

#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

namespace konnect {

namespace {

Res<int64_t> read_int(QSettings& settings, const QString& key, int64_t fallback) {
    if (!settings.contains(key)) return Res<int64_t>::ok(fallback);
    bool ok = false;
    const auto value = settings.value(key).toLongLong(&ok);
    if (!ok) {
        return fail<int64_t>(ErrorCode::Config, "setting " + key.toStdString() + " is not a number");
    }
    return Res<int64_t>::ok(value);
}

Res<int64_t> read_env_int(const char* name, int64_t fallback) {
    if (!qEnvironmentVariableIsSet(name)) return Res<int64_t>::ok(fallback);
    bool ok = false;
    const auto value = qEnvironmentVariable(name).toLongLong(&ok);
    if (!ok) {
        return fail<int64_t>(ErrorCode::Config, std::string(name) + " is not a number");
    }
    return Res<int64_t>::ok(value);
}

Res<uint16_t> to_port(int64_t value, const std::string& what) {
    if (value <= 0 || value > 65535) {
        return fail<uint16_t>(ErrorCode::Config, what + " out of range: " + std::to_string(value));
    }
    return Res<uint16_t>::ok(static_cast<uint16_t>(value));
}

Res<std::chrono::milliseconds> to_duration(int64_t value, const std::string& what) {
    const std::chrono::milliseconds limit = MAX_CONFIG_DURATION;
    if (value < 0 || value > limit.count()) {
        return fail<std::chrono::milliseconds>(ErrorCode::Config,
                                               what + " out of range: " + std::to_string(value) + " ms");
    }
    return Res<std::chrono::milliseconds>::ok(std::chrono::milliseconds(value));
}

QSet<QString> to_set(const QStringList& list) {
    return QSet<QString>(list.begin(), list.end());
}

} // namespace

Res<void> Config::validate() const {
    if (tcp_port_min > tcp_port_max) {
        return fail(ErrorCode::Config, "transport port range is empty");
    }
    if (payload_port_min > payload_port_max) {
        return fail(ErrorCode::Config, "payload port range is empty");
    }
    if (broadcast_interval.count() <= 0 || prune_interval.count() <= 0) {
        return fail(ErrorCode::Config, "discovery intervals must be positive");
    }
    if (liveness_timeout <= broadcast_interval) {
        return fail(ErrorCode::Config, "liveness timeout must exceed the broadcast interval");
    }
    if (pairing_timeout.count() <= 0 || handshake_timeout.count() <= 0 ||
        payload_accept_timeout.count() <= 0) {
        return fail(ErrorCode::Config, "timeouts must be positive");
    }
    if (max_identity_size <= 0) {
        return fail(ErrorCode::Config, "maximum identity size must be positive");
    }
    for (const auto duration : {broadcast_interval, liveness_timeout, prune_interval, reconnect_delay,
                                connect_rate_limit, handshake_timeout, payload_accept_timeout,
                                pairing_timeout}) {
        if (duration > MAX_CONFIG_DURATION) {
            return fail(ErrorCode::Config, "durations are limited to 24 hours");
        }
    }
    if (pair_timestamp_skew.count() < 0 || pair_timestamp_skew > MAX_CONFIG_DURATION) {
        return fail(ErrorCode::Config, "pairing timestamp skew out of range");
    }
    return Res<void>::ok();
}

Res<Config> load_config(QSettings& settings) {
    Config config;

    struct PortKey {
        const char* key;
        uint16_t* target;
    };
    const PortKey ports[] = {
        {"discovery/port", &config.discovery_port},
        {"transport/port_min", &config.tcp_port_min},
        {"transport/port_max", &config.tcp_port_max},
        {"transport/payload_port_min", &config.payload_port_min},
        {"transport/payload_port_max", &config.payload_port_max},
    };
    for (const auto& entry : ports) {
        auto value = read_int(settings, QString::fromLatin1(entry.key), *entry.target);
        if (value.is_err()) return Res<Config>::err(value.unwrap_err());
        auto port = to_port(value.unwrap(), entry.key);
        if (port.is_err()) return Res<Config>::err(port.unwrap_err());
        *entry.target = port.unwrap();
    }

    struct DurationKey {
        const char* key;
        std::chrono::milliseconds* target;
    };
    const DurationKey durations[] = {
        {"discovery/broadcast_interval_ms", &config.broadcast_interval},
        {"discovery/liveness_timeout_ms", &config.liveness_timeout},
        {"discovery/prune_interval_ms", &config.prune_interval},
        {"discovery/reconnect_delay_ms", &config.reconnect_delay},
        {"transport/connect_rate_limit_ms", &config.connect_rate_limit},
        {"transport/handshake_timeout_ms", &config.handshake_timeout},
        {"transport/payload_accept_timeout_ms", &config.payload_accept_timeout},
        {"pairing/timeout_ms", &config.pairing_timeout},
    };
    for (const auto& entry : durations) {
        auto value = read_int(settings, QString::fromLatin1(entry.key), entry.target->count());
        if (value.is_err()) return Res<Config>::err(value.unwrap_err());
        auto duration = to_duration(value.unwrap(), entry.key);
        if (duration.is_err()) return Res<Config>::err(duration.unwrap_err());
        *entry.target = duration.unwrap();
    }

    auto skew = read_int(settings, QStringLiteral("pairing/timestamp_skew_s"),
                         config.pair_timestamp_skew.count());
    if (skew.is_err()) return Res<Config>::err(skew.unwrap_err());
    const std::chrono::seconds skew_limit = MAX_CONFIG_DURATION;
    if (skew.unwrap() < 0 || skew.unwrap() > skew_limit.count()) {
        return fail<Config>(ErrorCode::Config,
                            "pairing/timestamp_skew_s out of range: " + std::to_string(skew.unwrap()));
    }
    config.pair_timestamp_skew = std::chrono::seconds(skew.unwrap());

    config.discovery_enabled = settings.value(QStringLiteral("discovery/enabled"), true).toBool();
    config.custom_hosts = settings.value(QStringLiteral("discovery/custom_hosts")).toStringList();
    config.data_dir = settings.value(QStringLiteral("storage/data_dir")).toString();
    config.incoming_capabilities =
        to_set(settings.value(QStringLiteral("plugins/incoming")).toStringList());
    config.outgoing_capabilities =
        to_set(settings.value(QStringLiteral("plugins/outgoing")).toStringList());

    auto valid = config.validate();
    if (valid.is_err()) return Res<Config>::err(valid.unwrap_err());
    return Res<Config>::ok(std::move(config));
}

Res<void> apply_environment(Config& config) {
    if (qEnvironmentVariableIsSet("KONNECT_DISABLE_DISCOVERY")) {
        config.discovery_enabled = false;
    }

    auto port = read_env_int("KONNECT_DISCOVERY_PORT", config.discovery_port);
    if (port.is_err()) return Res<void>::err(port.unwrap_err());
    auto checked = to_port(port.unwrap(), "KONNECT_DISCOVERY_PORT");
    if (checked.is_err()) return Res<void>::err(checked.unwrap_err());
    config.discovery_port = checked.unwrap();

    auto pairing = read_env_int("KONNECT_PAIRING_TIMEOUT_MS", config.pairing_timeout.count());
    if (pairing.is_err()) return Res<void>::err(pairing.unwrap_err());
    auto pairing_timeout = to_duration(pairing.unwrap(), "KONNECT_PAIRING_TIMEOUT_MS");
    if (pairing_timeout.is_err()) return Res<void>::err(pairing_timeout.unwrap_err());
    config.pairing_timeout = pairing_timeout.unwrap();

    auto liveness = read_env_int("KONNECT_LIVENESS_TIMEOUT_MS", config.liveness_timeout.count());
    if (liveness.is_err()) return Res<void>::err(liveness.unwrap_err());
    auto liveness_timeout = to_duration(liveness.unwrap(), "KONNECT_LIVENESS_TIMEOUT_MS");
    if (liveness_timeout.is_err()) return Res<void>::err(liveness_timeout.unwrap_err());
    config.liveness_timeout = liveness_timeout.unwrap();

    if (qEnvironmentVariableIsSet("KONNECT_CUSTOM_HOSTS")) {
        config.custom_hosts = qEnvironmentVariable("KONNECT_CUSTOM_HOSTS")
                                  .split(QLatin1Char(','), Qt::SkipEmptyParts);
    }
    if (qEnvironmentVariableIsSet("KONNECT_DATA_DIR")) {
        config.data_dir = qEnvironmentVariable("KONNECT_DATA_DIR");
    }
    return config.validate();
}

QString default_data_dir() {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

} // namespace konnect
