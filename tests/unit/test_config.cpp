#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"
#include "test_support.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace konnect;
using konnect::test::EnvVarGuard;

TEST_CASE("Config: defaults", "[config]") {
    Config config;
    REQUIRE(config.discovery_port == 1716);
    REQUIRE(config.tcp_port_min == 1716);
    REQUIRE(config.tcp_port_max == 1764);
    REQUIRE(config.liveness_timeout == std::chrono::seconds(60));
    REQUIRE(config.pairing_timeout == std::chrono::seconds(30));
    REQUIRE(config.pair_timestamp_skew == std::chrono::seconds(1800));
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Config: validation", "[config]") {
    Config config;

    SECTION("Empty port range") {
        config.tcp_port_min = 1800;
        config.tcp_port_max = 1700;
        REQUIRE(config.validate().unwrap_err().code == ErrorCode::Config);
    }

    SECTION("Liveness must outlast the broadcast interval") {
        config.liveness_timeout = std::chrono::milliseconds(1000);
        config.broadcast_interval = std::chrono::milliseconds(5000);
        REQUIRE(config.validate().is_err());
    }

    SECTION("Timeouts must be positive") {
        config.pairing_timeout = std::chrono::milliseconds(0);
        REQUIRE(config.validate().is_err());
    }

    SECTION("Ephemeral ports are allowed") {
        config.tcp_port_min = 0;
        config.tcp_port_max = 0;
        REQUIRE(config.validate().is_ok());
    }
}

TEST_CASE("Config: load from settings", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath("konnectd.ini"), QSettings::IniFormat);

    SECTION("Missing keys keep defaults") {
        auto config = load_config(settings);
        REQUIRE(config.is_ok());
        REQUIRE(config.unwrap().tcp_port_min == 1716);
        REQUIRE(config.unwrap().discovery_enabled);
    }

    SECTION("Keys override defaults") {
        settings.setValue("discovery/port", 1816);
        settings.setValue("discovery/enabled", false);
        settings.setValue("discovery/custom_hosts", QStringList{"192.168.1.20", "10.0.0.5"});
        settings.setValue("transport/port_min", 1800);
        settings.setValue("transport/port_max", 1810);
        settings.setValue("pairing/timeout_ms", 5000);
        settings.setValue("pairing/timestamp_skew_s", 60);
        settings.setValue("plugins/incoming", QStringList{"kdeconnect.ping"});

        auto loaded = load_config(settings);
        REQUIRE(loaded.is_ok());
        const auto& config = loaded.unwrap();
        REQUIRE(config.discovery_port == 1816);
        REQUIRE_FALSE(config.discovery_enabled);
        REQUIRE(config.custom_hosts.size() == 2);
        REQUIRE(config.tcp_port_min == 1800);
        REQUIRE(config.tcp_port_max == 1810);
        REQUIRE(config.pairing_timeout == std::chrono::milliseconds(5000));
        REQUIRE(config.pair_timestamp_skew == std::chrono::seconds(60));
        REQUIRE(config.incoming_capabilities.contains("kdeconnect.ping"));
    }

    SECTION("Non-numeric value") {
        settings.setValue("pairing/timeout_ms", "soon");
        auto loaded = load_config(settings);
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.unwrap_err().code == ErrorCode::Config);
    }

    SECTION("Port out of range") {
        settings.setValue("discovery/port", 70000);
        REQUIRE(load_config(settings).is_err());
    }

    SECTION("Durations beyond a day are refused") {
        settings.setValue("discovery/reconnect_delay_ms", QStringLiteral("3000000000"));
        auto loaded = load_config(settings);
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.unwrap_err().code == ErrorCode::Config);
    }

    SECTION("Negative durations are refused") {
        settings.setValue("transport/handshake_timeout_ms", -5);
        REQUIRE(load_config(settings).is_err());
    }

    SECTION("A day is the longest accepted duration") {
        settings.setValue("pairing/timeout_ms", QStringLiteral("86400000"));
        auto loaded = load_config(settings);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.unwrap().pairing_timeout == MAX_CONFIG_DURATION);
    }
}

TEST_CASE("Config: environment overrides", "[config]") {
    EnvVarGuard disable("KONNECT_DISABLE_DISCOVERY");
    EnvVarGuard port("KONNECT_DISCOVERY_PORT");
    EnvVarGuard pairing("KONNECT_PAIRING_TIMEOUT_MS");
    EnvVarGuard hosts("KONNECT_CUSTOM_HOSTS");
    EnvVarGuard data("KONNECT_DATA_DIR");

    Config config;

    SECTION("Values are applied") {
        qputenv("KONNECT_DISABLE_DISCOVERY", "1");
        qputenv("KONNECT_DISCOVERY_PORT", "1900");
        qputenv("KONNECT_PAIRING_TIMEOUT_MS", "2500");
        qputenv("KONNECT_CUSTOM_HOSTS", "10.0.0.1,,10.0.0.2");
        qputenv("KONNECT_DATA_DIR", "/tmp/konnect-data");

        REQUIRE(apply_environment(config).is_ok());
        REQUIRE_FALSE(config.discovery_enabled);
        REQUIRE(config.discovery_port == 1900);
        REQUIRE(config.pairing_timeout == std::chrono::milliseconds(2500));
        REQUIRE(config.custom_hosts == QStringList{"10.0.0.1", "10.0.0.2"});
        REQUIRE(config.data_dir == "/tmp/konnect-data");
    }

    SECTION("Garbage is refused") {
        qputenv("KONNECT_DISCOVERY_PORT", "udp");
        auto applied = apply_environment(config);
        REQUIRE(applied.is_err());
        REQUIRE(applied.unwrap_err().code == ErrorCode::Config);
    }

    SECTION("A timeout that would overflow a timer is refused") {
        qputenv("KONNECT_PAIRING_TIMEOUT_MS", "9999999999");
        auto applied = apply_environment(config);
        REQUIRE(applied.is_err());
        REQUIRE(applied.unwrap_err().code == ErrorCode::Config);
        REQUIRE(config.pairing_timeout == std::chrono::seconds(30));
    }
}

TEST_CASE("Config: validation bounds durations", "[config]") {
    Config config;
    config.handshake_timeout = std::chrono::hours(25);
    REQUIRE(config.validate().unwrap_err().code == ErrorCode::Config);
}
