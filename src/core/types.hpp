#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <string_view>

namespace konnect {

/**
 * Timestamp - milliseconds since the Unix epoch.
 *
 * Used for packet ids, PeerRecord liveness and TrustedDevice.paired_at.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] static constexpr Timestamp from_seconds(int64_t seconds) noexcept {
        return Timestamp(seconds * 1000);
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }
    [[nodiscard]] constexpr int64_t seconds() const noexcept { return millis_ / 1000; }
    [[nodiscard]] constexpr bool is_zero() const noexcept { return millis_ == 0; }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

/**
 * Device class advertised in the identity packet.
 */
enum class DeviceType {
    Desktop,
    Laptop,
    Phone,
    Tablet,
    Tv,
};

[[nodiscard]] constexpr std::string_view device_type_to_string(DeviceType type) noexcept {
    switch (type) {
        case DeviceType::Desktop: return "desktop";
        case DeviceType::Laptop: return "laptop";
        case DeviceType::Phone: return "phone";
        case DeviceType::Tablet: return "tablet";
        case DeviceType::Tv: return "tv";
    }
    return "desktop";
}

// Unknown strings map to Desktop, the same fallback KDE Connect peers use.
[[nodiscard]] constexpr DeviceType device_type_from_string(std::string_view s) noexcept {
    if (s == "laptop") return DeviceType::Laptop;
    if (s == "phone" || s == "smartphone") return DeviceType::Phone;
    if (s == "tablet") return DeviceType::Tablet;
    if (s == "tv") return DeviceType::Tv;
    return DeviceType::Desktop;
}

} // namespace konnect
