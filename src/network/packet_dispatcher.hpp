#pragma once

#include "core/packet.hpp"

#include <QMutex>
#include <QSet>
#include <QString>

#include <cstdint>
#include <functional>
#include <map>

namespace konnect::network {

/**
 * PacketDispatcher - packet type -> registered handlers.
 *
 * Handlers are invoked outside the lock, in registration order, so a
 * handler may register or unregister others.
 */
class PacketDispatcher {
public:
    using Handler = std::function<void(const QString& device_id, const Packet& packet)>;
    using HandlerId = uint64_t;

    HandlerId registerHandler(const QString& type, Handler handler);
    bool unregisterHandler(HandlerId id);

    [[nodiscard]] bool handles(const QString& type) const;
    [[nodiscard]] QSet<QString> types() const;

    /// Returns how many handlers saw the packet.
    int dispatch(const QString& device_id, const Packet& packet) const;

private:
    struct Entry {
        QString type;
        Handler handler;
    };

    mutable QMutex mu_;
    std::map<HandlerId, Entry> handlers_;
    HandlerId next_id_ = 1;
};

} // namespace konnect::network
