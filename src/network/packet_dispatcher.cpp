#include "network/packet_dispatcher.hpp"

#include <QMutexLocker>

#include <vector>

namespace konnect::network {

PacketDispatcher::HandlerId PacketDispatcher::registerHandler(const QString& type, Handler handler) {
    QMutexLocker lock(&mu_);
    const HandlerId id = next_id_++;
    handlers_.emplace(id, Entry{type, std::move(handler)});
    return id;
}

bool PacketDispatcher::unregisterHandler(HandlerId id) {
    QMutexLocker lock(&mu_);
    return handlers_.erase(id) > 0;
}

bool PacketDispatcher::handles(const QString& type) const {
    QMutexLocker lock(&mu_);
    for (const auto& [id, entry] : handlers_) {
        if (entry.type == type) {
            return true;
        }
    }
    return false;
}

QSet<QString> PacketDispatcher::types() const {
    QMutexLocker lock(&mu_);
    QSet<QString> result;
    for (const auto& [id, entry] : handlers_) {
        result.insert(entry.type);
    }
    return result;
}

int PacketDispatcher::dispatch(const QString& device_id, const Packet& packet) const {
    std::vector<Handler> matching;
    {
        QMutexLocker lock(&mu_);
        for (const auto& [id, entry] : handlers_) {
            if (entry.type == packet.type()) {
                matching.push_back(entry.handler);
            }
        }
    }
    for (const auto& handler : matching) {
        handler(device_id, packet);
    }
    return static_cast<int>(matching.size());
}

} // namespace konnect::network
